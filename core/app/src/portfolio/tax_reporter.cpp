#include "tradeledger/portfolio/tax_reporter.hpp"
#include "tradeledger/time/time_utils.hpp"

namespace tradeledger {

namespace {

void accumulate(domain::TaxTotals& totals, const domain::Lot& lot) {
  ++totals.lots;
  totals.quantity += lot.original_quantity;
  totals.cost_basis += lot.original_quantity * lot.unit_cost;
  totals.sold_quantity += lot.sold_quantity;
  totals.realized_gain += lot.realized_gain;
  totals.tax_liability += lot.tax_liability;
}

}  // namespace

domain::TaxSummary TaxReporter::summarize(const std::vector<domain::Lot>& lots,
                                          const std::string& symbol,
                                          std::optional<int> year) {
  domain::TaxSummary summary;
  summary.symbol = symbol;
  summary.year = year;

  for (const auto& lot : lots) {
    if (!symbol.empty() && lot.symbol != symbol) {
      continue;
    }
    if (year.has_value() && utc_year(lot.acquired_at) != *year) {
      continue;
    }
    accumulate(summary.totals, lot);
    if (symbol.empty()) {
      accumulate(summary.by_symbol[lot.symbol], lot);
    }
  }
  return summary;
}

domain::TaxReport TaxReporter::report(const std::vector<domain::Lot>& lots,
                                      const std::vector<domain::Trade>& trades,
                                      const std::string& symbol, int year) {
  domain::TaxReport report;
  report.summary = summarize(lots, symbol, year);
  report.transaction_tax = report.summary.totals.tax_liability;

  for (const auto& trade : trades) {
    if (!symbol.empty() && trade.symbol != symbol) {
      continue;
    }
    if (utc_year(trade.executed_at) != year) {
      continue;
    }
    ++report.total_trades;
    if (trade.side == domain::Side::Buy) {
      ++report.buy_trades;
    } else {
      ++report.sell_trades;
    }
    report.realized_pnl += trade.realized_pnl;
    report.trade_tax += trade.tax;
  }
  return report;
}

}  // namespace tradeledger
