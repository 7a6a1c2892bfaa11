#pragma once

#include "tradeledger/domain/lot.hpp"
#include "tradeledger/domain/tax_summary.hpp"
#include "tradeledger/domain/trade.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// TaxReporter — lot and trade aggregation for tax reporting
// -----------------------------------------------------------------------------
//
// @brief  Pure static functions over copies of lots and trades. Callers take
//         the copies (PositionBook::lots(), OrderLifecycleManager::trades())
//         so no lock is held while aggregating.
//
// @details
// Symbols are compared as given; callers upper-case them first. An empty
// symbol selects every symbol.
// -----------------------------------------------------------------------------
class TaxReporter {
 public:
  TaxReporter() = delete;

  // Totals over the lots matching symbol and, when set, acquired in `year`
  // (UTC). by_symbol is filled only for the all-symbols summary.
  static domain::TaxSummary summarize(const std::vector<domain::Lot>& lots,
                                      const std::string& symbol,
                                      std::optional<int> year);

  // -------------------------------------------------------------------------
  // report(lots, trades, symbol, year)
  // -------------------------------------------------------------------------
  // summarize() for the year, plus counts and realized P&L of the trades
  // executed in that year. transaction_tax sums the lot tax of the year's
  // lots; trade_tax sums the fee-schedule tax charged on its trades.
  // -------------------------------------------------------------------------
  static domain::TaxReport report(const std::vector<domain::Lot>& lots,
                                  const std::vector<domain::Trade>& trades,
                                  const std::string& symbol, int year);
};

}  // namespace tradeledger
