#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace tradeledger {
namespace domain {

// Sums over a set of lots. cost_basis is original_quantity * unit_cost.
struct TaxTotals {
  std::size_t lots{0};
  double quantity{0.0};
  double cost_basis{0.0};
  double sold_quantity{0.0};
  double realized_gain{0.0};
  double tax_liability{0.0};
};

// -----------------------------------------------------------------------------
// TaxSummary — lot totals for one symbol or the whole book
// -----------------------------------------------------------------------------
//
// @brief  Totals over every lot (open or depleted, both modes) matching the
//         filter.
//
// @details
// An empty symbol means every symbol; by_symbol then breaks the totals down
// per symbol and is left empty otherwise. `year` filters on the UTC year of
// the lot's acquisition.
// -----------------------------------------------------------------------------
struct TaxSummary {
  std::string symbol;
  std::optional<int> year;
  TaxTotals totals;
  std::map<std::string, TaxTotals> by_symbol;
};

// Year-end view: the summary plus the trades executed in that year.
// transaction_tax is the lot tax of lots acquired in the year.
struct TaxReport {
  TaxSummary summary;
  std::size_t total_trades{0};
  std::size_t buy_trades{0};
  std::size_t sell_trades{0};
  double realized_pnl{0.0};
  double transaction_tax{0.0};
  double trade_tax{0.0};
};

}  // namespace domain
}  // namespace tradeledger
