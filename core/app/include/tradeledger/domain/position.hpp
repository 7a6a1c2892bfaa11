#pragma once

#include "tradeledger/domain/lot.hpp"
#include "tradeledger/domain/order.hpp"

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// PositionKey
// -----------------------------------------------------------------------------
// A position is identified by (symbol, trading mode): simulated and live
// exposure in the same symbol are independent books.
// -----------------------------------------------------------------------------
struct PositionKey {
  std::string symbol;
  TradingMode mode{TradingMode::Simulated};

  bool operator<(const PositionKey& other) const {
    return std::tie(symbol, mode) < std::tie(other.symbol, other.mode);
  }
  bool operator==(const PositionKey& other) const {
    return symbol == other.symbol && mode == other.mode;
  }
};

// -----------------------------------------------------------------------------
// Position — per-(symbol, mode) trading state
// -----------------------------------------------------------------------------
//
// @brief  Net position, average entry price and P&L for one key.
//
// @details
// Sign convention for quantity:
//   positive → long, negative → short, zero → flat.
//
// average_price is the weighted entry cost of the current exposure. It is
// re-weighted when exposure grows, left alone when exposure shrinks, reset
// to the fill price when the position crosses zero, and 0 when flat.
//
// unrealized_pnl == (current_price - average_price) * quantity. With a
// signed quantity this single formula covers the short side.
//
// realized_pnl is the sum of FIFO lot results, not an average-cost figure.
// daily_realized_pnl accumulates realized P&L for trading day pnl_day
// (days since the epoch) and feeds the daily-loss risk check.
//
// The authoritative copy lives inside PositionBook. Everything else sees
// copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  TradingMode mode{TradingMode::Simulated};
  double quantity{0.0};
  double average_price{0.0};
  double current_price{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double total_pnl{0.0};
  double daily_realized_pnl{0.0};
  std::int64_t pnl_day{0};

  PositionKey key() const { return PositionKey{symbol, mode}; }

  // Price used to value the position: last mark, else entry price.
  double markPrice() const {
    return current_price > 0.0 ? current_price : average_price;
  }

  double marketValue() const { return quantity * markPrice(); }
};

// Position together with the lots backing it.
struct PositionSnapshot {
  Position position;
  std::vector<Lot> lots;
};

}  // namespace domain
}  // namespace tradeledger
