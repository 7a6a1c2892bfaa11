#pragma once

#include "tradeledger/domain/order.hpp"

#include <cstdint>
#include <string>

namespace tradeledger {
namespace domain {

using TradeId = std::uint64_t;

// -----------------------------------------------------------------------------
// Trade — immutable execution record
// -----------------------------------------------------------------------------
//
// @brief  One fill of one order. Partial fills produce one Trade each.
//
// @details
// commission and tax are the fee-schedule charges on the fill notional.
// realized_pnl and lot_tax_liability are filled in from the FIFO lot
// consumption the trade caused (zero for a trade that only opens exposure).
// -----------------------------------------------------------------------------
struct Trade {
  TradeId id{};
  OrderId order_id{};
  std::string symbol;
  TradingMode mode{TradingMode::Simulated};
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  double commission{0.0};
  double tax{0.0};
  double realized_pnl{0.0};
  double lot_tax_liability{0.0};
  Timestamp executed_at{};

  double notional() const { return price * quantity; }
};

}  // namespace domain
}  // namespace tradeledger
