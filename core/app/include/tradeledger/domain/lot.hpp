#pragma once

#include "tradeledger/domain/order.hpp"

#include <cstdint>
#include <string>

namespace tradeledger {
namespace domain {

using LotId = std::uint64_t;

// Which exposure a lot backs. Long lots are opened by buys and closed by
// sells; short lots the other way round.
enum class PositionSide {
  Long,
  Short,
};

// -----------------------------------------------------------------------------
// Lot — FIFO cost-basis unit
// -----------------------------------------------------------------------------
//
// @brief  A dated block of acquired quantity at a fixed unit cost.
//
// @details
// Invariant: remaining_quantity + sold_quantity == original_quantity and
// remaining_quantity >= 0. "sold" means closed, for short lots too.
//
// realized_gain and tax_liability accumulate over every consumption that
// touched this lot. Depleted lots are kept by the ledger for reporting.
// -----------------------------------------------------------------------------
struct Lot {
  LotId id{};
  std::string symbol;
  TradingMode mode{TradingMode::Simulated};
  PositionSide side{PositionSide::Long};
  double original_quantity{0.0};
  double remaining_quantity{0.0};
  double unit_cost{0.0};
  Timestamp acquired_at{};
  double sold_quantity{0.0};
  double realized_gain{0.0};
  double tax_liability{0.0};
};

}  // namespace domain
}  // namespace tradeledger
