#pragma once

#include "tradeledger/domain/order.hpp"
#include "tradeledger/domain/position.hpp"

#include <string>
#include <vector>

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// PortfolioSnapshot
// -----------------------------------------------------------------------------
//
// @brief  A consistent view of every position plus the derived portfolio
//         figures the RiskGate needs.
//
// @details
// Produced by PositionBook::portfolioSnapshot() while no apply() is in
// flight, so no figure mixes pre- and post-update state.
//
//   portfolio_value = cash + sum(position.marketValue())
//   gross_exposure  = sum(|position.marketValue()|)
//   daily_pnl       = sum(today's realized) + sum(unrealized)
// -----------------------------------------------------------------------------
struct PortfolioSnapshot {
  double cash{0.0};
  double portfolio_value{0.0};
  double gross_exposure{0.0};
  double daily_pnl{0.0};
  std::vector<Position> positions;
  Timestamp as_of{};

  const Position* find(const std::string& symbol, TradingMode mode) const {
    for (const auto& p : positions) {
      if (p.symbol == symbol && p.mode == mode) {
        return &p;
      }
    }
    return nullptr;
  }
};

}  // namespace domain
}  // namespace tradeledger
