#pragma once

#include <string>
#include <utility>

namespace tradeledger {
namespace domain {

// Pre-trade checks in the order RiskGate evaluates them.
enum class RiskCheck {
  None,
  PositionSize,
  Concentration,
  Correlation,
  DailyLoss,
  ValueAtRisk,
};

// -----------------------------------------------------------------------------
// RiskDecision
// -----------------------------------------------------------------------------
//
// @brief  Outcome of RiskGate::check(): allow, or deny with the limit that
//         failed and by how much.
//
// @details
// For a denial:
//   observed — the measured value (a fraction, correlation, or amount)
//   limit    — the configured threshold in the same unit
//   excess   — observed - limit (always > 0)
//   related_symbol — the other holding, for correlation denials
//
// An allowed decision has check == RiskCheck::None and zeroed numbers.
// -----------------------------------------------------------------------------
struct RiskDecision {
  bool allowed{true};
  RiskCheck check{RiskCheck::None};
  std::string reason;
  double observed{0.0};
  double limit{0.0};
  double excess{0.0};
  std::string related_symbol;

  static RiskDecision allow() { return RiskDecision{}; }

  static RiskDecision deny(RiskCheck check, std::string reason,
                           double observed, double limit) {
    RiskDecision d;
    d.allowed = false;
    d.check = check;
    d.reason = std::move(reason);
    d.observed = observed;
    d.limit = limit;
    d.excess = observed - limit;
    return d;
  }
};

}  // namespace domain
}  // namespace tradeledger
