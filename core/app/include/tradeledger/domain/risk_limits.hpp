#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — portfolio risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of the parameters RiskGate evaluates before
//         every fill.
//
// @details
// All fractions are relative to portfolio value (cash + signed market value
// of holdings). The RiskGate holds one RiskLimits value behind a
// shared_ptr<const>; replacing the limits swaps the pointer, so a check in
// flight always reads one consistent set.
//
// Window sizes are counted in price observations. With daily bars (the
// default feed) correlation_window is the trailing 30 days.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Max |resulting position value| / portfolio value for one (symbol, mode).
  double max_position_fraction{0.10};

  /// Max gross exposure to one symbol, all modes, / portfolio value.
  double max_concentration_fraction{0.20};

  /// Max loss today (realized + unrealized) / portfolio value.
  double max_daily_loss_fraction{0.02};

  /// Max correlation between the order's symbol and any other holding.
  double max_pairwise_correlation{0.80};

  /// Confidence level used for VaR in the gate and as the default for
  /// computeVar requests.
  double var_confidence{0.95};

  /// Trailing price observations used for correlation.
  std::size_t correlation_window{30};

  /// Trailing price observations used for VaR.
  std::size_t var_lookback{252};

  /// Max symbol VaR / portfolio value. Unset disables the check.
  std::optional<double> max_var_fraction;

  /// Monte-Carlo VaR parameters.
  std::size_t monte_carlo_draws{10000};
  std::uint64_t monte_carlo_seed{42};
};

}  // namespace domain
}  // namespace tradeledger
