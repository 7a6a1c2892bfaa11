#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tradeledger {

enum class VarMethod {
  Historical,
  Parametric,
  MonteCarlo,
};

// -----------------------------------------------------------------------------
// RiskMetrics — stateless return-series statistics
// -----------------------------------------------------------------------------
//
// @brief  Value-at-Risk, expected shortfall and correlation computed from a
//         series of simple returns. Every member is a pure static function.
//
// @details
// Conventions shared by all VaR / ES functions:
//
//   - `returns` are simple period returns (p[t] / p[t-1] - 1), unsorted.
//   - `confidence` must lie strictly inside (0, 1); anything else throws
//     ValidationError("confidence").
//   - Fewer than 2 observations returns 0. Thin windows are normal at the
//     start of a session and must not fail an order.
//   - The result is a positive fraction of exposure (absolute value of the
//     loss quantile). Multiply by the position's market value to get money.
//
// Quantiles use linear interpolation between closest ranks:
//   h = (n - 1) * p,  Q = x[floor(h)] + (h - floor(h)) * (x[floor(h)+1] - x[floor(h)])
//
// Standard deviation is the population figure (divide by n).
//
// Thread-safety: no state; safe from any thread.
// -----------------------------------------------------------------------------
class RiskMetrics {
 public:
  RiskMetrics() = delete;

  // |(1 - confidence)-quantile| of the empirical distribution.
  static double historicalVar(const std::vector<double>& returns,
                              double confidence);

  // |mean + z(1 - confidence) * stddev| under a normal assumption.
  static double parametricVar(const std::vector<double>& returns,
                              double confidence);

  // -------------------------------------------------------------------------
  // monteCarloVar(returns, confidence, draws, seed)
  // -------------------------------------------------------------------------
  // @brief  Draws `draws` samples from Normal(mean, stddev) of `returns`
  //         and takes the same quantile as historicalVar().
  //
  // @details
  // std::mt19937_64 seeded with `seed`: identical inputs give identical
  // output on one standard library. A zero-variance series degenerates to
  // |mean| without sampling.
  //
  // @throws ValidationError if draws < 2 or confidence is out of range.
  // -------------------------------------------------------------------------
  static double monteCarloVar(const std::vector<double>& returns,
                              double confidence, std::size_t draws,
                              std::uint64_t seed);

  // |mean of the returns at or below the historical VaR threshold|.
  static double expectedShortfall(const std::vector<double>& returns,
                                  double confidence);

  // Dispatches to one of the three VaR functions.
  static double valueAtRisk(VarMethod method,
                            const std::vector<double>& returns,
                            double confidence, std::size_t draws,
                            std::uint64_t seed);

  // Simple returns of consecutive prices. A non-positive previous price
  // breaks the chain: that step is skipped.
  static std::vector<double> returnsFromPrices(const std::vector<double>& prices);

  // -------------------------------------------------------------------------
  // correlation(a, b)
  // -------------------------------------------------------------------------
  // Pearson correlation of the most recent min(a.size(), b.size())
  // observations of each series (tail-aligned). Returns 0 when fewer than 2
  // aligned points exist or either series has zero variance.
  // -------------------------------------------------------------------------
  static double correlation(const std::vector<double>& a,
                            const std::vector<double>& b);

  // Square-root-of-time scaling of a one-period VaR to `periods` periods.
  static double scaleToHorizon(double one_period_var, double periods);

  static double mean(const std::vector<double>& values);

  // Population standard deviation; 0 for fewer than 2 values.
  static double standardDeviation(const std::vector<double>& values);

  // Interpolated quantile of `values` at probability p in [0, 1]. Empty
  // input yields 0.
  static double quantile(std::vector<double> values, double p);

  // Inverse of the standard normal CDF for p in (0, 1).
  static double inverseNormalCdf(double p);

 private:
  static void requireConfidence(double confidence);
};

}  // namespace tradeledger
