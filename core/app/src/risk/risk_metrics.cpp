#include "tradeledger/risk/risk_metrics.hpp"
#include "tradeledger/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace tradeledger {

namespace {

constexpr std::size_t kMinObservations = 2;

}  // namespace

// -----------------------------------------------------------------------------
// requireConfidence
// -----------------------------------------------------------------------------
void RiskMetrics::requireConfidence(double confidence) {
  if (!(confidence > 0.0 && confidence < 1.0)) {
    throw ValidationError("confidence",
                          "confidence must lie strictly between 0 and 1");
  }
}

// -----------------------------------------------------------------------------
// mean / standardDeviation
// -----------------------------------------------------------------------------
double RiskMetrics::mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

double RiskMetrics::standardDeviation(const std::vector<double>& values) {
  if (values.size() < kMinObservations) {
    return 0.0;
  }
  const double m = mean(values);
  double sum_sq = 0.0;
  for (double v : values) {
    sum_sq += (v - m) * (v - m);
  }
  return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

// -----------------------------------------------------------------------------
// quantile: linear interpolation between closest ranks
// -----------------------------------------------------------------------------
double RiskMetrics::quantile(std::vector<double> values, double p) {
  if (values.empty()) {
    return 0.0;
  }
  std::sort(values.begin(), values.end());

  p = std::clamp(p, 0.0, 1.0);
  const double h = static_cast<double>(values.size() - 1) * p;
  const auto lo = static_cast<std::size_t>(std::floor(h));
  const std::size_t hi = std::min(lo + 1, values.size() - 1);
  const double frac = h - static_cast<double>(lo);
  return values[lo] + frac * (values[hi] - values[lo]);
}

// -----------------------------------------------------------------------------
// inverseNormalCdf: Acklam's rational approximation (|rel err| < 1.2e-9)
// -----------------------------------------------------------------------------
double RiskMetrics::inverseNormalCdf(double p) {
  if (!(p > 0.0 && p < 1.0)) {
    throw ValidationError("probability",
                          "inverse normal CDF needs p strictly in (0, 1)");
  }

  static constexpr double a[] = {-3.969683028665376e+01, 2.209460984245205e+02,
                                 -2.759285104469687e+02, 1.383577518672690e+02,
                                 -3.066479806614716e+01, 2.506628277459239e+00};
  static constexpr double b[] = {-5.447609879822406e+01, 1.615858368580409e+02,
                                 -1.556989798598866e+02, 6.680131188771972e+01,
                                 -1.328068155288572e+01};
  static constexpr double c[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                                 -2.400758277161838e+00, -2.549732539343734e+00,
                                 4.374664141464968e+00,  2.938163982698783e+00};
  static constexpr double d[] = {7.784695709041462e-03, 3.224671290700398e-01,
                                 2.445134137142996e+00, 3.754408661907416e+00};

  constexpr double p_low = 0.02425;
  constexpr double p_high = 1.0 - p_low;

  if (p < p_low) {
    const double q = std::sqrt(-2.0 * std::log(p));
    return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q +
            c[5]) /
           ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
  }

  if (p <= p_high) {
    const double q = p - 0.5;
    const double r = q * q;
    return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r +
            a[5]) *
           q /
           (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
  }

  const double q = std::sqrt(-2.0 * std::log(1.0 - p));
  return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q +
           c[5]) /
         ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
}

// -----------------------------------------------------------------------------
// historicalVar
// -----------------------------------------------------------------------------
double RiskMetrics::historicalVar(const std::vector<double>& returns,
                                  double confidence) {
  requireConfidence(confidence);
  if (returns.size() < kMinObservations) {
    return 0.0;
  }
  return std::abs(quantile(returns, 1.0 - confidence));
}

// -----------------------------------------------------------------------------
// parametricVar
// -----------------------------------------------------------------------------
double RiskMetrics::parametricVar(const std::vector<double>& returns,
                                  double confidence) {
  requireConfidence(confidence);
  if (returns.size() < kMinObservations) {
    return 0.0;
  }
  const double z = inverseNormalCdf(1.0 - confidence);
  return std::abs(mean(returns) + z * standardDeviation(returns));
}

// -----------------------------------------------------------------------------
// monteCarloVar
// -----------------------------------------------------------------------------
double RiskMetrics::monteCarloVar(const std::vector<double>& returns,
                                  double confidence, std::size_t draws,
                                  std::uint64_t seed) {
  requireConfidence(confidence);
  if (draws < kMinObservations) {
    throw ValidationError("draws", "Monte-Carlo VaR needs at least 2 draws");
  }
  if (returns.size() < kMinObservations) {
    return 0.0;
  }

  const double m = mean(returns);
  const double sd = standardDeviation(returns);
  if (sd <= 0.0) {
    return std::abs(m);
  }

  std::mt19937_64 rng(seed);
  std::normal_distribution<double> dist(m, sd);

  std::vector<double> samples;
  samples.reserve(draws);
  for (std::size_t i = 0; i < draws; ++i) {
    samples.push_back(dist(rng));
  }
  return std::abs(quantile(std::move(samples), 1.0 - confidence));
}

// -----------------------------------------------------------------------------
// expectedShortfall
// -----------------------------------------------------------------------------
double RiskMetrics::expectedShortfall(const std::vector<double>& returns,
                                      double confidence) {
  requireConfidence(confidence);
  if (returns.size() < kMinObservations) {
    return 0.0;
  }

  const double threshold = quantile(returns, 1.0 - confidence);
  double sum = 0.0;
  std::size_t count = 0;
  for (double r : returns) {
    if (r <= threshold) {
      sum += r;
      ++count;
    }
  }
  // The minimum is always <= the interpolated quantile, so count >= 1.
  return std::abs(sum / static_cast<double>(count));
}

// -----------------------------------------------------------------------------
// valueAtRisk: method dispatch
// -----------------------------------------------------------------------------
double RiskMetrics::valueAtRisk(VarMethod method,
                                const std::vector<double>& returns,
                                double confidence, std::size_t draws,
                                std::uint64_t seed) {
  switch (method) {
    case VarMethod::Historical:
      return historicalVar(returns, confidence);
    case VarMethod::Parametric:
      return parametricVar(returns, confidence);
    case VarMethod::MonteCarlo:
      return monteCarloVar(returns, confidence, draws, seed);
  }
  return 0.0;
}

// -----------------------------------------------------------------------------
// returnsFromPrices
// -----------------------------------------------------------------------------
std::vector<double> RiskMetrics::returnsFromPrices(
    const std::vector<double>& prices) {
  std::vector<double> returns;
  if (prices.size() < 2) {
    return returns;
  }
  returns.reserve(prices.size() - 1);
  for (std::size_t i = 1; i < prices.size(); ++i) {
    if (prices[i - 1] <= 0.0) {
      continue;
    }
    returns.push_back(prices[i] / prices[i - 1] - 1.0);
  }
  return returns;
}

// -----------------------------------------------------------------------------
// correlation: Pearson over the tail-aligned overlap
// -----------------------------------------------------------------------------
double RiskMetrics::correlation(const std::vector<double>& a,
                                const std::vector<double>& b) {
  const std::size_t n = std::min(a.size(), b.size());
  if (n < kMinObservations) {
    return 0.0;
  }

  const double* xa = a.data() + (a.size() - n);
  const double* xb = b.data() + (b.size() - n);

  double mean_a = 0.0;
  double mean_b = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    mean_a += xa[i];
    mean_b += xb[i];
  }
  mean_a /= static_cast<double>(n);
  mean_b /= static_cast<double>(n);

  double cov = 0.0;
  double var_a = 0.0;
  double var_b = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double da = xa[i] - mean_a;
    const double db = xb[i] - mean_b;
    cov += da * db;
    var_a += da * da;
    var_b += db * db;
  }

  if (var_a <= 0.0 || var_b <= 0.0) {
    return 0.0;
  }
  return cov / std::sqrt(var_a * var_b);
}

// -----------------------------------------------------------------------------
// scaleToHorizon
// -----------------------------------------------------------------------------
double RiskMetrics::scaleToHorizon(double one_period_var, double periods) {
  if (periods <= 0.0) {
    throw ValidationError("periods", "horizon must be positive");
  }
  return one_period_var * std::sqrt(periods);
}

}  // namespace tradeledger
