#include "tradeledger/risk/risk_gate.hpp"
#include "tradeledger/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace tradeledger {

namespace {

// Absorbs floating-point noise so a value computed to sit exactly on a
// limit (e.g. 100 * 1000 / 1'000'000 vs 0.10) is treated as "at", not
// "over".
constexpr double kLimitTolerance = 1e-12;

constexpr double kQuantityEpsilon = 1e-9;

bool exceeds(double observed, double limit) {
  return observed > limit + kLimitTolerance;
}

std::string describe(const std::string& what, double observed,
                     double limit) {
  std::ostringstream msg;
  msg << what << ": observed=" << observed << " limit=" << limit;
  return msg.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskGate::RiskGate(domain::RiskLimits limits, const IMarketDataSource& market)
    : market_(market) {
  validate(limits);
  limits_ = std::make_shared<const domain::RiskLimits>(std::move(limits));
}

// -----------------------------------------------------------------------------
// validate: fractions in (0, 1], correlation in (0, 1], sane windows
// -----------------------------------------------------------------------------
void RiskGate::validate(const domain::RiskLimits& limits) {
  auto fraction = [](double v, const char* field) {
    if (!(v > 0.0 && v <= 1.0)) {
      throw ValidationError(field, std::string(field) +
                                       " must lie in (0, 1]");
    }
  };

  fraction(limits.max_position_fraction, "max_position_fraction");
  fraction(limits.max_concentration_fraction, "max_concentration_fraction");
  fraction(limits.max_daily_loss_fraction, "max_daily_loss_fraction");
  fraction(limits.max_pairwise_correlation, "max_pairwise_correlation");
  if (limits.max_var_fraction.has_value()) {
    fraction(*limits.max_var_fraction, "max_var_fraction");
  }

  if (!(limits.var_confidence > 0.0 && limits.var_confidence < 1.0)) {
    throw ValidationError("var_confidence",
                          "var_confidence must lie in (0, 1)");
  }
  if (limits.correlation_window < 2) {
    throw ValidationError("correlation_window",
                          "correlation_window must be at least 2");
  }
  if (limits.var_lookback < 2) {
    throw ValidationError("var_lookback", "var_lookback must be at least 2");
  }
  if (limits.monte_carlo_draws < 2) {
    throw ValidationError("monte_carlo_draws",
                          "monte_carlo_draws must be at least 2");
  }
}

// -----------------------------------------------------------------------------
// limits / replaceLimits
// -----------------------------------------------------------------------------
std::shared_ptr<const domain::RiskLimits> RiskGate::limits() const {
  std::lock_guard lock(limits_mutex_);
  return limits_;
}

void RiskGate::replaceLimits(domain::RiskLimits limits) {
  validate(limits);
  auto next = std::make_shared<const domain::RiskLimits>(std::move(limits));
  std::lock_guard lock(limits_mutex_);
  limits_ = std::move(next);
}

// -----------------------------------------------------------------------------
// check: ordered, short-circuiting
// -----------------------------------------------------------------------------
domain::RiskDecision RiskGate::check(
    const domain::OrderRequest& request, double reference_price,
    const domain::PortfolioSnapshot& snapshot) const {
  using domain::RiskCheck;
  using domain::RiskDecision;

  if (reference_price <= 0.0) {
    throw ValidationError("reference_price",
                          "risk check needs a positive reference price");
  }

  const auto limits = this->limits();

  const double signed_qty = (request.side == domain::Side::Buy)
                                ? request.quantity
                                : -request.quantity;
  const domain::Position* existing =
      snapshot.find(request.symbol, request.mode);
  const double existing_qty = existing ? existing->quantity : 0.0;
  const double resulting_qty = existing_qty + signed_qty;

  // Closing orders are always allowed.
  if (std::abs(resulting_qty) <= std::abs(existing_qty) + kQuantityEpsilon) {
    return RiskDecision::allow();
  }

  const double pv = snapshot.portfolio_value;
  const double resulting_value = std::abs(resulting_qty) * reference_price;

  if (pv <= 0.0) {
    return RiskDecision::deny(
        RiskCheck::PositionSize,
        describe("portfolio value is not positive; resulting position value",
                 resulting_value, 0.0),
        resulting_value, 0.0);
  }

  // --- 1. Position size ------------------------------------------------------
  const double position_fraction = resulting_value / pv;
  if (exceeds(position_fraction, limits->max_position_fraction)) {
    return RiskDecision::deny(
        RiskCheck::PositionSize,
        describe("position size limit exceeded for " + request.symbol,
                 position_fraction, limits->max_position_fraction),
        position_fraction, limits->max_position_fraction);
  }

  // --- 2. Concentration (all modes) ------------------------------------------
  double symbol_gross = resulting_value;
  for (const auto& p : snapshot.positions) {
    if (p.symbol == request.symbol && p.mode != request.mode) {
      symbol_gross += std::abs(p.marketValue());
    }
  }
  const double concentration = symbol_gross / pv;
  if (exceeds(concentration, limits->max_concentration_fraction)) {
    return RiskDecision::deny(
        RiskCheck::Concentration,
        describe("concentration limit exceeded for " + request.symbol,
                 concentration, limits->max_concentration_fraction),
        concentration, limits->max_concentration_fraction);
  }

  // --- 3. Correlation with other holdings ------------------------------------
  const auto own_returns =
      trailingReturns(request.symbol, limits->correlation_window);
  if (own_returns.size() >= 2) {
    std::set<std::string> seen;
    for (const auto& p : snapshot.positions) {
      if (p.symbol == request.symbol ||
          std::abs(p.quantity) <= kQuantityEpsilon ||
          !seen.insert(p.symbol).second) {
        continue;
      }
      const auto other = trailingReturns(p.symbol, limits->correlation_window);
      const double corr = RiskMetrics::correlation(own_returns, other);
      if (exceeds(corr, limits->max_pairwise_correlation)) {
        auto d = RiskDecision::deny(
            RiskCheck::Correlation,
            describe("correlation limit exceeded between " + request.symbol +
                         " and " + p.symbol,
                     corr, limits->max_pairwise_correlation),
            corr, limits->max_pairwise_correlation);
        d.related_symbol = p.symbol;
        return d;
      }
    }
  }

  // --- 4. Daily loss -----------------------------------------------------------
  const double loss_fraction = std::max(0.0, -snapshot.daily_pnl) / pv;
  if (exceeds(loss_fraction, limits->max_daily_loss_fraction)) {
    return RiskDecision::deny(
        RiskCheck::DailyLoss,
        describe("daily loss limit exceeded", loss_fraction,
                 limits->max_daily_loss_fraction),
        loss_fraction, limits->max_daily_loss_fraction);
  }

  // --- 5. Value-at-Risk (optional) -------------------------------------------
  if (limits->max_var_fraction.has_value()) {
    const auto returns = trailingReturns(request.symbol, limits->var_lookback);
    const double var_amount =
        RiskMetrics::historicalVar(returns, limits->var_confidence) *
        resulting_value;
    const double var_fraction = var_amount / pv;
    if (exceeds(var_fraction, *limits->max_var_fraction)) {
      return RiskDecision::deny(
          RiskCheck::ValueAtRisk,
          describe("value-at-risk limit exceeded for " + request.symbol,
                   var_fraction, *limits->max_var_fraction),
          var_fraction, *limits->max_var_fraction);
    }
  }

  return RiskDecision::allow();
}

// -----------------------------------------------------------------------------
// valueAtRisk / expectedShortfall
// -----------------------------------------------------------------------------
double RiskGate::valueAtRisk(const std::string& symbol, VarMethod method,
                             double confidence,
                             const domain::PortfolioSnapshot& snapshot) const {
  const auto limits = this->limits();
  double exposure = 0.0;
  const auto returns =
      exposureReturns(symbol, limits->var_lookback, snapshot, exposure);
  const double fraction =
      RiskMetrics::valueAtRisk(method, returns, confidence,
                               limits->monte_carlo_draws,
                               limits->monte_carlo_seed);
  return fraction * exposure;
}

double RiskGate::expectedShortfall(
    const std::string& symbol, double confidence,
    const domain::PortfolioSnapshot& snapshot) const {
  const auto limits = this->limits();
  double exposure = 0.0;
  const auto returns =
      exposureReturns(symbol, limits->var_lookback, snapshot, exposure);
  return RiskMetrics::expectedShortfall(returns, confidence) * exposure;
}

// -----------------------------------------------------------------------------
// trailingReturns: N returns need N + 1 prices
// -----------------------------------------------------------------------------
std::vector<double> RiskGate::trailingReturns(const std::string& symbol,
                                              std::size_t observations) const {
  return RiskMetrics::returnsFromPrices(
      market_.priceHistory(symbol, observations + 1));
}

// -----------------------------------------------------------------------------
// exposureReturns: single symbol, or value-weighted book
// -----------------------------------------------------------------------------
std::vector<double> RiskGate::exposureReturns(
    const std::string& symbol, std::size_t lookback,
    const domain::PortfolioSnapshot& snapshot, double& exposure) const {
  exposure = 0.0;

  if (!symbol.empty()) {
    for (const auto& p : snapshot.positions) {
      if (p.symbol == symbol) {
        exposure += std::abs(p.marketValue());
      }
    }
    return trailingReturns(symbol, lookback);
  }

  // Net signed value per symbol across modes.
  std::map<std::string, double> values;
  for (const auto& p : snapshot.positions) {
    if (std::abs(p.quantity) > kQuantityEpsilon) {
      values[p.symbol] += p.marketValue();
    }
  }

  double gross = 0.0;
  for (const auto& [sym, value] : values) {
    gross += std::abs(value);
  }
  if (gross <= 0.0) {
    return {};
  }

  std::vector<std::pair<double, std::vector<double>>> series;
  std::size_t n = std::numeric_limits<std::size_t>::max();
  for (const auto& [sym, value] : values) {
    auto r = trailingReturns(sym, lookback);
    n = std::min(n, r.size());
    series.emplace_back(value / gross, std::move(r));
  }
  if (n < 2) {
    return {};
  }

  std::vector<double> combined(n, 0.0);
  for (const auto& [weight, r] : series) {
    const std::size_t offset = r.size() - n;
    for (std::size_t t = 0; t < n; ++t) {
      combined[t] += weight * r[offset + t];
    }
  }

  exposure = gross;
  return combined;
}

}  // namespace tradeledger
