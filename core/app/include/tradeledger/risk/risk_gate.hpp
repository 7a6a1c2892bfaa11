#pragma once

#include "tradeledger/domain/order.hpp"
#include "tradeledger/domain/portfolio_snapshot.hpp"
#include "tradeledger/domain/risk_decision.hpp"
#include "tradeledger/domain/risk_limits.hpp"
#include "tradeledger/ports/i_market_data_source.hpp"
#include "tradeledger/risk/risk_metrics.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// RiskGate — ordered pre-trade portfolio checks
// -----------------------------------------------------------------------------
//
// @brief  Decides whether an order may add to the portfolio, given a
//         consistent PortfolioSnapshot and the configured RiskLimits.
//
// @details
// Checks run in this order and stop at the first failure:
//
//   1. PositionSize   |existing value + order value| / PV <= max_position
//   2. Concentration  gross symbol exposure (all modes, after the order)
//                     / PV <= max_concentration
//   3. Correlation    corr(order symbol, each other holding) over the
//                     trailing correlation_window <= max_pairwise_correlation
//   4. DailyLoss      max(0, -today's P&L) / PV <= max_daily_loss
//   5. ValueAtRisk    (only when max_var_fraction is set) historical VaR of
//                     the resulting symbol exposure / PV <= max_var_fraction
//
// PV is snapshot.portfolio_value (cash + signed holdings). A non-positive
// PV denies every exposure-adding order.
//
// Orders that do not increase the absolute exposure of their (symbol, mode)
// position (a partial or full close) always pass. Blocking a close would
// keep the portfolio in the state the limits exist to leave.
//
// A value exactly at a limit passes; a value above it fails.
//
// Limits are held as shared_ptr<const RiskLimits>. check() takes one
// pointer copy at entry, so replaceLimits() between or during checks never
// exposes a half-updated configuration.
//
// Thread-safety: check() and valueAtRisk() are const and may run
// concurrently; replaceLimits() may run concurrently with them.
//
// Ownership: owned by TradingEngine; holds a reference to the market data
// source, which must outlive it.
// -----------------------------------------------------------------------------
class RiskGate {
 public:
  RiskGate(domain::RiskLimits limits, const IMarketDataSource& market);

  RiskGate(const RiskGate&) = delete;
  RiskGate& operator=(const RiskGate&) = delete;
  RiskGate(RiskGate&&) = delete;
  RiskGate& operator=(RiskGate&&) = delete;

  // -------------------------------------------------------------------------
  // check(request, reference_price, snapshot)
  // -------------------------------------------------------------------------
  // @param  request          Symbol, side, quantity and mode are read.
  // @param  reference_price  Price used to value the order: the fill price
  //                          at execution time, the best available estimate
  //                          at placement.
  // @param  snapshot         Portfolio state from
  //                          PositionBook::portfolioSnapshot().
  //
  // @return RiskDecision::allow() or a denial naming the failed check.
  // -------------------------------------------------------------------------
  domain::RiskDecision check(const domain::OrderRequest& request,
                             double reference_price,
                             const domain::PortfolioSnapshot& snapshot) const;

  // -------------------------------------------------------------------------
  // valueAtRisk(symbol, method, confidence, snapshot)
  // -------------------------------------------------------------------------
  // @brief  Monetary one-period VaR.
  //
  // @details
  // Non-empty symbol: VaR fraction of the symbol's returns times its gross
  // exposure across modes.
  // Empty symbol: the whole book. Each holding's return series is weighted
  // by its signed market value / gross exposure (series tail-aligned to the
  // shortest one), the combined series' VaR fraction is multiplied by the
  // gross exposure.
  //
  // @throws ValidationError for confidence outside (0, 1).
  // -------------------------------------------------------------------------
  double valueAtRisk(const std::string& symbol, VarMethod method,
                     double confidence,
                     const domain::PortfolioSnapshot& snapshot) const;

  // Expected shortfall counterpart of valueAtRisk() (historical method).
  double expectedShortfall(const std::string& symbol, double confidence,
                           const domain::PortfolioSnapshot& snapshot) const;

  // Swaps the whole configuration. Throws ValidationError (and keeps the
  // old limits) if the new ones are inconsistent.
  void replaceLimits(domain::RiskLimits limits);

  std::shared_ptr<const domain::RiskLimits> limits() const;

  // Throws ValidationError naming the first out-of-range field.
  static void validate(const domain::RiskLimits& limits);

 private:
  // Returns of `symbol` over the trailing `observations` returns.
  std::vector<double> trailingReturns(const std::string& symbol,
                                      std::size_t observations) const;

  // Combined return series (empty symbol) or the symbol's own series, plus
  // the exposure it applies to.
  std::vector<double> exposureReturns(const std::string& symbol,
                                      std::size_t lookback,
                                      const domain::PortfolioSnapshot& snapshot,
                                      double& exposure) const;

  const IMarketDataSource& market_;

  mutable std::mutex limits_mutex_;
  std::shared_ptr<const domain::RiskLimits> limits_;
};

}  // namespace tradeledger
