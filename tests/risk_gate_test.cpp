// =============================================================================
// risk_gate_test.cpp
// =============================================================================
// Unit tests for tradeledger::RiskGate.
//
// Validates:
//   - Position size limit, at and just above the boundary
//   - Orders that reduce exposure pass every check
//   - Concentration across trading modes
//   - Correlation against existing holdings (fake price source)
//   - Daily loss limit
//   - Optional VaR limit
//   - Limit validation and the non-positive portfolio value case
// =============================================================================

#include "tradeledger/domain/errors.hpp"
#include "tradeledger/ports/i_market_data_source.hpp"
#include "tradeledger/risk/risk_gate.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dom = tradeledger::domain;
using tradeledger::RiskGate;

namespace {

// Price source backed by fixed series.
class FakeMarket final : public tradeledger::IMarketDataSource {
 public:
  std::map<std::string, std::vector<double>> series;

  std::optional<double> currentPrice(const std::string& symbol) const override {
    auto it = series.find(symbol);
    if (it == series.end() || it->second.empty()) {
      return std::nullopt;
    }
    return it->second.back();
  }

  std::vector<double> priceHistory(const std::string& symbol,
                                   std::size_t max_points) const override {
    auto it = series.find(symbol);
    if (it == series.end()) {
      return {};
    }
    const auto& s = it->second;
    const std::size_t n = std::min(max_points, s.size());
    return std::vector<double>(s.end() - static_cast<std::ptrdiff_t>(n),
                               s.end());
  }
};

}  // namespace

class RiskGateTest : public ::testing::Test {
 protected:
  FakeMarket market;
  dom::RiskLimits limits;

  static dom::OrderRequest buy(const std::string& symbol, double qty) {
    dom::OrderRequest r;
    r.symbol = symbol;
    r.side = dom::Side::Buy;
    r.quantity = qty;
    return r;
  }

  static dom::OrderRequest sell(const std::string& symbol, double qty) {
    auto r = buy(symbol, qty);
    r.side = dom::Side::Sell;
    return r;
  }

  static dom::Position holding(
      const std::string& symbol, double qty, double price,
      dom::TradingMode mode = dom::TradingMode::Simulated) {
    dom::Position p;
    p.symbol = symbol;
    p.mode = mode;
    p.quantity = qty;
    p.average_price = price;
    p.current_price = price;
    return p;
  }

  static dom::PortfolioSnapshot portfolio(double value) {
    dom::PortfolioSnapshot s;
    s.cash = value;
    s.portfolio_value = value;
    return s;
  }
};

// -----------------------------------------------------------------------------
// 1. With 1,000,000 of portfolio value and a 10% limit, 100 @ 1000 sits on
//    the limit and passes; 101 does not.
// Why: The limit is inclusive; floating-point noise must not flip a value
//      that is exactly at the limit into a breach.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, PositionSizeBoundary) {
  RiskGate gate(limits, market);
  const auto snap = portfolio(1'000'000.0);

  EXPECT_TRUE(gate.check(buy("AAPL", 100.0), 1000.0, snap).allowed);

  const auto denied = gate.check(buy("AAPL", 101.0), 1000.0, snap);
  EXPECT_FALSE(denied.allowed);
  EXPECT_EQ(denied.check, dom::RiskCheck::PositionSize);
  EXPECT_NEAR(denied.observed, 0.101, 1e-12);
  EXPECT_DOUBLE_EQ(denied.limit, 0.10);
  EXPECT_NEAR(denied.excess, 0.001, 1e-12);
  EXPECT_FALSE(denied.reason.empty());
}

// -----------------------------------------------------------------------------
// 2. Reducing an oversized position is always allowed.
// Why: Blocking exits would trap the book in the very exposure the limits
//      exist to prevent.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, ReducingOrdersBypassChecks) {
  RiskGate gate(limits, market);
  auto snap = portfolio(1'000'000.0);
  snap.positions.push_back(holding("AAPL", 500.0, 1000.0));
  snap.daily_pnl = -500'000.0;

  const auto d = gate.check(sell("AAPL", 200.0), 1000.0, snap);
  EXPECT_TRUE(d.allowed);
  EXPECT_EQ(d.check, dom::RiskCheck::None);

  // Flipping past flat increases |exposure| again and is checked.
  EXPECT_FALSE(gate.check(sell("AAPL", 1200.0), 1000.0, snap).allowed);
}

// -----------------------------------------------------------------------------
// 3. Concentration counts the symbol's exposure in every mode.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, ConcentrationIncludesOtherModes) {
  limits.max_position_fraction = 0.15;
  limits.max_concentration_fraction = 0.20;
  RiskGate gate(limits, market);

  auto snap = portfolio(1'000'000.0);
  snap.positions.push_back(
      holding("AAPL", 100.0, 1000.0, dom::TradingMode::Live));

  // Simulated 120 @ 1000 = 12% on its own, 22% with the Live holding.
  const auto d = gate.check(buy("AAPL", 120.0), 1000.0, snap);
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.check, dom::RiskCheck::Concentration);
  EXPECT_NEAR(d.observed, 0.22, 1e-12);
}

// -----------------------------------------------------------------------------
// 4. A candidate moving in lockstep with a holding is denied on correlation.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, CorrelatedHoldingIsDenied) {
  market.series["AAPL"] = {100, 101, 99, 102, 104, 103, 105};
  market.series["MSFT"] = {200, 202, 198, 204, 208, 206, 210};
  market.series["XOM"] = {50, 49, 51, 48, 47, 49, 46};
  RiskGate gate(limits, market);

  auto snap = portfolio(1'000'000.0);
  snap.positions.push_back(holding("MSFT", 10.0, 210.0));

  const auto d = gate.check(buy("AAPL", 10.0), 105.0, snap);
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.check, dom::RiskCheck::Correlation);
  EXPECT_EQ(d.related_symbol, "MSFT");
  EXPECT_GT(d.observed, 0.99);

  // XOM moves the other way and is not a concentration of risk.
  snap.positions.clear();
  snap.positions.push_back(holding("XOM", 10.0, 46.0));
  EXPECT_TRUE(gate.check(buy("AAPL", 10.0), 105.0, snap).allowed);
}

// -----------------------------------------------------------------------------
// 5. Once today's loss exceeds the limit, new exposure is refused.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, DailyLossLimit) {
  RiskGate gate(limits, market);
  auto snap = portfolio(1'000'000.0);

  snap.daily_pnl = -20'000.0;  // exactly 2%
  EXPECT_TRUE(gate.check(buy("AAPL", 10.0), 100.0, snap).allowed);

  snap.daily_pnl = -25'000.0;
  const auto d = gate.check(buy("AAPL", 10.0), 100.0, snap);
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.check, dom::RiskCheck::DailyLoss);
  EXPECT_NEAR(d.observed, 0.025, 1e-12);
}

// -----------------------------------------------------------------------------
// 6. The VaR check only runs when a VaR limit is configured.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, OptionalValueAtRiskLimit) {
  // Alternating -10% / +10% moves.
  market.series["GME"] = {100, 90, 99, 89.1, 98.01, 88.209};
  limits.max_position_fraction = 1.0;
  limits.max_concentration_fraction = 1.0;
  auto snap = portfolio(100'000.0);

  {
    RiskGate gate(limits, market);
    EXPECT_TRUE(gate.check(buy("GME", 500.0), 88.209, snap).allowed);
  }

  limits.max_var_fraction = 0.01;
  RiskGate gate(limits, market);
  const auto d = gate.check(buy("GME", 500.0), 88.209, snap);
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.check, dom::RiskCheck::ValueAtRisk);
}

// -----------------------------------------------------------------------------
// 7. A flat or negative portfolio cannot take new exposure.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, NonPositivePortfolioValueDenies) {
  RiskGate gate(limits, market);
  const auto d = gate.check(buy("AAPL", 1.0), 100.0, portfolio(0.0));
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.check, dom::RiskCheck::PositionSize);

  EXPECT_THROW(gate.check(buy("AAPL", 1.0), 0.0, portfolio(1000.0)),
               tradeledger::ValidationError);
}

// -----------------------------------------------------------------------------
// 8. Out-of-range limits are refused at construction and on replace.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, InvalidLimitsAreRejected) {
  auto bad = limits;
  bad.max_position_fraction = 0.0;
  EXPECT_THROW({ RiskGate rejected(bad, market); },
               tradeledger::ValidationError);

  bad = limits;
  bad.var_confidence = 1.0;
  EXPECT_THROW(RiskGate::validate(bad), tradeledger::ValidationError);

  RiskGate gate(limits, market);
  bad = limits;
  bad.correlation_window = 1;
  try {
    gate.replaceLimits(bad);
    FAIL() << "expected ValidationError";
  } catch (const tradeledger::ValidationError& e) {
    EXPECT_EQ(e.field(), "correlation_window");
  }
  EXPECT_EQ(gate.limits()->correlation_window, limits.correlation_window);
}

// -----------------------------------------------------------------------------
// 9. Monetary VaR scales the return quantile by the position's exposure.
// -----------------------------------------------------------------------------
TEST_F(RiskGateTest, ValueAtRiskScalesByExposure) {
  market.series["AAPL"] = {100, 95, 99.75, 94.7625, 99.500625};
  RiskGate gate(limits, market);

  auto snap = portfolio(1'000'000.0);
  snap.positions.push_back(holding("AAPL", 100.0, 100.0));

  const double var = gate.valueAtRisk("AAPL", tradeledger::VarMethod::Historical,
                                      0.95, snap);
  // Returns alternate -5% / +5%; the 5% quantile is -5%.
  EXPECT_NEAR(var, 0.05 * 10'000.0, 1e-6);
  EXPECT_GE(gate.expectedShortfall("AAPL", 0.95, snap), var - 1e-9);

  // No holdings: nothing at risk.
  EXPECT_DOUBLE_EQ(gate.valueAtRisk("", tradeledger::VarMethod::Historical,
                                    0.95, portfolio(1'000'000.0)),
                   0.0);
}
