// =============================================================================
// execution_simulator_test.cpp
// =============================================================================
// Unit tests for tradeledger::ExecutionSimulator.
//
// Validates:
//   - Market orders fill at the market with commission and tax
//   - Limit orders fill at the limit or better, never worse
//   - Stop and stop-limit triggering for both sides
//   - Per-attempt quantity cap
//   - Missing prices are validation errors
// =============================================================================

#include "tradeledger/domain/errors.hpp"
#include "tradeledger/execution/execution_simulator.hpp"

#include <gtest/gtest.h>

#include <optional>

namespace dom = tradeledger::domain;
using tradeledger::ExecutionSimulator;

class ExecutionSimulatorTest : public ::testing::Test {
 protected:
  ExecutionSimulator simulator{dom::FeeSchedule{}};

  static dom::Order order(dom::OrderKind kind, dom::Side side, double qty,
                          std::optional<double> limit = std::nullopt,
                          std::optional<double> stop = std::nullopt) {
    dom::Order o;
    o.id = 1;
    o.symbol = "AAPL";
    o.kind = kind;
    o.side = side;
    o.quantity = qty;
    o.remaining_quantity = qty;
    o.limit_price = limit;
    o.stop_price = stop;
    o.status = dom::OrderStatus::Submitted;
    return o;
  }
};

// -----------------------------------------------------------------------------
// 1. Buying 100 @ 1000 costs 100,000 + 150 commission + 100 tax = 100,250.
// -----------------------------------------------------------------------------
TEST_F(ExecutionSimulatorTest, MarketBuyChargesDefaultFees) {
  const auto fill =
      simulator.decide(order(dom::OrderKind::Market, dom::Side::Buy, 100.0),
                       1000.0);

  ASSERT_TRUE(fill.has_value());
  EXPECT_DOUBLE_EQ(fill->price, 1000.0);
  EXPECT_DOUBLE_EQ(fill->quantity, 100.0);
  EXPECT_NEAR(fill->commission, 150.0, 1e-9);
  EXPECT_NEAR(fill->tax, 100.0, 1e-9);
  EXPECT_NEAR(fill->totalCost(), 100'250.0, 1e-9);
  EXPECT_NEAR(fill->netProceeds(), 99'750.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 2. A buy limit fills only at or below the limit; the fill takes the better
//    of limit and market.
// -----------------------------------------------------------------------------
TEST_F(ExecutionSimulatorTest, BuyLimitFillsAtLimitOrBetter) {
  const auto o = order(dom::OrderKind::Limit, dom::Side::Buy, 10.0, 150.0);

  EXPECT_FALSE(simulator.decide(o, 150.01).has_value());

  const auto at = simulator.decide(o, 150.0);
  ASSERT_TRUE(at.has_value());
  EXPECT_DOUBLE_EQ(at->price, 150.0);

  const auto better = simulator.decide(o, 148.0);
  ASSERT_TRUE(better.has_value());
  EXPECT_DOUBLE_EQ(better->price, 148.0);
}

// -----------------------------------------------------------------------------
// 3. A sell limit fills only at or above the limit.
// -----------------------------------------------------------------------------
TEST_F(ExecutionSimulatorTest, SellLimitFillsAtLimitOrBetter) {
  const auto o = order(dom::OrderKind::Limit, dom::Side::Sell, 10.0, 150.0);

  EXPECT_FALSE(simulator.decide(o, 149.99).has_value());
  const auto fill = simulator.decide(o, 152.0);
  ASSERT_TRUE(fill.has_value());
  EXPECT_DOUBLE_EQ(fill->price, 152.0);
}

// -----------------------------------------------------------------------------
// 4. Sell stops trigger on a fall to the stop, buy stops on a rise.
// Why: A sell stop that fired on a rally would close a profitable position
//      at the wrong moment.
// -----------------------------------------------------------------------------
TEST_F(ExecutionSimulatorTest, StopLossTriggersInDirectionOfRisk) {
  const auto sell_stop = order(dom::OrderKind::StopLoss, dom::Side::Sell, 5.0,
                               std::nullopt, 95.0);
  EXPECT_FALSE(simulator.decide(sell_stop, 96.0).has_value());
  const auto triggered = simulator.decide(sell_stop, 94.5);
  ASSERT_TRUE(triggered.has_value());
  EXPECT_DOUBLE_EQ(triggered->price, 94.5);

  const auto buy_stop = order(dom::OrderKind::StopLoss, dom::Side::Buy, 5.0,
                              std::nullopt, 105.0);
  EXPECT_FALSE(simulator.decide(buy_stop, 104.0).has_value());
  EXPECT_TRUE(simulator.decide(buy_stop, 105.0).has_value());
}

// -----------------------------------------------------------------------------
// 5. A stop-limit needs the stop triggered and the limit satisfied.
// -----------------------------------------------------------------------------
TEST_F(ExecutionSimulatorTest, StopLimitNeedsBothConditions) {
  // Sell: trigger at 95, but not below 93.
  const auto o =
      order(dom::OrderKind::StopLimit, dom::Side::Sell, 5.0, 93.0, 95.0);

  EXPECT_FALSE(simulator.decide(o, 97.0).has_value());  // not triggered
  EXPECT_FALSE(simulator.decide(o, 92.0).has_value());  // through the limit

  const auto fill = simulator.decide(o, 94.0);
  ASSERT_TRUE(fill.has_value());
  EXPECT_DOUBLE_EQ(fill->price, 94.0);
}

// -----------------------------------------------------------------------------
// 6. max_fill_quantity caps each attempt; the rest stays for later.
// -----------------------------------------------------------------------------
TEST_F(ExecutionSimulatorTest, CapsFillQuantity) {
  dom::FeeSchedule fees;
  fees.max_fill_quantity = 30.0;
  ExecutionSimulator capped(fees);

  auto o = order(dom::OrderKind::Market, dom::Side::Buy, 100.0);
  auto fill = capped.decide(o, 10.0);
  ASSERT_TRUE(fill.has_value());
  EXPECT_DOUBLE_EQ(fill->quantity, 30.0);

  o.remaining_quantity = 10.0;
  fill = capped.decide(o, 10.0);
  ASSERT_TRUE(fill.has_value());
  EXPECT_DOUBLE_EQ(fill->quantity, 10.0);

  o.remaining_quantity = 0.0;
  EXPECT_FALSE(capped.decide(o, 10.0).has_value());
}

// -----------------------------------------------------------------------------
// 7. A limit order without a limit price, or a non-positive market price,
//    is a validation error rather than a silent no-fill.
// -----------------------------------------------------------------------------
TEST_F(ExecutionSimulatorTest, MissingPricesAreValidationErrors) {
  EXPECT_THROW(
      simulator.decide(order(dom::OrderKind::Limit, dom::Side::Buy, 1.0), 10.0),
      tradeledger::ValidationError);
  EXPECT_THROW(
      simulator.decide(order(dom::OrderKind::Market, dom::Side::Buy, 1.0), 0.0),
      tradeledger::ValidationError);
}
