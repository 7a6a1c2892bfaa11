// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for tradeledger::EventBus.
//
// Validates:
//   - Generic subscription sees every lifecycle event type
//   - Typed subscription filters on the variant alternative
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A subscriber may publish from inside its callback
//   - Order and trade payloads arrive intact
//
// All tests are single-threaded. Cross-thread publishing is exercised by
// order_lifecycle_test.cpp.
// =============================================================================

#include "tradeledger/eventbus/event_bus.hpp"
#include "tradeledger/events/event.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace dom = tradeledger::domain;

class EventBusTest : public ::testing::Test {
 protected:
  tradeledger::EventBus bus;

  static tradeledger::MarketDataEvent tick(const std::string& symbol,
                                           double price) {
    tradeledger::MarketDataEvent e;
    e.symbol = symbol;
    e.price = price;
    e.quantity = 10.0;
    return e;
  }

  static tradeledger::OrderUpdateEvent submitted(dom::OrderId id) {
    tradeledger::OrderUpdateEvent e;
    e.order.id = id;
    e.order.symbol = "AAPL";
    e.order.status = dom::OrderStatus::Submitted;
    e.previous_status = dom::OrderStatus::Pending;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked once per event, whatever its type.
// Why: The telemetry bridge subscribes generically and forwards everything
//      except ticks.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int calls = 0;
  bus.subscribe([&calls](const tradeledger::Event&) { ++calls; });

  bus.publish(tick("AAPL", 150.0));
  bus.publish(submitted(1));
  bus.publish(tradeledger::TradeEvent{});
  bus.publish(tradeledger::PositionUpdateEvent{});
  bus.publish(tradeledger::RiskViolationEvent{});

  EXPECT_EQ(calls, 5);
}

// -----------------------------------------------------------------------------
// 2. subscribe<T> fires only for T.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int trades = 0;
  bus.subscribe<tradeledger::TradeEvent>(
      [&trades](const tradeledger::TradeEvent&) { ++trades; });

  bus.publish(tick("AAPL", 150.0));
  bus.publish(submitted(1));
  bus.publish(tradeledger::TradeEvent{});

  EXPECT_EQ(trades, 1);
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id) the callback no longer fires.
// Why: TradingEngine unsubscribes its market-data and telemetry handlers on
//      teardown; a late callback would touch a destroyed object.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe<tradeledger::MarketDataEvent>(
      [&calls](const tradeledger::MarketDataEvent&) { ++calls; });

  bus.publish(tick("AAPL", 150.0));
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 1u);

  bus.unsubscribe(id);
  bus.publish(tick("AAPL", 151.0));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 4. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnknownIdAndEmptyBusAreNoOps) {
  EXPECT_NO_THROW(bus.unsubscribe(9999));
  EXPECT_NO_THROW(bus.publish(tick("AAPL", 150.0)));
}

// -----------------------------------------------------------------------------
// 5. Publishing from inside a callback does not deadlock.
// Why: The engine's tick subscription marks positions to market, and the
//      lifecycle manager publishes trade and position events while handling
//      an order update chain.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  std::vector<dom::OrderId> seen;

  bus.subscribe<tradeledger::OrderUpdateEvent>(
      [&seen](const tradeledger::OrderUpdateEvent& e) {
        seen.push_back(e.order.id);
      });

  bus.subscribe<tradeledger::MarketDataEvent>(
      [this](const tradeledger::MarketDataEvent&) {
        bus.publish(submitted(7));
      });

  bus.publish(tick("MSFT", 410.0));

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], 7u);
}

// -----------------------------------------------------------------------------
// 6. Payload fields survive the variant dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TradePayloadArrivesIntact) {
  dom::Trade received;
  bus.subscribe<tradeledger::TradeEvent>(
      [&received](const tradeledger::TradeEvent& e) { received = e.trade; });

  tradeledger::TradeEvent event;
  event.trade.id = 11;
  event.trade.order_id = 3;
  event.trade.symbol = "TSLA";
  event.trade.side = dom::Side::Sell;
  event.trade.quantity = 25.0;
  event.trade.price = 237.5;
  event.trade.realized_pnl = -42.0;
  bus.publish(event);

  EXPECT_EQ(received.id, 11u);
  EXPECT_EQ(received.order_id, 3u);
  EXPECT_EQ(received.symbol, "TSLA");
  EXPECT_EQ(received.side, dom::Side::Sell);
  EXPECT_DOUBLE_EQ(received.notional(), 25.0 * 237.5);
  EXPECT_DOUBLE_EQ(received.realized_pnl, -42.0);
}
