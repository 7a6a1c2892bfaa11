// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the JSON encoding used by commands and telemetry.
//
// Validates:
//   - Order requests parse with defaults for optional keys
//   - Missing or mistyped keys raise ValidationError naming the key
//   - Order, position snapshot and decision encodings carry their fields
//   - Error encoding carries the reason code and subclass details
//   - Telemetry frames for each lifecycle event type
// =============================================================================

#include "tradeledger/domain/errors.hpp"
#include "tradeledger/network/ipc_server.hpp"
#include "tradeledger/network/json_codec.hpp"
#include "tradeledger/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

namespace dom = tradeledger::domain;
using nlohmann::json;

class JsonCodecTest : public ::testing::Test {
 protected:
  static std::string fieldOf(const json& j) {
    try {
      tradeledger::orderRequestFromJson(j);
    } catch (const tradeledger::ValidationError& e) {
      return e.field();
    }
    return "";
  }
};

// -----------------------------------------------------------------------------
// 1. A minimal request is a simulated market order.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, ParsesMinimalOrderRequest) {
  const auto req = tradeledger::orderRequestFromJson(
      json::parse(R"({"symbol": "aapl", "quantity": 10, "side": "BUY"})"));

  EXPECT_EQ(req.symbol, "aapl");
  EXPECT_DOUBLE_EQ(req.quantity, 10.0);
  EXPECT_EQ(req.side, dom::Side::Buy);
  EXPECT_EQ(req.kind, dom::OrderKind::Market);
  EXPECT_EQ(req.mode, dom::TradingMode::Simulated);
  EXPECT_FALSE(req.limit_price.has_value());
  EXPECT_FALSE(req.expires_at.has_value());
  EXPECT_FALSE(req.auto_trading);
}

// -----------------------------------------------------------------------------
// 2. Every optional key is honoured.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, ParsesFullOrderRequest) {
  const auto req = tradeledger::orderRequestFromJson(json::parse(R"({
    "symbol": "MSFT", "quantity": 5, "side": "sell", "kind": "stoplimit",
    "limit_price": 390.5, "stop_price": 395, "mode": "live",
    "auto_trading": true, "expires_at_ms": 1700000000000, "notes": "hedge"
  })"));

  EXPECT_EQ(req.side, dom::Side::Sell);
  EXPECT_EQ(req.kind, dom::OrderKind::StopLimit);
  EXPECT_EQ(req.mode, dom::TradingMode::Live);
  EXPECT_DOUBLE_EQ(*req.limit_price, 390.5);
  EXPECT_DOUBLE_EQ(*req.stop_price, 395.0);
  EXPECT_TRUE(req.auto_trading);
  ASSERT_TRUE(req.expires_at.has_value());
  EXPECT_EQ(tradeledger::timestamp_to_ms(*req.expires_at), 1700000000000);
  EXPECT_EQ(req.notes, "hedge");
}

// -----------------------------------------------------------------------------
// 3. Bad input names the key that is wrong.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, RejectsBadRequestsByField) {
  EXPECT_EQ(fieldOf(json::parse(R"({"quantity": 1, "side": "buy"})")),
            "symbol");
  EXPECT_EQ(fieldOf(json::parse(
                R"({"symbol": "A", "quantity": "ten", "side": "buy"})")),
            "quantity");
  EXPECT_EQ(fieldOf(json::parse(
                R"({"symbol": "A", "quantity": 1, "side": "hold"})")),
            "side");
  EXPECT_EQ(fieldOf(json::parse(
                R"({"symbol": "A", "quantity": 1, "side": "buy", "kind": "iceberg"})")),
            "kind");
  EXPECT_EQ(fieldOf(json::array()), "order");
}

// -----------------------------------------------------------------------------
// 4. Order encoding: nulls for absent optionals, enum names as strings.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, EncodesOrder) {
  dom::Order o;
  o.id = 42;
  o.symbol = "AAPL";
  o.kind = dom::OrderKind::Limit;
  o.limit_price = 150.0;
  o.quantity = 10.0;
  o.filled_quantity = 4.0;
  o.remaining_quantity = 6.0;
  o.status = dom::OrderStatus::PartiallyFilled;
  o.created_at = tradeledger::ms_to_timestamp(1000);

  const auto j = tradeledger::toJson(o);
  EXPECT_EQ(j["order_id"], 42);
  EXPECT_EQ(j["kind"], "Limit");
  EXPECT_EQ(j["status"], "PartiallyFilled");
  EXPECT_EQ(j["limit_price"], 150.0);
  EXPECT_TRUE(j["stop_price"].is_null());
  EXPECT_TRUE(j["filled_at_ms"].is_null());
  EXPECT_EQ(j["created_at_ms"], 1000);
  EXPECT_EQ(j["remaining_quantity"], 6.0);
}

// -----------------------------------------------------------------------------
// 5. A position snapshot carries its lots.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, EncodesPositionSnapshotWithLots) {
  dom::PositionSnapshot snap;
  snap.position.symbol = "AAPL";
  snap.position.quantity = 30.0;
  snap.position.average_price = 1100.0;
  snap.position.current_price = 1200.0;
  dom::Lot lot;
  lot.id = 2;
  lot.original_quantity = 50.0;
  lot.remaining_quantity = 30.0;
  lot.unit_cost = 1100.0;
  snap.lots.push_back(lot);

  const auto j = tradeledger::toJson(snap);
  EXPECT_EQ(j["symbol"], "AAPL");
  EXPECT_EQ(j["market_value"], 36000.0);
  ASSERT_EQ(j["lots"].size(), 1u);
  EXPECT_EQ(j["lots"][0]["lot_id"], 2);
  EXPECT_EQ(j["lots"][0]["side"], "Long");
  EXPECT_EQ(j["lots"][0]["remaining_quantity"], 30.0);
}

// -----------------------------------------------------------------------------
// 6. Error encoding exposes reason code, retryability and details.
// Why: Callers branch on reason_code and retryable, not on message text.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, EncodesErrors) {
  const auto conflict = tradeledger::errorToJson(
      tradeledger::ConcurrencyConflict(9, "busy"));
  EXPECT_EQ(conflict["reason_code"], "ConcurrencyConflict");
  EXPECT_EQ(conflict["retryable"], true);
  EXPECT_EQ(conflict["order_id"], 9);

  const auto state = tradeledger::errorToJson(tradeledger::InvalidStateError(
      3, dom::OrderStatus::Filled, "already filled"));
  EXPECT_EQ(state["reason_code"], "InvalidState");
  EXPECT_EQ(state["retryable"], false);
  EXPECT_EQ(state["order_status"], "Filled");

  const auto risk = tradeledger::errorToJson(tradeledger::RiskLimitExceeded(
      dom::RiskDecision::deny(dom::RiskCheck::DailyLoss, "loss", 0.03, 0.02)));
  EXPECT_EQ(risk["reason_code"], "RiskLimitExceeded");
  EXPECT_EQ(risk["decision"]["check"], "DailyLoss");
  EXPECT_EQ(risk["decision"]["allowed"], false);
  EXPECT_EQ(risk["message"], "loss");
  EXPECT_FALSE(risk.contains("order_id"));

  const auto stored = tradeledger::errorToJson(tradeledger::RiskLimitExceeded(
      dom::RiskDecision::deny(dom::RiskCheck::PositionSize, "size", 0.2, 0.1),
      17));
  EXPECT_EQ(stored["order_id"], 17);
}

// -----------------------------------------------------------------------------
// 7. Telemetry frames are typed JSON; market data is not published.
// -----------------------------------------------------------------------------
TEST_F(JsonCodecTest, FormatsTelemetryFrames) {
  tradeledger::TradeEvent trade;
  trade.trade.id = 5;
  trade.trade.symbol = "AAPL";
  trade.sequence_id = 12;
  const auto frame = tradeledger::IpcServer::formatTelemetry(trade);
  ASSERT_TRUE(frame.has_value());
  const auto j = json::parse(*frame);
  EXPECT_EQ(j["type"], "trade");
  EXPECT_EQ(j["sequence_id"], 12);
  EXPECT_EQ(j["trade_id"], 5);

  tradeledger::RiskViolationEvent violation;
  violation.order_id = 8;
  violation.decision =
      dom::RiskDecision::deny(dom::RiskCheck::PositionSize, "too big", 0.2, 0.1);
  const auto v = json::parse(*tradeledger::IpcServer::formatTelemetry(violation));
  EXPECT_EQ(v["type"], "risk_violation");

  EXPECT_FALSE(tradeledger::IpcServer::formatTelemetry(
                   tradeledger::MarketDataEvent{})
                   .has_value());
}
