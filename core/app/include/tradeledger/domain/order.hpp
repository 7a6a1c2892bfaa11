#pragma once

#include "tradeledger/domain/order_status.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tradeledger {

// Wall-clock (or simulated) instant used by every domain record.
using Timestamp = std::chrono::system_clock::time_point;

namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Unique identifier for an order. Produced by OrderIdGenerator; plain value
// type, cheap to copy and hash.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Closed set of order types. ExecutionSimulator switches over it
// exhaustively, so adding a kind is a compile-time change in one place.
//
//   Market    — fills at the current market price.
//   Limit     — fills only at the limit price or better.
//   StopLoss  — dormant until the market crosses the stop price, then fills
//               at market.
//   StopLimit — stop trigger, then limit pricing.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Market,
  Limit,
  StopLoss,
  StopLimit,
};

// Simulated orders execute against the simulator immediately; live orders
// only execute when auto-trading is on or a caller retries them.
enum class TradingMode {
  Simulated,
  Live,
};

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
//
// @brief  Caller-supplied description of a new order, before validation.
//
// @details
// Optional price fields are checked by OrderLifecycleManager::placeOrder():
// Limit/StopLimit need limit_price, StopLoss/StopLimit need stop_price. A
// supplied price must be strictly positive.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string symbol;
  OrderKind kind{OrderKind::Market};
  Side side{Side::Buy};
  double quantity{0.0};
  std::optional<double> limit_price;
  std::optional<double> stop_price;
  TradingMode mode{TradingMode::Simulated};
  bool auto_trading{false};
  std::optional<Timestamp> expires_at;  // Good-till time; empty = no expiry
  std::string notes;
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  Full state of an order: the validated intent plus its lifecycle
//         status and cumulative fills.
//
// @details
// Invariant maintained by OrderLifecycleManager:
//   filled_quantity + remaining_quantity == quantity
//   remaining_quantity == 0  <=>  status == Filled
//
// Cancelled, Rejected and Expired orders keep their unfilled remainder so
// the first invariant holds for every status.
//
// The authoritative copy lives inside OrderLifecycleManager; copies handed
// out through accessors and events are snapshots.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  std::string symbol;
  OrderKind kind{OrderKind::Market};
  Side side{Side::Buy};
  double quantity{0.0};
  std::optional<double> limit_price;
  std::optional<double> stop_price;
  TradingMode mode{TradingMode::Simulated};
  bool auto_trading{false};
  std::optional<Timestamp> expires_at;
  std::string notes;

  OrderStatus status{OrderStatus::Pending};
  double filled_quantity{0.0};
  double remaining_quantity{0.0};
  double average_fill_price{0.0};

  Timestamp created_at{};
  std::optional<Timestamp> submitted_at;
  std::optional<Timestamp> filled_at;
  std::optional<Timestamp> cancelled_at;
};

}  // namespace domain
}  // namespace tradeledger
