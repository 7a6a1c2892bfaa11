#pragma once

#include "tradeledger/domain/order.hpp"
#include "tradeledger/domain/order_status.hpp"
#include "tradeledger/domain/risk_decision.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tradeledger {

// -----------------------------------------------------------------------------
// ReasonCode — machine-readable failure category
// -----------------------------------------------------------------------------
// Every TradingError carries one. The IPC layer serializes it next to the
// numeric detail of the concrete subclass so callers never have to parse
// what() text.
// -----------------------------------------------------------------------------
enum class ReasonCode {
  Validation,
  UnknownOrder,
  InvalidState,
  ConcurrencyConflict,
  InsufficientLots,
  RiskLimitExceeded,
  Persistence,
  InvariantViolation,
};

// -----------------------------------------------------------------------------
// TradingError — root of the engine's exception hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Base class for every failure the core reports to its callers.
//
// @details
// Propagation rules:
//   ValidationError, RiskLimitExceeded  → surfaced immediately, not retried.
//   ConcurrencyConflict                 → retryable (retryable() == true).
//   PersistenceError                    → the position/lot mutation of the
//                                         failed attempt is rolled back.
//   InsufficientLotsError,
//   InvariantViolation                  → internal consistency failures;
//                                         state is left unchanged.
//
// A missing market price is NOT an exception. It is an execution outcome
// (see OrderLifecycleManager::ExecutionOutcome) and the order stays open.
// -----------------------------------------------------------------------------
class TradingError : public std::runtime_error {
 public:
  TradingError(ReasonCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ReasonCode code() const noexcept { return code_; }

  virtual bool retryable() const noexcept { return false; }

 private:
  ReasonCode code_;
};

// Malformed order input or configuration. field() names the offending input.
class ValidationError : public TradingError {
 public:
  ValidationError(std::string field, const std::string& message)
      : TradingError(ReasonCode::Validation, message),
        field_(std::move(field)) {}

  const std::string& field() const noexcept { return field_; }

 private:
  std::string field_;
};

class UnknownOrderError : public TradingError {
 public:
  explicit UnknownOrderError(domain::OrderId order_id)
      : TradingError(ReasonCode::UnknownOrder,
                     "unknown order_id=" + std::to_string(order_id)),
        order_id_(order_id) {}

  domain::OrderId orderId() const noexcept { return order_id_; }

 private:
  domain::OrderId order_id_;
};

// The requested transition is not legal from the order's current status.
class InvalidStateError : public TradingError {
 public:
  InvalidStateError(domain::OrderId order_id, domain::OrderStatus status,
                    const std::string& message)
      : TradingError(ReasonCode::InvalidState, message),
        order_id_(order_id),
        status_(status) {}

  domain::OrderId orderId() const noexcept { return order_id_; }
  domain::OrderStatus status() const noexcept { return status_; }

 private:
  domain::OrderId order_id_;
  domain::OrderStatus status_;
};

// Lost a race against another operation on the same order.
class ConcurrencyConflict : public TradingError {
 public:
  ConcurrencyConflict(domain::OrderId order_id, const std::string& message)
      : TradingError(ReasonCode::ConcurrencyConflict, message),
        order_id_(order_id) {}

  domain::OrderId orderId() const noexcept { return order_id_; }

  bool retryable() const noexcept override { return true; }

 private:
  domain::OrderId order_id_;
};

// A closing trade asked for more quantity than the open lots hold. Thrown
// before any lot is touched.
class InsufficientLotsError : public TradingError {
 public:
  InsufficientLotsError(double requested, double available,
                        const std::string& message)
      : TradingError(ReasonCode::InsufficientLots, message),
        requested_(requested),
        available_(available) {}

  double requested() const noexcept { return requested_; }
  double available() const noexcept { return available_; }

 private:
  double requested_;
  double available_;
};

// The RiskGate denied the order. decision() carries which check failed and
// the observed value, limit and excess. orderId() is set when the denied
// order was stored (as Rejected).
class RiskLimitExceeded : public TradingError {
 public:
  explicit RiskLimitExceeded(
      domain::RiskDecision decision,
      std::optional<domain::OrderId> order_id = std::nullopt)
      : TradingError(ReasonCode::RiskLimitExceeded, decision.reason),
        decision_(std::move(decision)),
        order_id_(order_id) {}

  const domain::RiskDecision& decision() const noexcept { return decision_; }
  const std::optional<domain::OrderId>& orderId() const noexcept {
    return order_id_;
  }

 private:
  domain::RiskDecision decision_;
  std::optional<domain::OrderId> order_id_;
};

class PersistenceError : public TradingError {
 public:
  explicit PersistenceError(const std::string& message)
      : TradingError(ReasonCode::Persistence, message) {}
};

class InvariantViolation : public TradingError {
 public:
  explicit InvariantViolation(const std::string& message)
      : TradingError(ReasonCode::InvariantViolation, message) {}
};

}  // namespace tradeledger
