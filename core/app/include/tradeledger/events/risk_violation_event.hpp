#pragma once

#include "tradeledger/domain/order.hpp"
#include "tradeledger/domain/risk_decision.hpp"

#include <cstdint>
#include <string>

namespace tradeledger {

// Published when the RiskGate denies an order. The order itself moves to
// Rejected; this event carries the numbers behind the denial.
struct RiskViolationEvent {
  domain::OrderId order_id{};
  std::string symbol;
  domain::RiskDecision decision;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradeledger
