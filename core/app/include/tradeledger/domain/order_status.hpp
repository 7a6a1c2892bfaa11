#pragma once

namespace tradeledger {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an order can occupy between placement and
//         its terminal outcome.
//
// @details
// The OrderLifecycleManager enforces the transition graph:
//
//   Pending ──> Submitted ──> PartiallyFilled ──> Filled
//      │            │              │    ▲
//      │            │              └────┘ (further partial fills)
//      ▼            ▼              ▼
//   Rejected     Cancelled      Cancelled
//   Cancelled    Rejected       Rejected
//   Expired      Expired        Expired
//
// Terminal states: Filled, Cancelled, Rejected, Expired. Once an order is
// terminal no further transition is legal.
//
// A Submitted order that has not met its execution condition (a resting
// limit or an untriggered stop) stays Submitted; that is a normal state,
// not an error.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,          // Constructed, not yet validated against the gate
  Submitted,        // Accepted by the manager, waiting for a fill
  PartiallyFilled,  // Some quantity filled, remainder still open
  Filled,           // Fully filled — terminal
  Cancelled,        // Cancelled by request — terminal
  Rejected,         // Denied by the risk gate — terminal
  Expired,          // Expiry passed before a full fill — terminal
};

inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled || status == OrderStatus::Cancelled ||
         status == OrderStatus::Rejected || status == OrderStatus::Expired;
}

// Orders that may still receive a fill.
inline bool isFillable(OrderStatus status) {
  return status == OrderStatus::Submitted ||
         status == OrderStatus::PartiallyFilled;
}

inline bool isCancellable(OrderStatus status) {
  return status == OrderStatus::Pending || isFillable(status);
}

}  // namespace domain
}  // namespace tradeledger
