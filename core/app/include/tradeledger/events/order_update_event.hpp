#pragma once

#include "tradeledger/domain/order.hpp"
#include "tradeledger/domain/order_status.hpp"

#include <cstdint>

namespace tradeledger {

// Published by OrderLifecycleManager after every status transition.
struct OrderUpdateEvent {
  domain::Order order;  // Snapshot after the transition
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradeledger
