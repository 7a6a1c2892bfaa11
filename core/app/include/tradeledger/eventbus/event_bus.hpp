#pragma once

#include "tradeledger/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// EventBus — synchronous in-process publish/subscribe
// -----------------------------------------------------------------------------
//
// @brief  Delivers every published Event to the registered callbacks on the
//         publishing thread, before publish() returns.
//
// @details
// Publishers in this engine:
//   OrderLifecycleManager  OrderUpdateEvent, TradeEvent, PositionUpdateEvent,
//                          RiskViolationEvent
//   TradingEngine          MarketDataEvent (from the gateway thread)
//
// Subscribers:
//   TradingEngine          MarketDataEvent → PriceCache + mark-to-market;
//                          everything else → IpcServer telemetry queue
//
// publish() copies the subscriber list under the mutex and invokes the
// callbacks without it, so a callback may publish or unsubscribe without
// deadlocking. A subscriber added during a publish may miss that event.
//
// Non-copyable: callbacks capture `this` of their owners.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every event.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored. A publish already in progress may still call
  // the removed callback once.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace tradeledger
