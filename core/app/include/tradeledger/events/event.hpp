#pragma once

#include "tradeledger/events/event_types.hpp"
#include "tradeledger/events/order_update_event.hpp"
#include "tradeledger/events/position_update_event.hpp"
#include "tradeledger/events/risk_violation_event.hpp"
#include "tradeledger/events/trade_event.hpp"

#include <variant>

namespace tradeledger {

// Closed set of everything that travels over the EventBus and the telemetry
// socket. Adding an alternative means adding a formatter in IpcServer.
using Event = std::variant<
    MarketDataEvent,
    OrderUpdateEvent,
    TradeEvent,
    PositionUpdateEvent,
    RiskViolationEvent>;

}  // namespace tradeledger
