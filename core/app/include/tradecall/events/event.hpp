#pragma once

#include "tradecall/events/event_types.hpp"
#include "tradecall/events/execution_failure_event.hpp"
#include "tradecall/events/execution_report_event.hpp"
#include "tradecall/events/exit_trigger_event.hpp"
#include "tradecall/events/order_event.hpp"
#include "tradecall/events/position_update_event.hpp"
#include "tradecall/events/signal_event.hpp"

#include <variant>

namespace tradecall {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Closed set of everything that travels over an EventBus. Subscribers use
// EventBus::subscribe<T>() or std::get_if on the variant.
// -----------------------------------------------------------------------------
using Event = std::variant<
    ChatMessageEvent,
    SignalEvent,
    OrderEvent,
    ExecutionReportEvent,
    PositionUpdateEvent,
    ExitTriggerEvent,
    ExecutionFailureEvent,
    HeartbeatEvent>;

}  // namespace tradecall
