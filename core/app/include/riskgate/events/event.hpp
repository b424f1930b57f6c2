#pragma once

#include "riskgate/events/alert_event.hpp"
#include "riskgate/events/decision_event.hpp"
#include "riskgate/events/event_types.hpp"

#include <variant>

namespace riskgate {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Single envelope carried by every queue and bus in the process. A closed
// std::variant: adding an event kind means adding it here, and every
// std::get_if / std::visit site stays type-checked.
// -----------------------------------------------------------------------------
using Event = std::variant<
    SignalEvent,
    FillEvent,
    PriceUpdateEvent,
    SessionControlEvent,
    DecisionEvent,
    AlertEvent>;

}  // namespace riskgate
