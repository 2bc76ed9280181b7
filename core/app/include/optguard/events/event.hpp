#pragma once

#include "optguard/events/decision_events.hpp"

#include <variant>

namespace optguard {

// -----------------------------------------------------------------------------
// Event — the single envelope carried by the EventBus
// -----------------------------------------------------------------------------
// Adding an event type means adding it here and to every visit/get_if site
// (IpcServer telemetry formatting, the service logger).
// -----------------------------------------------------------------------------
using Event = std::variant<
    PhaseTransitionEvent,
    RegimeChangeEvent,
    AdmissionDecisionEvent,
    LifecycleActionEvent,
    ProtocolChangeEvent,
    CoreHaltEvent>;

}  // namespace optguard
