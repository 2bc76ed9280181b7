#pragma once

#include "optguard/domain/admission.hpp"
#include "optguard/domain/lifecycle.hpp"
#include "optguard/domain/position.hpp"
#include "optguard/domain/protocol.hpp"
#include "optguard/domain/regime.hpp"
#include "optguard/events/event_types.hpp"

#include <string>

namespace optguard {

// -----------------------------------------------------------------------------
// Decision events
// -----------------------------------------------------------------------------
//
// @brief  Observability records published by DecisionCore on its EventBus
//         whenever a decision changes something an operator cares about.
//
// @details
// These are edge notifications only. No component reacts to them for its
// own behavior; state is always re-queried from DecisionCore. In service
// mode they are forwarded to the telemetry PUB socket as JSON.
//
// All are plain value types, safe to copy across threads inside Event.
// -----------------------------------------------------------------------------

struct PhaseTransitionEvent {
  int from_phase{0};
  int to_phase{0};
  double equity{0.0};
  Timestamp timestamp{};
};

struct RegimeChangeEvent {
  domain::Regime from{domain::Regime::Normal};
  domain::Regime to{domain::Regime::Normal};
  double vix{0.0};
  Timestamp timestamp{};
};

struct AdmissionDecisionEvent {
  domain::PositionId position_id;
  std::string symbol;
  std::string strategy;
  domain::AdmissionDecision decision;
  Timestamp timestamp{};
};

struct LifecycleActionEvent {
  domain::PositionId position_id;
  std::string symbol;
  domain::LifecycleAction action{domain::LifecycleAction::Hold};
  domain::LifecycleState from_state{domain::LifecycleState::Open};
  domain::LifecycleState to_state{domain::LifecycleState::Open};
  std::string reason;
  Timestamp timestamp{};
};

struct ProtocolChangeEvent {
  domain::ProtocolLevel from{domain::ProtocolLevel::Normal};
  domain::ProtocolLevel to{domain::ProtocolLevel::Normal};
  domain::ProtocolDirective directive;
  Timestamp timestamp{};
};

// Kill switch engaged: admission is frozen until restart.
struct CoreHaltEvent {
  std::string reason;
  Timestamp timestamp{};
};

}  // namespace optguard
