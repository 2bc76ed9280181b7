#pragma once

#include "optguard/domain/position.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace optguard {
namespace domain {

enum class LifecycleAction { Hold, Defend, Roll, Close, EmergencyClose };

// Outcome of evaluating one position. next_state == current state for Hold.
struct LifecycleDecision {
  LifecycleAction action{LifecycleAction::Hold};
  std::string reason;
  LifecycleState next_state{LifecycleState::Open};
};

// One listed option contract, as offered in a chain for roll planning.
struct OptionContract {
  std::string underlying;
  std::int64_t expiry_ms{0};
  double strike{0.0};
  OptionRight right{OptionRight::None};
  double mark{0.0};
};

// -----------------------------------------------------------------------------
// DefensePlan — what to do with a Challenged position
// -----------------------------------------------------------------------------
// action is Roll (replacement set) or Close. degraded is true when a roll
// was wanted but no acceptable replacement existed.
// -----------------------------------------------------------------------------
struct DefensePlan {
  LifecycleAction action{LifecycleAction::Close};
  std::optional<OptionContract> replacement;
  std::string reason;
  bool degraded{false};
};

enum class FillKind { Open, Close, Roll };

// Broker fill confirmation fed back into the core via registerFill().
struct FillDetails {
  FillKind kind{FillKind::Open};
  double price{0.0};
  double quantity{0.0};
  std::optional<OptionContract> new_contract;  // Required for Roll
};

inline const char* toString(LifecycleAction a) {
  switch (a) {
    case LifecycleAction::Hold:           return "HOLD";
    case LifecycleAction::Defend:         return "DEFEND";
    case LifecycleAction::Roll:           return "ROLL";
    case LifecycleAction::Close:          return "CLOSE";
    case LifecycleAction::EmergencyClose: return "EMERGENCY_CLOSE";
  }
  return "UNKNOWN";
}

inline const char* toString(FillKind k) {
  switch (k) {
    case FillKind::Open:  return "OPEN";
    case FillKind::Close: return "CLOSE";
    case FillKind::Roll:  return "ROLL";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace optguard
