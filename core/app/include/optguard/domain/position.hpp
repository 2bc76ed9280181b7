#pragma once

#include <cstdint>
#include <string>

namespace optguard {
namespace domain {

using PositionId = std::string;

// -----------------------------------------------------------------------------
// LifecycleState — where a tracked position sits in its defensive lifecycle
// -----------------------------------------------------------------------------
//
//   Open        normal management (profit target / stop loss watch)
//   Challenged  inside the defensive DTE window; a defense must be chosen
//   Defended    roll submitted; waiting for the roll fill
//   Closed      close decided; waiting for the close fill to untrack it
//
// Closed is terminal. The only way back to Open is a confirmed roll fill
// out of Defended.
// -----------------------------------------------------------------------------
enum class LifecycleState { Open, Challenged, Defended, Closed };

enum class OptionRight { None, Call, Put };

// -----------------------------------------------------------------------------
// Position — one tracked options (or futures) position
// -----------------------------------------------------------------------------
//
// @brief  Plain data record owned by the LifecycleStateMachine arena and
//         addressed everywhere else by PositionId.
//
// @details
// Sign convention:
//   quantity < 0  short / credit position (entry_cost_basis = credit received)
//   quantity > 0  long / debit position   (entry_cost_basis = debit paid)
//
// entry_cost_basis and current_mark are per-unit prices and always >= 0.
// P&L ratios are computed relative to entry_cost_basis, so a short position
// whose mark decays from 2.00 to 1.00 is at +50% of max profit.
//
// correlation_group is filled in by the admission path (empty when the
// symbol belongs to no configured group).
// -----------------------------------------------------------------------------
struct Position {
  PositionId id;
  std::string symbol;        // Underlying symbol (e.g. "SPY", "ES")
  std::string strategy;      // Strategy tag (e.g. "LONG_TERM_112")
  std::int64_t entry_time_ms{0};
  std::int64_t expiry_ms{0};
  double entry_cost_basis{0.0};
  double current_mark{0.0};
  double quantity{0.0};
  double strike{0.0};
  OptionRight right{OptionRight::None};
  std::string correlation_group;
  LifecycleState state{LifecycleState::Open};
  int roll_count{0};
};

inline const char* toString(LifecycleState s) {
  switch (s) {
    case LifecycleState::Open:       return "OPEN";
    case LifecycleState::Challenged: return "CHALLENGED";
    case LifecycleState::Defended:   return "DEFENDED";
    case LifecycleState::Closed:     return "CLOSED";
  }
  return "UNKNOWN";
}

inline const char* toString(OptionRight r) {
  switch (r) {
    case OptionRight::None: return "NONE";
    case OptionRight::Call: return "CALL";
    case OptionRight::Put:  return "PUT";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace optguard
