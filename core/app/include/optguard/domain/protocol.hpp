#pragma once

#include <string>
#include <vector>

namespace optguard {
namespace domain {

// Ordered: comparisons with < / > express "escalation".
enum class ProtocolLevel { Normal = 0, Preventive = 1, Elevated = 2, Emergency = 3 };

// -----------------------------------------------------------------------------
// ProtocolDirective — what the rest of the core must do under the current
// protocol level
// -----------------------------------------------------------------------------
//
//   bp_headroom_multiplier      scales the regime BP limit (1.0 = unchanged)
//   block_new_entries           admission denies everything with ENTRIES_BLOCKED
//   exposure_reduction          fraction of open positions to close on entry
//                               into this level (0 = none)
//   close_same_day_expirations  EMERGENCY_CLOSE every position expiring today
//   critical_alert              operator must be paged
// -----------------------------------------------------------------------------
struct ProtocolDirective {
  ProtocolLevel level{ProtocolLevel::Normal};
  double vix{0.0};
  double bp_headroom_multiplier{1.0};
  bool block_new_entries{false};
  double exposure_reduction{0.0};
  bool close_same_day_expirations{false};
  bool critical_alert{false};
  bool spike_detected{false};
  std::vector<std::string> actions;
};

inline const char* toString(ProtocolLevel l) {
  switch (l) {
    case ProtocolLevel::Normal:     return "NORMAL";
    case ProtocolLevel::Preventive: return "PREVENTIVE";
    case ProtocolLevel::Elevated:   return "ELEVATED";
    case ProtocolLevel::Emergency:  return "EMERGENCY";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace optguard
