#pragma once

#include "optguard/domain/position.hpp"

#include <cstdint>
#include <string>

namespace optguard {
namespace domain {

// -----------------------------------------------------------------------------
// AdmissionReason — machine-readable outcome of an admission query
// -----------------------------------------------------------------------------
enum class AdmissionReason {
  Allowed,
  AllowedUnmapped,         // Admitted, but symbol is in no correlation group
  GroupAtLimit,
  EquityAggregateAtLimit,
  UnmappedRejected,        // reject_unmapped_symbols policy is on
  PhasePositionLimit,
  StrategyNotAllowed,
  BelowMinimumPhase,
  BuyingPowerExhausted,
  EntriesBlocked,          // Emergency protocol forbids new entries
  DataUnavailable,
  DuplicatePosition,
  InvalidAccountSnapshot,  // Non-finite equity, BP used outside [0, 1]
  CoreHalted
};

// -----------------------------------------------------------------------------
// AdmissionDecision
// -----------------------------------------------------------------------------
//
// @brief  Result of every admission query. Denial is a normal value.
//
// @details
// For correlation denials `group`, `current_count` and `limit` name the
// exact group and its occupancy so the caller can report it verbatim. For
// the equity-like aggregate denial `group` holds the aggregate rule name
// (e.g. "A1+A2").
// -----------------------------------------------------------------------------
struct AdmissionDecision {
  bool allowed{false};
  AdmissionReason code{AdmissionReason::CoreHalted};
  std::string reason;
  std::string group;
  int current_count{0};
  int limit{0};
};

// A proposed new position handed to the admission path.
struct AdmissionCandidate {
  PositionId position_id;
  std::string symbol;
  std::string strategy;
  double bp_required{0.0};  // Fraction of equity; 0 -> strategy rule default
  std::int64_t expiry_ms{0};
  double strike{0.0};
  OptionRight right{OptionRight::None};
  double quantity{0.0};
  double entry_cost_basis{0.0};
};

inline const char* toString(AdmissionReason r) {
  switch (r) {
    case AdmissionReason::Allowed:                return "ALLOWED";
    case AdmissionReason::AllowedUnmapped:        return "ALLOWED_UNMAPPED";
    case AdmissionReason::GroupAtLimit:           return "GROUP_AT_LIMIT";
    case AdmissionReason::EquityAggregateAtLimit: return "EQUITY_AGGREGATE_AT_LIMIT";
    case AdmissionReason::UnmappedRejected:       return "UNMAPPED_REJECTED";
    case AdmissionReason::PhasePositionLimit:     return "PHASE_POSITION_LIMIT";
    case AdmissionReason::StrategyNotAllowed:     return "STRATEGY_NOT_ALLOWED";
    case AdmissionReason::BelowMinimumPhase:      return "BELOW_MINIMUM_PHASE";
    case AdmissionReason::BuyingPowerExhausted:   return "BUYING_POWER_EXHAUSTED";
    case AdmissionReason::EntriesBlocked:         return "ENTRIES_BLOCKED";
    case AdmissionReason::DataUnavailable:        return "DATA_UNAVAILABLE";
    case AdmissionReason::DuplicatePosition:      return "DUPLICATE_POSITION";
    case AdmissionReason::InvalidAccountSnapshot: return "INVALID_ACCOUNT_SNAPSHOT";
    case AdmissionReason::CoreHalted:             return "CORE_HALTED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace optguard
