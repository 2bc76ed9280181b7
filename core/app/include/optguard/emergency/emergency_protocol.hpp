#pragma once

#include "optguard/domain/protocol.hpp"
#include "optguard/domain/regime.hpp"
#include "optguard/domain/risk_parameters.hpp"

#include <deque>
#include <functional>

namespace optguard {

// -----------------------------------------------------------------------------
// EmergencyProtocol
// -----------------------------------------------------------------------------
//
// @brief  Escalating protocol ladder NORMAL -> PREVENTIVE -> ELEVATED ->
//         EMERGENCY driven by the VIX reading.
//
// @details
// Level selection (thresholds are inclusive lower bounds):
//
//   vix >= emergency_vix   EMERGENCY
//   vix >= elevated_vix    ELEVATED
//   vix >= preventive_vix  PREVENTIVE
//   otherwise              NORMAL
//
// Spike override: when the reading is above spike_floor_vix and has risen by
// at least spike_rise_fraction versus the reading spike_lookback ticks
// earlier, the level jumps straight to EMERGENCY.
//
// The protocol de-escalates as soon as the reading falls back below a
// threshold; there is no hysteresis.
//
// evaluate() is the per-tick entry point: it records the reading in the
// spike history, moves the current level and fires the change callback on
// every level change. assess() answers "what would the directive be" for a
// reading without touching any state.
//
// Thread-safety:
//   Not synchronized; owned and serialized by DecisionCore.
// -----------------------------------------------------------------------------
class EmergencyProtocol {
 public:
  using ChangeCallback =
      std::function<void(domain::ProtocolLevel from, domain::ProtocolLevel to,
                          const domain::ProtocolDirective& directive)>;

  explicit EmergencyProtocol(domain::EmergencyPolicy policy,
                             ChangeCallback on_change = {});

  domain::ProtocolDirective evaluate(const domain::RegimeReading& reading);

  domain::ProtocolDirective assess(const domain::RegimeReading& reading) const;

  // Takes over the level and spike history of the protocol being replaced on
  // a parameter reload. The directive is rebuilt under this policy; no change
  // callback fires.
  void adoptStateFrom(const EmergencyProtocol& previous);

  domain::ProtocolLevel currentLevel() const { return current_.level; }
  const domain::ProtocolDirective& currentDirective() const { return current_; }

  static domain::ProtocolLevel levelFor(const domain::EmergencyPolicy& policy,
                                        double vix);

  domain::ProtocolDirective directiveFor(domain::ProtocolLevel level, double vix,
                                         bool spike) const;

 private:
  bool isSpike(double vix) const;

  domain::EmergencyPolicy policy_;
  ChangeCallback on_change_;
  std::deque<double> history_;  // Previous readings, oldest first
  domain::ProtocolDirective current_;
};

}  // namespace optguard
