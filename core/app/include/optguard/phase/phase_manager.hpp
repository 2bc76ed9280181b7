#pragma once

#include "optguard/domain/risk_parameters.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace optguard {

constexpr int kBelowMinimumPhase = 0;

// Snapshot of the limits attached to one phase.
struct PhaseInfo {
  int phase{kBelowMinimumPhase};
  double min_equity{0.0};
  double max_equity{0.0};  // Next phase's threshold, +inf for the top phase
  int max_positions{0};
  double max_risk_per_trade{0.0};
  int default_units{0};
  double monthly_target{0.0};
  std::vector<std::string> allowed_strategies;
  std::string description;
};

// Progress report for the operator dashboard.
struct PhaseMetrics {
  PhaseInfo info;
  double equity{0.0};
  double progress_to_next{0.0};  // Percent of the way to the next threshold
  double equity_to_next{0.0};    // 0 in the top phase
};

// -----------------------------------------------------------------------------
// PhaseManager
// -----------------------------------------------------------------------------
//
// @brief  Maps account equity to a phase (0..N) and answers the phase-gated
//         questions: which strategies, how many units, how much risk.
//
// @details
// phaseFor() is a pure, non-decreasing step function of equity. update()
// additionally caches the result as the current phase and fires the
// transition callback (and logs) whenever the cached phase changes.
// Non-finite equity maps to phase 0.
//
// Thread-safety:
//   Not internally synchronized. DecisionCore serializes all access under
//   its own mutex.
// -----------------------------------------------------------------------------
class PhaseManager {
 public:
  using TransitionCallback =
      std::function<void(int from_phase, int to_phase, double equity)>;

  explicit PhaseManager(std::shared_ptr<const domain::RiskParameters> params,
                        TransitionCallback on_transition = {});

  int phaseFor(double equity) const;

  PhaseInfo infoFor(int phase) const;

  int update(double equity);

  int currentPhase() const { return current_phase_; }
  double currentEquity() const { return current_equity_; }

  bool isStrategyAllowed(const std::string& strategy) const;
  bool isStrategyAllowed(int phase, const std::string& strategy) const;

  // -------------------------------------------------------------------------
  // calculatePositionSize()
  // -------------------------------------------------------------------------
  //
  // @brief  Number of units for a new position in the current phase.
  //
  // @param  strategy     Strategy tag; 0 when the phase does not allow it.
  // @param  risk_amount  Money at risk per unit (> 0).
  //
  // @return min(phase default units,
  //             floor(equity * max_risk_per_trade / risk_amount)).
  //         0 for phase 0, a disallowed strategy or a non-positive amount.
  // -------------------------------------------------------------------------
  int calculatePositionSize(const std::string& strategy,
                            double risk_amount) const;

  // Caps a requested per-trade risk fraction at the global and phase ceilings.
  double applyRiskCap(double risk_fraction) const;

  PhaseMetrics metrics() const;

 private:
  const domain::PhaseDefinition* definitionFor(int phase) const;

  std::shared_ptr<const domain::RiskParameters> params_;
  TransitionCallback on_transition_;

  int current_phase_{kBelowMinimumPhase};
  double current_equity_{0.0};
};

}  // namespace optguard
