#pragma once

#include "optguard/correlation/correlation_admission_controller.hpp"
#include "optguard/domain/account.hpp"
#include "optguard/domain/admission.hpp"
#include "optguard/domain/lifecycle.hpp"
#include "optguard/domain/market_data.hpp"
#include "optguard/domain/protocol.hpp"
#include "optguard/domain/risk_parameters.hpp"
#include "optguard/emergency/emergency_protocol.hpp"
#include "optguard/eventbus/event_bus.hpp"
#include "optguard/lifecycle/lifecycle_state_machine.hpp"
#include "optguard/phase/phase_manager.hpp"
#include "optguard/regime/regime_classifier.hpp"
#include "optguard/sizing/position_sizer.hpp"
#include "optguard/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace optguard {

struct SweepInstruction {
  domain::PositionId position_id;
  std::string symbol;
  domain::LifecycleAction action{domain::LifecycleAction::Hold};
  std::string reason;
};

struct SweepError {
  std::string instrument;
  domain::DataSeverity severity{domain::DataSeverity::Critical};
  std::string reason;
};

// -----------------------------------------------------------------------------
// SweepReport — result of one defensive sweep over every tracked position
// -----------------------------------------------------------------------------
// instructions holds at most one action per position: non-HOLD lifecycle
// actions in position-id order, then protocol-driven closes. A protocol
// close for a position that already has an instruction replaces it in
// place. errors lists positions (or "VIX") that could not
// be evaluated; the sweep never aborts because of one bad position.
// -----------------------------------------------------------------------------
struct SweepReport {
  domain::ProtocolDirective directive;
  std::vector<SweepInstruction> instructions;
  std::vector<SweepError> errors;
};

// -----------------------------------------------------------------------------
// DecisionCore
// -----------------------------------------------------------------------------
//
// @brief  The risk decision core: owns every decision component and is the
//         only entry point the strategy layer talks to.
//
// @details
// Components (all rebuilt from the same immutable RiskParameters):
//
//   RegimeClassifier               VIX -> regime, (phase, regime) -> max BP
//   PhaseManager                   equity -> phase, allow-lists, caps
//   PositionSizer                  fractional Kelly
//   CorrelationAdmissionController group counters and the correlation gate
//   LifecycleStateMachine          position arena and defensive rules
//   EmergencyProtocol              VIX protocol ladder
//
// Admission pipeline (first failing check wins):
//
//   1. kill switch engaged                     -> CORE_HALTED
//      account snapshot not finite / BP used outside [0, 1]
//                                              -> INVALID_ACCOUNT_SNAPSHOT
//   2. VIX resolved (may throw DataUnavailableError)
//   3. protocol blocks new entries             -> ENTRIES_BLOCKED
//   4. phase 0                                 -> BELOW_MINIMUM_PHASE
//   5. strategy not in the phase allow-list    -> STRATEGY_NOT_ALLOWED
//   6. phase max positions reached             -> PHASE_POSITION_LIMIT
//   7. buying power over the regime budget     -> BUYING_POWER_EXHAUSTED
//   8. underlying data CRITICAL or worse       -> DATA_UNAVAILABLE
//   9. duplicate position id                   -> DUPLICATE_POSITION
//  10. correlation group / equity aggregate    -> GROUP_AT_LIMIT, ...
//
// admit() runs the pipeline and, when allowed, registers the position in
// the arena and the correlation counters under the same lock, so the
// check-and-register is atomic per account.
//
// Missing data:
//   A VIX that is Unavailable at EXPECTED/WARNING severity falls back to the
//   last good reading (or throws when there is none). CRITICAL throws
//   DataUnavailableError. FATAL engages the kill switch, then throws.
//   A stale (Degraded) VIX is used by sweeps and protocol queries but is
//   CRITICAL for admission.
//   The kill switch freezes admission only: sweeps, fills and lifecycle
//   evaluation keep working so open risk is still managed.
//
// Events:
//   Decision events are queued while the lock is held and published on the
//   EventBus after it is released, so subscribers may call back into the
//   core.
//
// Thread-safety:
//   Every public method is safe to call from any thread. One mutex
//   serializes all decisions; isHalted() is lock-free.
//
// Ownership:
//   Owns its components via unique_ptr. Does not own the EventBus or the
//   time provider; both must outlive the core.
// -----------------------------------------------------------------------------
class DecisionCore {
 public:
  DecisionCore(std::shared_ptr<const domain::RiskParameters> params,
               EventBus& bus, const ITimeProvider& clock);

  DecisionCore(const DecisionCore&) = delete;
  DecisionCore& operator=(const DecisionCore&) = delete;
  DecisionCore(DecisionCore&&) = delete;
  DecisionCore& operator=(DecisionCore&&) = delete;

  // Pure query: nothing is registered.
  domain::AdmissionDecision evaluateAdmission(
      const domain::AdmissionCandidate& candidate,
      const domain::AccountSnapshot& account,
      const domain::MarketSnapshot& market);

  // Check-and-register.
  domain::AdmissionDecision admit(const domain::AdmissionCandidate& candidate,
                                  const domain::AccountSnapshot& account,
                                  const domain::MarketSnapshot& market);

  // Kelly sizing capped at min(global cap, current phase max risk). Returns
  // should_trade=false for phase 0 or a strategy outside the allow-list.
  SizingResult sizePosition(const std::string& strategy, double win_rate,
                            double avg_win, double avg_loss) const;

  // Same, using the strategy rule's win-rate and payoff priors.
  SizingResult sizePosition(const std::string& strategy) const;

  // Evaluates one position and applies the resulting state transition.
  // Throws std::out_of_range for an unknown id, DataUnavailableError when
  // the position's mark is unusable at CRITICAL severity.
  domain::LifecycleDecision evaluatePositionLifecycle(
      const domain::PositionId& id, const domain::MarketSnapshot& market);

  // Resolves a CHALLENGED position into DEFENDED (roll) or CLOSED.
  // Throws std::logic_error for any other state.
  domain::DefensePlan planDefense(
      const domain::PositionId& id,
      const std::vector<domain::OptionContract>& chain, std::int64_t now_ms);

  domain::ProtocolDirective currentProtocol(const domain::RegimeReading& reading);
  domain::ProtocolDirective currentProtocol(const domain::MarketSnapshot& market);

  void registerFill(const domain::PositionId& id,
                    const domain::FillDetails& fill);

  SweepReport sweep(const domain::MarketSnapshot& market);

  // Registers already-open positions without admission checks.
  void hydrate(const std::vector<domain::Position>& positions);

  void halt(const std::string& reason);
  bool isHalted() const { return halted_.load(); }

  // Swaps in a new validated table. Tracked positions, counters, account
  // state and the last good VIX survive the swap.
  void reloadParameters(std::shared_ptr<const domain::RiskParameters> params);

  nlohmann::json snapshotCounters() const;
  void restoreCounters(const nlohmann::json& snapshot);

  StressTestResult stressTest(const std::vector<StressPosition>& positions,
                              double vix) const;

  domain::Account account() const;
  std::vector<domain::Position> positions() const;
  CorrelationSummary correlationSummary() const;
  PhaseMetrics phaseMetrics() const;
  domain::ProtocolLevel protocolLevel() const;
  std::shared_ptr<const domain::RiskParameters> parameters() const;

 private:
  void buildComponentsLocked();

  domain::RegimeReading resolveRegimeLocked(const domain::MarketSnapshot& market,
                                            int phase, bool accept_stale = true);
  void noteRegimeLocked(const domain::RegimeReading& reading);

  domain::AdmissionDecision evaluateLocked(
      const domain::AdmissionCandidate& candidate,
      const domain::AccountSnapshot& account,
      const domain::MarketSnapshot& market);

  domain::LifecycleDecision evaluatePositionLocked(
      const domain::PositionId& id, const domain::MarketSnapshot& market);

  void transitionLocked(const domain::PositionId& id,
                        domain::LifecycleAction action,
                        domain::LifecycleState to, const std::string& reason);

  void applyProtocolClosesLocked(const domain::MarketSnapshot& market,
                                 SweepReport& report);

  void haltLocked(const std::string& reason);
  void queueEvent(Event event);
  void flushEvents();
  Timestamp now() const;

  EventBus& bus_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::shared_ptr<const domain::RiskParameters> params_;

  std::unique_ptr<RegimeClassifier> regime_;
  std::unique_ptr<PhaseManager> phase_;
  std::unique_ptr<PositionSizer> sizer_;
  std::unique_ptr<CorrelationAdmissionController> correlation_;
  std::unique_ptr<LifecycleStateMachine> lifecycle_;
  std::unique_ptr<EmergencyProtocol> emergency_;

  domain::Account account_;
  std::optional<double> last_good_vix_;
  std::optional<domain::Regime> last_regime_;
  domain::ProtocolLevel reduced_for_level_{domain::ProtocolLevel::Normal};
  bool suppress_phase_events_{false};

  std::atomic<bool> halted_{false};
  std::string halt_reason_;

  std::vector<Event> pending_events_;
};

}  // namespace optguard
