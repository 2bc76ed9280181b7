#pragma once

#include "optguard/domain/admission.hpp"
#include "optguard/domain/regime.hpp"
#include "optguard/domain/risk_parameters.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace optguard {

struct GroupStatus {
  std::string group;
  std::string description;
  int active{0};
  int limit{0};
  double crisis_weight{0.0};
};

// Hypothetical position fed into stressTest().
struct StressPosition {
  std::string symbol;
  double value{0.0};  // Capital at risk (account currency)
};

enum class StressRiskLevel { Normal, Elevated, High, Extreme };

struct StressTestResult {
  double vix{0.0};
  double total_value{0.0};
  double loss_rate{0.0};
  double estimated_loss{0.0};
  double unprotected_loss{0.0};
  int violation_count{0};
  double protection_effectiveness{0.0};
  StressRiskLevel risk_level{StressRiskLevel::Normal};
  double risk_score{0.0};
  std::vector<std::string> recommendations;
};

struct CorrelationSummary {
  double risk_score{0.0};
  double crisis_var{0.0};
  int total_positions{0};
  std::vector<std::string> groups_used;
  std::vector<std::string> warnings;
  std::vector<std::string> opportunities;
};

// -----------------------------------------------------------------------------
// CorrelationAdmissionController
// -----------------------------------------------------------------------------
//
// @brief  Gates new positions by correlation-group concentration and keeps
//         the per-group active sets that drive the gate.
//
// @details
// Each configured group has a position-count limit chosen by the account's
// equity tier and shrunk by one (floor 1) when the regime is High or worse.
// The equity-like groups (A1 futures, A2 ETFs) additionally share an
// aggregate cap; a candidate must clear both its group limit and the
// aggregate cap.
//
// Counters are derived, never stored: each group owns the set of position
// ids registered into it, and the count is the set's size. All mutations go
// through registerPosition() / unregisterPosition() / tryAdmit(), so the
// counters cannot drift from the registered ids.
//
// Unmapped symbols (in no group) are admitted by default with a POLICY GAP
// warning and recorded in unmappedSymbols(); set
// CorrelationPolicy::reject_unmapped_symbols to deny them instead.
//
// Market context: updateMarketContext() supplies equity and regime. Until
// it has been called, every query (limits, registration warnings, statuses,
// summary, stress test) uses the minimum equity of the account phase last
// passed to canAdmit()/tryAdmit(), starting from the lowest configured
// phase.
//
// Thread-safety:
//   Every public method locks mutex_. tryAdmit() performs check-and-register
//   under one lock, so two concurrent admissions can never both take the
//   last slot of a group.
// -----------------------------------------------------------------------------
class CorrelationAdmissionController {
 public:
  explicit CorrelationAdmissionController(
      std::shared_ptr<const domain::RiskParameters> params);

  CorrelationAdmissionController(const CorrelationAdmissionController&) = delete;
  CorrelationAdmissionController& operator=(
      const CorrelationAdmissionController&) = delete;

  void updateMarketContext(double equity, domain::Regime regime);

  std::optional<std::string> groupOf(const std::string& symbol) const;

  // Current limit for `group` under the current equity tier and regime.
  int limitFor(const std::string& group) const;

  domain::AdmissionDecision canAdmit(const std::string& symbol,
                                     int account_phase) const;

  domain::AdmissionDecision tryAdmit(const domain::PositionId& id,
                                     const std::string& symbol,
                                     int account_phase);

  // Unconditional; used for hydration of already-open positions. Returns
  // false when the id is already registered.
  bool registerPosition(const domain::PositionId& id, const std::string& symbol);

  bool unregisterPosition(const domain::PositionId& id);

  int activeCount(const std::string& group) const;
  int totalPositions() const;
  std::vector<GroupStatus> groupStatuses() const;
  std::vector<std::string> unmappedSymbols() const;

  // 0..100 concentration score of the live portfolio.
  double riskScore() const;

  StressTestResult stressTest(const std::vector<StressPosition>& positions,
                              double vix) const;

  CorrelationSummary summary() const;

  // Crisis loss estimate in position-value units: 5% per position scaled by
  // |crisis weight|, discounted 10% per extra group (up to 3).
  double crisisVaR() const;

  nlohmann::json snapshot() const;

  // Throws std::invalid_argument on a malformed snapshot.
  void restore(const nlohmann::json& snapshot);

 private:
  using GroupCounts = std::map<std::string, int>;

  const domain::CorrelationGroupDefinition* groupDefinition(
      const std::string& group) const;

  double tierEquityLocked() const;
  int limitForLocked(const std::string& group, double equity,
                     domain::Regime regime) const;
  domain::AdmissionDecision evaluateLocked(const std::string& symbol,
                                           int account_phase) const;
  bool registerLocked(const domain::PositionId& id, const std::string& symbol);
  GroupCounts countsLocked() const;
  bool isEquityLike(const std::string& group) const;

  double scoreFor(const GroupCounts& counts, int total) const;
  double varFor(const GroupCounts& counts) const;

  std::shared_ptr<const domain::RiskParameters> params_;
  std::unordered_map<std::string, std::string> symbol_to_group_;

  mutable std::mutex mutex_;
  bool has_context_{false};
  mutable int context_phase_{0};  // Tier source until a context arrives
  double equity_{0.0};
  domain::Regime regime_{domain::Regime::Normal};

  std::map<std::string, std::set<domain::PositionId>> active_;
  std::set<domain::PositionId> ungrouped_;
  std::unordered_map<domain::PositionId, std::string> position_symbols_;
  mutable std::set<std::string> unmapped_seen_;
};

const char* toString(StressRiskLevel level);

}  // namespace optguard
