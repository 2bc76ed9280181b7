#pragma once

#include "optguard/domain/lifecycle.hpp"
#include "optguard/domain/position.hpp"
#include "optguard/domain/risk_parameters.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace optguard {

// Per-evaluation market inputs for one position.
struct LifecycleContext {
  std::int64_t now_ms{0};
  std::optional<double> underlying_price;  // Needed for assignment checks
};

// -----------------------------------------------------------------------------
// LifecycleStateMachine
// -----------------------------------------------------------------------------
//
// @brief  Arena of tracked positions plus the rule-driven evaluation that
//         decides HOLD / DEFEND / CLOSE / EMERGENCY_CLOSE for each of them.
//
// @details
// Arena:
//   Positions are owned here, keyed by PositionId. Every state change goes
//   through transition(), which enforces the edge table:
//
//     OPEN       -> CHALLENGED | CLOSED
//     CHALLENGED -> DEFENDED   | CLOSED
//     DEFENDED   -> OPEN (roll filled) | CLOSED
//     CLOSED     -> (terminal)
//
//   Anything else throws std::logic_error. Unknown ids throw
//   std::out_of_range.
//
// Evaluation (evaluate(), pure):
//   1. dte <= max(absolute_dte, rule.management_dte)  -> DEFEND,
//      escalated to EMERGENCY_CLOSE when a short option inside the
//      assignment window is in the money beyond its buffer
//   2. pnl ratio >= rule.profit_target                -> CLOSE
//   3. loss ratio >= rule.stop_loss                   -> CLOSE
//   4. otherwise                                      -> HOLD
//   The DTE rule is checked first and wins regardless of P&L. A position
//   already CHALLENGED keeps getting DEFEND until planRoll() resolves it.
//
// Strategy rules come from the data-driven table in RiskParameters; an
// unknown tag falls back to the default rule and is logged once.
//
// Thread-safety:
//   Not synchronized. DecisionCore owns the only instance and serializes
//   access under its mutex.
// -----------------------------------------------------------------------------
class LifecycleStateMachine {
 public:
  explicit LifecycleStateMachine(
      std::shared_ptr<const domain::RiskParameters> params);

  // Adds a position to the arena. Throws std::invalid_argument on a
  // duplicate id or an empty id.
  void open(domain::Position position);

  void transition(const domain::PositionId& id, domain::LifecycleState to,
                  const std::string& reason);

  void updateMark(const domain::PositionId& id, double mark);

  // Records the broker's confirmed entry price (and size when non-zero) for
  // a position admitted before its fill arrived.
  void applyOpenFill(const domain::PositionId& id, double price,
                     double quantity);

  // Moves a Defended position onto its replacement contract and back to Open.
  void applyRoll(const domain::PositionId& id,
                 const domain::OptionContract& replacement, double new_basis);

  domain::Position remove(const domain::PositionId& id);

  bool contains(const domain::PositionId& id) const;
  const domain::Position& at(const domain::PositionId& id) const;
  std::vector<domain::Position> positions() const;
  std::size_t size() const { return arena_.size(); }

  // Positions not yet in CLOSED.
  std::size_t activeCount() const;

  domain::LifecycleDecision evaluate(const domain::Position& position,
                                     const LifecycleContext& ctx) const;

  // -------------------------------------------------------------------------
  // planRoll()
  // -------------------------------------------------------------------------
  //
  // @brief  Picks a replacement contract for a Challenged position.
  //
  // @details
  // Candidates must match the underlying, right and strike and sit inside
  // [roll_min_dte, roll_max_dte]; the longest-dated one wins. When no
  // candidate qualifies, or the strategy's roll budget is spent, or the
  // position is not an option, the plan degrades to CLOSE (degraded=true)
  // and the fallback is logged.
  // -------------------------------------------------------------------------
  domain::DefensePlan planRoll(const domain::Position& position,
                               const std::vector<domain::OptionContract>& chain,
                               std::int64_t now_ms) const;

  const domain::StrategyRule& ruleFor(const std::string& strategy) const;

  int defendThreshold(const std::string& strategy) const;

  static bool isValidTransition(domain::LifecycleState from,
                                domain::LifecycleState to);

  // Whole days to expiry, floored, never negative.
  static int daysToExpiry(std::int64_t expiry_ms, std::int64_t now_ms);

  // Fraction of max profit realized (credit positions) or return on debit
  // (debit positions). Negative means a loss. 0 when the basis is unusable.
  static double pnlRatio(const domain::Position& position);

 private:
  bool assignmentRisk(const domain::Position& position, int dte,
                      const LifecycleContext& ctx) const;

  domain::Position& mutableAt(const domain::PositionId& id);

  std::shared_ptr<const domain::RiskParameters> params_;
  std::unordered_map<domain::PositionId, domain::Position> arena_;
  mutable std::set<std::string> unknown_strategies_;
};

}  // namespace optguard
