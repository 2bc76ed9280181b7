#include "optguard/lifecycle/lifecycle_state_machine.hpp"

#include "optguard/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace optguard {

namespace {

using domain::LifecycleAction;
using domain::LifecycleState;

}  // namespace

LifecycleStateMachine::LifecycleStateMachine(
    std::shared_ptr<const domain::RiskParameters> params)
    : params_(std::move(params)) {}

bool LifecycleStateMachine::isValidTransition(LifecycleState from,
                                              LifecycleState to) {
  switch (from) {
    case LifecycleState::Open:
      return to == LifecycleState::Challenged || to == LifecycleState::Closed;
    case LifecycleState::Challenged:
      return to == LifecycleState::Defended || to == LifecycleState::Closed;
    case LifecycleState::Defended:
      return to == LifecycleState::Open || to == LifecycleState::Closed;
    case LifecycleState::Closed:
      return false;
  }
  return false;
}

int LifecycleStateMachine::daysToExpiry(std::int64_t expiry_ms,
                                        std::int64_t now_ms) {
  if (expiry_ms <= now_ms) {
    return 0;
  }
  return static_cast<int>((expiry_ms - now_ms) / kMillisPerDay);
}

double LifecycleStateMachine::pnlRatio(const domain::Position& p) {
  if (!std::isfinite(p.entry_cost_basis) || p.entry_cost_basis <= 0.0 ||
      !std::isfinite(p.current_mark)) {
    return 0.0;
  }
  const double change = p.current_mark - p.entry_cost_basis;
  // Short premium profits as the mark decays.
  const double signed_change = p.quantity < 0.0 ? -change : change;
  return signed_change / p.entry_cost_basis;
}

void LifecycleStateMachine::open(domain::Position position) {
  if (position.id.empty()) {
    throw std::invalid_argument("position id must not be empty");
  }
  if (arena_.count(position.id) != 0) {
    throw std::invalid_argument("position " + position.id +
                                " is already tracked");
  }
  const auto id = position.id;
  arena_.emplace(id, std::move(position));
}

domain::Position& LifecycleStateMachine::mutableAt(
    const domain::PositionId& id) {
  auto it = arena_.find(id);
  if (it == arena_.end()) {
    throw std::out_of_range("unknown position " + id);
  }
  return it->second;
}

const domain::Position& LifecycleStateMachine::at(
    const domain::PositionId& id) const {
  auto it = arena_.find(id);
  if (it == arena_.end()) {
    throw std::out_of_range("unknown position " + id);
  }
  return it->second;
}

bool LifecycleStateMachine::contains(const domain::PositionId& id) const {
  return arena_.count(id) != 0;
}

void LifecycleStateMachine::transition(const domain::PositionId& id,
                                       LifecycleState to,
                                       const std::string& reason) {
  auto& p = mutableAt(id);
  if (!isValidTransition(p.state, to)) {
    throw std::logic_error("invalid lifecycle transition for " + id + ": " +
                           domain::toString(p.state) + " -> " +
                           domain::toString(to));
  }
  std::cout << "[Lifecycle] " << id << " " << domain::toString(p.state)
            << " -> " << domain::toString(to) << " (" << reason << ")\n";
  p.state = to;
}

void LifecycleStateMachine::updateMark(const domain::PositionId& id,
                                       double mark) {
  mutableAt(id).current_mark = mark;
}

void LifecycleStateMachine::applyOpenFill(const domain::PositionId& id,
                                          double price, double quantity) {
  auto& p = mutableAt(id);
  if (p.state != LifecycleState::Open) {
    throw std::logic_error("open fill for " + id + " in state " +
                           domain::toString(p.state) + "; expected OPEN");
  }
  p.entry_cost_basis = price;
  p.current_mark = price;
  if (quantity != 0.0) {
    p.quantity = quantity;
  }
}

void LifecycleStateMachine::applyRoll(const domain::PositionId& id,
                                      const domain::OptionContract& replacement,
                                      double new_basis) {
  auto& p = mutableAt(id);
  if (p.state != LifecycleState::Defended) {
    throw std::logic_error("roll fill for " + id + " in state " +
                           domain::toString(p.state) + "; expected DEFENDED");
  }
  p.expiry_ms = replacement.expiry_ms;
  p.strike = replacement.strike;
  p.right = replacement.right;
  p.entry_cost_basis = new_basis;
  p.current_mark = new_basis;
  ++p.roll_count;
  transition(id, LifecycleState::Open, "roll filled");
}

domain::Position LifecycleStateMachine::remove(const domain::PositionId& id) {
  auto it = arena_.find(id);
  if (it == arena_.end()) {
    throw std::out_of_range("unknown position " + id);
  }
  domain::Position p = std::move(it->second);
  arena_.erase(it);
  return p;
}

std::vector<domain::Position> LifecycleStateMachine::positions() const {
  std::vector<domain::Position> out;
  out.reserve(arena_.size());
  for (const auto& [id, p] : arena_) {
    out.push_back(p);
  }
  std::sort(out.begin(), out.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.id < b.id;
            });
  return out;
}

std::size_t LifecycleStateMachine::activeCount() const {
  return static_cast<std::size_t>(
      std::count_if(arena_.begin(), arena_.end(), [](const auto& entry) {
        return entry.second.state != LifecycleState::Closed;
      }));
}

const domain::StrategyRule& LifecycleStateMachine::ruleFor(
    const std::string& strategy) const {
  auto it = params_->strategy_rules.find(strategy);
  if (it != params_->strategy_rules.end()) {
    return it->second;
  }
  if (unknown_strategies_.insert(strategy).second) {
    std::cerr << "[Lifecycle] POLICY GAP: no rule for strategy '" << strategy
              << "'; using default rule\n";
  }
  return params_->default_strategy_rule;
}

int LifecycleStateMachine::defendThreshold(const std::string& strategy) const {
  return std::max(params_->defensive.absolute_dte,
                  ruleFor(strategy).management_dte);
}

bool LifecycleStateMachine::assignmentRisk(const domain::Position& p, int dte,
                                           const LifecycleContext& ctx) const {
  const auto& d = params_->defensive;
  if (p.quantity >= 0.0 || p.right == domain::OptionRight::None ||
      dte > d.assignment_window_dte || !ctx.underlying_price ||
      p.strike <= 0.0) {
    return false;
  }

  const double spot = *ctx.underlying_price;
  if (p.right == domain::OptionRight::Put) {
    return (p.strike - spot) / p.strike > d.put_itm_buffer;
  }
  return (spot - p.strike) / p.strike > d.call_itm_buffer;
}

domain::LifecycleDecision LifecycleStateMachine::evaluate(
    const domain::Position& p, const LifecycleContext& ctx) const {
  domain::LifecycleDecision d;
  d.next_state = p.state;

  if (p.state == LifecycleState::Closed) {
    d.reason = "close pending fill";
    return d;
  }
  if (p.state == LifecycleState::Defended) {
    d.reason = "roll pending fill";
    return d;
  }

  const auto& rule = ruleFor(p.strategy);
  const int dte = daysToExpiry(p.expiry_ms, ctx.now_ms);
  const int threshold = std::max(params_->defensive.absolute_dte,
                                 rule.management_dte);

  if (dte <= threshold) {
    if (assignmentRisk(p, dte, ctx)) {
      std::ostringstream os;
      os << "assignment risk: short " << domain::toString(p.right) << " "
         << p.strike << " ITM at " << *ctx.underlying_price << " with " << dte
         << " DTE";
      d.action = LifecycleAction::EmergencyClose;
      d.reason = os.str();
      d.next_state = LifecycleState::Closed;
      return d;
    }
    d.action = LifecycleAction::Defend;
    d.reason = std::to_string(dte) + " DTE <= " + std::to_string(threshold) +
               " DTE defensive threshold";
    d.next_state = LifecycleState::Challenged;
    return d;
  }

  const double ratio = pnlRatio(p);
  if (ratio >= rule.profit_target) {
    std::ostringstream os;
    os << "profit target reached: " << ratio * 100.0 << "% >= "
       << rule.profit_target * 100.0 << "%";
    d.action = LifecycleAction::Close;
    d.reason = os.str();
    d.next_state = LifecycleState::Closed;
    return d;
  }
  if (-ratio >= rule.stop_loss) {
    std::ostringstream os;
    os << "stop loss hit: loss " << -ratio << "x >= " << rule.stop_loss << "x";
    d.action = LifecycleAction::Close;
    d.reason = os.str();
    d.next_state = LifecycleState::Closed;
    return d;
  }

  d.reason = "within management rules";
  return d;
}

domain::DefensePlan LifecycleStateMachine::planRoll(
    const domain::Position& p, const std::vector<domain::OptionContract>& chain,
    std::int64_t now_ms) const {
  domain::DefensePlan plan;
  const auto& rule = ruleFor(p.strategy);
  const auto& d = params_->defensive;

  auto degrade = [&](const std::string& why) {
    plan.action = LifecycleAction::Close;
    plan.degraded = true;
    plan.reason = why;
    std::cerr << "[Lifecycle] DEGRADED defense for " << p.id << ": " << why
              << "; closing instead\n";
    return plan;
  };

  if (p.right == domain::OptionRight::None) {
    return degrade("not an option position");
  }
  if (p.roll_count >= rule.max_rolls) {
    return degrade("roll budget spent (" + std::to_string(p.roll_count) + "/" +
                   std::to_string(rule.max_rolls) + ")");
  }

  const domain::OptionContract* best = nullptr;
  int best_dte = -1;
  for (const auto& c : chain) {
    if (c.underlying != p.symbol || c.right != p.right ||
        std::fabs(c.strike - p.strike) > 1e-9) {
      continue;
    }
    const int dte = daysToExpiry(c.expiry_ms, now_ms);
    if (dte < d.roll_min_dte || dte > d.roll_max_dte) {
      continue;
    }
    if (dte > best_dte) {
      best = &c;
      best_dte = dte;
    }
  }

  if (best == nullptr) {
    return degrade("no " + std::to_string(d.roll_min_dte) + "-" +
                   std::to_string(d.roll_max_dte) +
                   " DTE replacement in chain");
  }

  plan.action = LifecycleAction::Roll;
  plan.replacement = *best;
  plan.reason = "roll to " + std::to_string(best_dte) + " DTE";
  return plan;
}

}  // namespace optguard
