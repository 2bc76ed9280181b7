#include "optguard/correlation/correlation_admission_controller.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace optguard {

namespace {

constexpr double kGroupScoreScale = 50.0;
constexpr double kEquityShareScale = 30.0;
constexpr double kDiversifiedDiscount = 0.8;   // Applied above 3 groups
constexpr double kVarPerPosition = 0.05;
constexpr double kVarGroupDiscount = 0.10;
constexpr double kBaseCrisisLoss = 0.15;
constexpr double kLossPerViolation = 0.05;
constexpr double kMaxViolationLoss = 0.20;
constexpr double kMaxVixLoss = 0.15;
constexpr double kVixLossFloor = 15.0;
constexpr double kBaseEffectiveness = 0.532;
constexpr double kEffectivenessPerViolation = 0.10;
constexpr double kOpportunityMaxWeight = 0.5;

}  // namespace

const char* toString(StressRiskLevel level) {
  switch (level) {
    case StressRiskLevel::Normal:   return "NORMAL";
    case StressRiskLevel::Elevated: return "ELEVATED";
    case StressRiskLevel::High:     return "HIGH";
    case StressRiskLevel::Extreme:  return "EXTREME";
  }
  return "UNKNOWN";
}

CorrelationAdmissionController::CorrelationAdmissionController(
    std::shared_ptr<const domain::RiskParameters> params)
    : params_(std::move(params)) {
  if (!params_->phases.empty()) {
    context_phase_ = params_->phases.front().phase;
  }
  for (const auto& g : params_->correlation.groups) {
    active_[g.id];
    for (const auto& s : g.symbols) {
      symbol_to_group_[s] = g.id;
    }
  }
}

void CorrelationAdmissionController::updateMarketContext(double equity,
                                                         domain::Regime regime) {
  std::lock_guard lock(mutex_);
  has_context_ = true;
  equity_ = equity;
  regime_ = regime;
}

std::optional<std::string> CorrelationAdmissionController::groupOf(
    const std::string& symbol) const {
  auto it = symbol_to_group_.find(symbol);
  if (it == symbol_to_group_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const domain::CorrelationGroupDefinition*
CorrelationAdmissionController::groupDefinition(const std::string& group) const {
  for (const auto& g : params_->correlation.groups) {
    if (g.id == group) {
      return &g;
    }
  }
  return nullptr;
}

bool CorrelationAdmissionController::isEquityLike(
    const std::string& group) const {
  const auto& groups = params_->correlation.equity_aggregate.groups;
  return std::find(groups.begin(), groups.end(), group) != groups.end();
}

double CorrelationAdmissionController::tierEquityLocked() const {
  if (has_context_) {
    return equity_;
  }
  for (const auto& def : params_->phases) {
    if (def.phase == context_phase_) {
      return def.min_equity;
    }
  }
  return 0.0;
}

int CorrelationAdmissionController::limitForLocked(const std::string& group,
                                                   double equity,
                                                   domain::Regime regime) const {
  const auto& policy = params_->correlation;

  const domain::EquityTier* tier = &policy.tiers.back();
  for (const auto& t : policy.tiers) {
    if (equity < t.max_equity) {
      tier = &t;
      break;
    }
  }

  int limit = tier->default_limit;
  if (auto it = tier->group_limits.find(group); it != tier->group_limits.end()) {
    limit = it->second;
  }
  if (regime >= domain::Regime::High) {
    limit = std::max(1, limit - policy.high_regime_reduction);
  }
  return limit;
}

int CorrelationAdmissionController::limitFor(const std::string& group) const {
  std::lock_guard lock(mutex_);
  return limitForLocked(group, tierEquityLocked(), regime_);
}

domain::AdmissionDecision CorrelationAdmissionController::evaluateLocked(
    const std::string& symbol, int account_phase) const {
  using domain::AdmissionReason;
  domain::AdmissionDecision d;

  auto group = groupOf(symbol);
  if (!group) {
    unmapped_seen_.insert(symbol);
    if (params_->correlation.reject_unmapped_symbols) {
      d.allowed = false;
      d.code = AdmissionReason::UnmappedRejected;
      d.reason = symbol + " is not in any correlation group";
      return d;
    }
    std::cerr << "[CorrelationAdmission] POLICY GAP: " << symbol
              << " is not in any correlation group; admitted without a "
                 "group limit\n";
    d.allowed = true;
    d.code = AdmissionReason::AllowedUnmapped;
    d.reason = symbol + " admitted without correlation limit (unmapped)";
    d.current_count = static_cast<int>(ungrouped_.size());
    return d;
  }

  if (!has_context_) {
    context_phase_ = account_phase;
  }
  const double equity = tierEquityLocked();
  const int current = static_cast<int>(active_.at(*group).size());
  const int limit = limitForLocked(*group, equity, regime_);
  d.group = *group;
  d.current_count = current;
  d.limit = limit;

  if (current >= limit) {
    const auto* def = groupDefinition(*group);
    std::ostringstream os;
    os << "correlation group " << *group;
    if (def != nullptr && !def->description.empty()) {
      os << " (" << def->description << ")";
    }
    os << " at limit: " << current << "/" << limit << " positions";
    d.allowed = false;
    d.code = AdmissionReason::GroupAtLimit;
    d.reason = os.str();
    return d;
  }

  if (isEquityLike(*group)) {
    const auto& rule = params_->correlation.equity_aggregate;
    int aggregate = 0;
    for (const auto& g : rule.groups) {
      aggregate += static_cast<int>(active_.at(g).size());
    }
    if (aggregate >= rule.cap) {
      std::ostringstream os;
      os << "equity-like aggregate " << rule.name << " at limit: " << aggregate
         << "/" << rule.cap << " positions";
      d.allowed = false;
      d.code = AdmissionReason::EquityAggregateAtLimit;
      d.group = rule.name;
      d.current_count = aggregate;
      d.limit = rule.cap;
      d.reason = os.str();
      return d;
    }
  }

  d.allowed = true;
  d.code = AdmissionReason::Allowed;
  d.reason = symbol + " admitted into " + *group + " (" +
             std::to_string(current + 1) + "/" + std::to_string(limit) + ")";
  return d;
}

domain::AdmissionDecision CorrelationAdmissionController::canAdmit(
    const std::string& symbol, int account_phase) const {
  std::lock_guard lock(mutex_);
  return evaluateLocked(symbol, account_phase);
}

domain::AdmissionDecision CorrelationAdmissionController::tryAdmit(
    const domain::PositionId& id, const std::string& symbol,
    int account_phase) {
  std::lock_guard lock(mutex_);

  if (position_symbols_.count(id) != 0) {
    domain::AdmissionDecision d;
    d.code = domain::AdmissionReason::DuplicatePosition;
    d.reason = "position " + id + " is already registered";
    return d;
  }

  auto decision = evaluateLocked(symbol, account_phase);
  if (decision.allowed) {
    registerLocked(id, symbol);
  } else {
    std::cerr << "[CorrelationAdmission] denied " << id << " " << symbol
              << ": " << decision.reason << "\n";
  }
  return decision;
}

bool CorrelationAdmissionController::registerLocked(
    const domain::PositionId& id, const std::string& symbol) {
  if (!position_symbols_.emplace(id, symbol).second) {
    return false;
  }
  if (auto group = groupOf(symbol)) {
    active_[*group].insert(id);
  } else {
    ungrouped_.insert(id);
    unmapped_seen_.insert(symbol);
  }
  return true;
}

bool CorrelationAdmissionController::registerPosition(
    const domain::PositionId& id, const std::string& symbol) {
  std::lock_guard lock(mutex_);
  const bool added = registerLocked(id, symbol);
  if (!added) {
    return false;
  }

  if (auto group = groupOf(symbol)) {
    const int count = static_cast<int>(active_[*group].size());
    const int limit = limitForLocked(*group, tierEquityLocked(), regime_);
    if (count > limit) {
      std::cerr << "[CorrelationAdmission] registered " << id << " (" << symbol
                << ") over limit: " << *group << " " << count << "/" << limit
                << "\n";
    }
  }
  return true;
}

bool CorrelationAdmissionController::unregisterPosition(
    const domain::PositionId& id) {
  std::lock_guard lock(mutex_);
  auto it = position_symbols_.find(id);
  if (it == position_symbols_.end()) {
    return false;
  }
  if (auto group = groupOf(it->second)) {
    active_[*group].erase(id);
  } else {
    ungrouped_.erase(id);
  }
  position_symbols_.erase(it);
  return true;
}

int CorrelationAdmissionController::activeCount(const std::string& group) const {
  std::lock_guard lock(mutex_);
  auto it = active_.find(group);
  return it == active_.end() ? 0 : static_cast<int>(it->second.size());
}

int CorrelationAdmissionController::totalPositions() const {
  std::lock_guard lock(mutex_);
  return static_cast<int>(position_symbols_.size());
}

std::vector<GroupStatus> CorrelationAdmissionController::groupStatuses() const {
  std::lock_guard lock(mutex_);
  std::vector<GroupStatus> out;
  out.reserve(params_->correlation.groups.size());
  for (const auto& g : params_->correlation.groups) {
    GroupStatus s;
    s.group = g.id;
    s.description = g.description;
    s.active = static_cast<int>(active_.at(g.id).size());
    s.limit = limitForLocked(g.id, tierEquityLocked(), regime_);
    s.crisis_weight = g.crisis_weight;
    out.push_back(std::move(s));
  }
  return out;
}

std::vector<std::string> CorrelationAdmissionController::unmappedSymbols() const {
  std::lock_guard lock(mutex_);
  return {unmapped_seen_.begin(), unmapped_seen_.end()};
}

CorrelationAdmissionController::GroupCounts
CorrelationAdmissionController::countsLocked() const {
  GroupCounts counts;
  for (const auto& [group, ids] : active_) {
    if (!ids.empty()) {
      counts[group] = static_cast<int>(ids.size());
    }
  }
  return counts;
}

// -----------------------------------------------------------------------------
// Score: sum over groups of share * |w| * 50, plus equity-like share * 30,
// discounted 20% when more than three groups are in use. Ungrouped positions
// dilute the shares but contribute nothing themselves.
// -----------------------------------------------------------------------------
double CorrelationAdmissionController::scoreFor(const GroupCounts& counts,
                                                int total) const {
  if (total <= 0) {
    return 0.0;
  }

  double score = 0.0;
  int equity_like = 0;
  for (const auto& [group, count] : counts) {
    const double share = static_cast<double>(count) / total;
    if (const auto* def = groupDefinition(group)) {
      score += share * std::fabs(def->crisis_weight) * kGroupScoreScale;
    }
    if (isEquityLike(group)) {
      equity_like += count;
    }
  }
  score += static_cast<double>(equity_like) / total * kEquityShareScale;

  if (counts.size() > 3) {
    score *= kDiversifiedDiscount;
  }
  return std::clamp(score, 0.0, 100.0);
}

double CorrelationAdmissionController::riskScore() const {
  std::lock_guard lock(mutex_);
  return scoreFor(countsLocked(), static_cast<int>(position_symbols_.size()));
}

double CorrelationAdmissionController::varFor(const GroupCounts& counts) const {
  double var = 0.0;
  for (const auto& [group, count] : counts) {
    if (const auto* def = groupDefinition(group)) {
      var += kVarPerPosition * count * std::fabs(def->crisis_weight);
    }
  }
  const int extra_groups =
      std::min(std::max(static_cast<int>(counts.size()) - 1, 0), 3);
  return var * (1.0 - kVarGroupDiscount * extra_groups);
}

double CorrelationAdmissionController::crisisVaR() const {
  std::lock_guard lock(mutex_);
  return varFor(countsLocked());
}

// -----------------------------------------------------------------------------
// stressTest()
// -----------------------------------------------------------------------------
// Counts the scenario per group, compares against the limits that would
// apply under a VeryHigh regime, and derives a bounded loss estimate:
//
//   loss_rate = 0.15 + min(0.05 * violations, 0.20)
//                    + min((vix - 15) / 100, 0.15)        (<= 0.50)
//   effectiveness = max(0, 0.532 - 0.10 * violations)
//
// The unprotected loss is the whole scenario value.
// -----------------------------------------------------------------------------
StressTestResult CorrelationAdmissionController::stressTest(
    const std::vector<StressPosition>& positions, double vix) const {
  std::lock_guard lock(mutex_);

  StressTestResult r;
  r.vix = vix;

  GroupCounts counts;
  for (const auto& p : positions) {
    r.total_value += std::fabs(p.value);
    if (auto group = groupOf(p.symbol)) {
      ++counts[*group];
    }
  }

  const double equity = tierEquityLocked();
  int equity_like = 0;
  for (const auto& [group, count] : counts) {
    const int crisis_limit =
        limitForLocked(group, equity, domain::Regime::VeryHigh);
    if (count > crisis_limit) {
      r.violation_count += count - crisis_limit;
      r.recommendations.push_back("Reduce " + group + " from " +
                                  std::to_string(count) + " to " +
                                  std::to_string(crisis_limit) +
                                  " positions before a volatility spike");
    }
    if (isEquityLike(group)) {
      equity_like += count;
    }
  }

  const auto& rule = params_->correlation.equity_aggregate;
  if (equity_like > rule.cap) {
    r.violation_count += equity_like - rule.cap;
    r.recommendations.push_back("Equity-like exposure " +
                                std::to_string(equity_like) + " exceeds " +
                                rule.name + " cap of " +
                                std::to_string(rule.cap));
  }

  const double vix_term =
      std::isfinite(vix) ? std::clamp((vix - kVixLossFloor) / 100.0, 0.0,
                                      kMaxVixLoss)
                         : kMaxVixLoss;
  r.loss_rate = kBaseCrisisLoss +
                std::min(kLossPerViolation * r.violation_count,
                         kMaxViolationLoss) +
                vix_term;
  r.estimated_loss = r.total_value * r.loss_rate;
  r.unprotected_loss = r.total_value;
  r.protection_effectiveness = std::max(
      0.0, kBaseEffectiveness - kEffectivenessPerViolation * r.violation_count);

  if (r.violation_count >= 3 || r.protection_effectiveness < 0.30) {
    r.risk_level = StressRiskLevel::Extreme;
  } else if (r.violation_count >= 2 || r.protection_effectiveness < 0.40) {
    r.risk_level = StressRiskLevel::High;
  } else if (r.violation_count >= 1 || r.protection_effectiveness < 0.50) {
    r.risk_level = StressRiskLevel::Elevated;
  } else {
    r.risk_level = StressRiskLevel::Normal;
  }

  r.risk_score = scoreFor(counts, static_cast<int>(positions.size()));

  if (r.risk_level == StressRiskLevel::Extreme) {
    r.recommendations.push_back(
        "Extreme concentration: block new entries and prepare emergency "
        "exposure reduction");
  }
  return r;
}

CorrelationSummary CorrelationAdmissionController::summary() const {
  std::lock_guard lock(mutex_);

  CorrelationSummary s;
  const auto counts = countsLocked();
  s.total_positions = static_cast<int>(position_symbols_.size());
  s.risk_score = scoreFor(counts, s.total_positions);
  s.crisis_var = varFor(counts);

  for (const auto& [group, count] : counts) {
    s.groups_used.push_back(group);
    const int limit = limitForLocked(group, tierEquityLocked(), regime_);
    if (count >= limit) {
      s.warnings.push_back(group + " at capacity (" + std::to_string(count) +
                           "/" + std::to_string(limit) + ")");
    }
  }
  if (s.risk_score > params_->correlation.risk_score_warning) {
    std::ostringstream os;
    os << "correlation risk score " << s.risk_score << " above "
       << params_->correlation.risk_score_warning;
    s.warnings.push_back(os.str());
  }
  for (const auto& symbol : unmapped_seen_) {
    s.warnings.push_back("POLICY GAP: " + symbol +
                         " is not in any correlation group");
  }

  for (const auto& g : params_->correlation.groups) {
    if (counts.count(g.id) == 0 &&
        std::fabs(g.crisis_weight) <= kOpportunityMaxWeight) {
      s.opportunities.push_back(g.id + " (" + g.description +
                                ") unused with low crisis correlation");
    }
  }
  return s;
}

nlohmann::json CorrelationAdmissionController::snapshot() const {
  std::lock_guard lock(mutex_);

  nlohmann::json j;
  j["version"] = params_->version;
  j["has_context"] = has_context_;
  j["context_phase"] = context_phase_;
  j["equity"] = equity_;
  j["regime"] = static_cast<int>(regime_);

  nlohmann::json positions = nlohmann::json::array();
  for (const auto& [id, symbol] : position_symbols_) {
    positions.push_back({{"id", id}, {"symbol", symbol}});
  }
  j["positions"] = std::move(positions);
  return j;
}

void CorrelationAdmissionController::restore(const nlohmann::json& snapshot) {
  bool has_context = false;
  std::optional<int> context_phase;
  double equity = 0.0;
  int regime = 0;
  std::vector<std::pair<std::string, std::string>> positions;

  try {
    has_context = snapshot.at("has_context").get<bool>();
    if (snapshot.contains("context_phase")) {
      context_phase = snapshot.at("context_phase").get<int>();
    }
    equity = snapshot.at("equity").get<double>();
    regime = snapshot.at("regime").get<int>();
    for (const auto& p : snapshot.at("positions")) {
      positions.emplace_back(p.at("id").get<std::string>(),
                             p.at("symbol").get<std::string>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(
        std::string("correlation snapshot is malformed: ") + e.what());
  }
  if (regime < 0 || regime >= domain::kRegimeCount) {
    throw std::invalid_argument("correlation snapshot has invalid regime " +
                                std::to_string(regime));
  }

  std::lock_guard lock(mutex_);
  has_context_ = has_context;
  if (context_phase) {
    context_phase_ = *context_phase;
  }
  equity_ = equity;
  regime_ = static_cast<domain::Regime>(regime);
  for (auto& [group, ids] : active_) {
    ids.clear();
  }
  ungrouped_.clear();
  position_symbols_.clear();

  for (const auto& [id, symbol] : positions) {
    registerLocked(id, symbol);
  }

  std::cout << "[CorrelationAdmission] restored " << position_symbols_.size()
            << " position(s)\n";
}

}  // namespace optguard
