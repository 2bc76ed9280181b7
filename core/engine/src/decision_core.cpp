#include "optguard/engine/decision_core.hpp"

#include "optguard/errors/errors.hpp"
#include "optguard/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace optguard {

namespace {

using domain::AdmissionDecision;
using domain::AdmissionReason;
using domain::DataSeverity;
using domain::LifecycleAction;
using domain::LifecycleState;
using domain::ProtocolLevel;

AdmissionDecision deny(AdmissionReason code, std::string reason) {
  AdmissionDecision d;
  d.allowed = false;
  d.code = code;
  d.reason = std::move(reason);
  return d;
}

}  // namespace

DecisionCore::DecisionCore(std::shared_ptr<const domain::RiskParameters> params,
                           EventBus& bus, const ITimeProvider& clock)
    : bus_(bus), clock_(clock), params_(std::move(params)) {
  std::lock_guard lock(mutex_);
  buildComponentsLocked();
  std::cout << "[DecisionCore] initialized with parameters version '"
            << params_->version << "'\n";
}

// Component callbacks run while mutex_ is held; they only queue events.
void DecisionCore::buildComponentsLocked() {
  regime_ = std::make_unique<RegimeClassifier>(params_);
  phase_ = std::make_unique<PhaseManager>(
      params_, [this](int from, int to, double equity) {
        if (!suppress_phase_events_) {
          queueEvent(PhaseTransitionEvent{from, to, equity, now()});
        }
      });
  sizer_ = std::make_unique<PositionSizer>(params_->sizing);
  correlation_ = std::make_unique<CorrelationAdmissionController>(params_);
  lifecycle_ = std::make_unique<LifecycleStateMachine>(params_);
  emergency_ = std::make_unique<EmergencyProtocol>(
      params_->emergency,
      [this](ProtocolLevel from, ProtocolLevel to,
             const domain::ProtocolDirective& directive) {
        queueEvent(ProtocolChangeEvent{from, to, directive, now()});
      });
}

Timestamp DecisionCore::now() const { return ms_to_timestamp(clock_.now_ms()); }

void DecisionCore::queueEvent(Event event) {
  pending_events_.push_back(std::move(event));
}

void DecisionCore::flushEvents() {
  std::vector<Event> events;
  {
    std::lock_guard lock(mutex_);
    events.swap(pending_events_);
  }
  for (const auto& e : events) {
    bus_.publish(e);
  }
}

void DecisionCore::haltLocked(const std::string& reason) {
  if (halted_.exchange(true)) {
    return;
  }
  halt_reason_ = reason;
  std::cerr << "[DecisionCore] KILL SWITCH ENGAGED: " << reason
            << ". All admissions denied until restart.\n";
  queueEvent(CoreHaltEvent{reason, now()});
}

void DecisionCore::halt(const std::string& reason) {
  {
    std::lock_guard lock(mutex_);
    haltLocked(reason);
  }
  flushEvents();
}

// -----------------------------------------------------------------------------
// Regime resolution
// -----------------------------------------------------------------------------

void DecisionCore::noteRegimeLocked(const domain::RegimeReading& reading) {
  if (last_regime_ && *last_regime_ != reading.regime) {
    std::cout << "[DecisionCore] regime " << domain::toString(*last_regime_)
              << " -> " << domain::toString(reading.regime) << " at VIX "
              << reading.vix << "\n";
    queueEvent(RegimeChangeEvent{*last_regime_, reading.regime, reading.vix,
                                 now()});
  }
  last_regime_ = reading.regime;
  account_.regime = reading.regime;
}

domain::RegimeReading DecisionCore::resolveRegimeLocked(
    const domain::MarketSnapshot& market, int phase, bool accept_stale) {
  if (const auto* a = std::get_if<domain::AvailableValue>(&market.vix)) {
    auto reading = regime_->classify(a->value, phase);
    last_good_vix_ = a->value;
    noteRegimeLocked(reading);
    return reading;
  }

  if (const auto* d = std::get_if<domain::DegradedValue>(&market.vix)) {
    if (!accept_stale) {
      throw DataUnavailableError("VIX", DataSeverity::Critical,
                                 d->reason + "; fresh reading required");
    }
    std::cerr << "[DecisionCore] VIX degraded (" << d->reason
              << "); using " << d->value << "\n";
    auto reading = regime_->classify(d->value, phase);
    noteRegimeLocked(reading);
    return reading;
  }

  const auto& u = std::get<domain::UnavailableValue>(market.vix);
  switch (u.severity) {
    case DataSeverity::Expected:
    case DataSeverity::Warning:
      if (last_good_vix_) {
        std::cerr << "[DecisionCore] VIX unavailable ["
                  << domain::toString(u.severity) << "]: " << u.reason
                  << "; using last good reading " << *last_good_vix_ << "\n";
        auto reading = regime_->classify(*last_good_vix_, phase);
        noteRegimeLocked(reading);
        return reading;
      }
      throw DataUnavailableError("VIX", u.severity,
                                 u.reason + "; no prior good reading");
    case DataSeverity::Critical:
      throw DataUnavailableError("VIX", u.severity, u.reason);
    case DataSeverity::Fatal:
      haltLocked("VIX feed fatal: " + u.reason);
      throw DataUnavailableError("VIX", u.severity, u.reason);
  }
  throw DataUnavailableError("VIX", u.severity, u.reason);
}

// -----------------------------------------------------------------------------
// Admission
// -----------------------------------------------------------------------------

AdmissionDecision DecisionCore::evaluateLocked(
    const domain::AdmissionCandidate& candidate,
    const domain::AccountSnapshot& account,
    const domain::MarketSnapshot& market) {
  if (halted_.load()) {
    return deny(AdmissionReason::CoreHalted, "core halted: " + halt_reason_);
  }

  if (!std::isfinite(account.equity) || account.equity < 0.0 ||
      !std::isfinite(account.buying_power_used) ||
      account.buying_power_used < 0.0 || account.buying_power_used > 1.0) {
    std::ostringstream os;
    os << "account snapshot rejected: equity " << account.equity
       << ", buying power used " << account.buying_power_used;
    std::cerr << "[DecisionCore] " << os.str() << "\n";
    return deny(AdmissionReason::InvalidAccountSnapshot, os.str());
  }

  account_.account_id = account.account_id;
  account_.equity = account.equity;
  account_.buying_power_used = account.buying_power_used;
  const int phase = phase_->update(account.equity);
  account_.phase = phase;

  const auto reading = resolveRegimeLocked(market, phase, false);
  correlation_->updateMarketContext(account.equity, reading.regime);

  const auto directive = emergency_->assess(reading);
  if (directive.block_new_entries) {
    return deny(AdmissionReason::EntriesBlocked,
                std::string("protocol ") + domain::toString(directive.level) +
                    " blocks new entries");
  }

  if (phase == kBelowMinimumPhase) {
    std::ostringstream os;
    os << "equity " << account.equity << " is below the phase 1 minimum";
    return deny(AdmissionReason::BelowMinimumPhase, os.str());
  }

  if (!phase_->isStrategyAllowed(phase, candidate.strategy)) {
    return deny(AdmissionReason::StrategyNotAllowed,
                "strategy " + candidate.strategy + " not allowed in phase " +
                    std::to_string(phase));
  }

  const auto info = phase_->infoFor(phase);
  const int active = static_cast<int>(lifecycle_->activeCount());
  if (active >= info.max_positions) {
    auto d = deny(AdmissionReason::PhasePositionLimit,
                  "phase " + std::to_string(phase) + " position limit: " +
                      std::to_string(active) + "/" +
                      std::to_string(info.max_positions));
    d.current_count = active;
    d.limit = info.max_positions;
    return d;
  }

  const double bp_needed = candidate.bp_required > 0.0
                               ? candidate.bp_required
                               : lifecycle_->ruleFor(candidate.strategy)
                                     .bp_requirement;
  const double bp_limit =
      reading.max_bp_fraction * directive.bp_headroom_multiplier;
  if (account.buying_power_used + bp_needed > bp_limit + 1e-12) {
    std::ostringstream os;
    os << "buying power " << account.buying_power_used << " + " << bp_needed
       << " exceeds " << bp_limit << " (" << domain::toString(reading.regime)
       << ", protocol " << domain::toString(directive.level) << ")";
    return deny(AdmissionReason::BuyingPowerExhausted, os.str());
  }

  if (auto it = market.underlyings.find(candidate.symbol);
      it != market.underlyings.end()) {
    if (const auto* u = std::get_if<domain::UnavailableValue>(&it->second)) {
      if (u->severity == DataSeverity::Fatal) {
        haltLocked(candidate.symbol + " data fatal: " + u->reason);
        return deny(AdmissionReason::CoreHalted,
                    "core halted: " + halt_reason_);
      }
      if (u->severity == DataSeverity::Critical) {
        return deny(AdmissionReason::DataUnavailable,
                    candidate.symbol + " data unavailable: " + u->reason);
      }
    }
  }

  if (lifecycle_->contains(candidate.position_id)) {
    return deny(AdmissionReason::DuplicatePosition,
                "position " + candidate.position_id + " is already tracked");
  }

  return correlation_->canAdmit(candidate.symbol, phase);
}

AdmissionDecision DecisionCore::evaluateAdmission(
    const domain::AdmissionCandidate& candidate,
    const domain::AccountSnapshot& account,
    const domain::MarketSnapshot& market) {
  AdmissionDecision decision;
  try {
    std::lock_guard lock(mutex_);
    decision = evaluateLocked(candidate, account, market);
    queueEvent(AdmissionDecisionEvent{candidate.position_id, candidate.symbol,
                                      candidate.strategy, decision, now()});
  } catch (const std::exception&) {
    flushEvents();
    throw;
  }
  flushEvents();
  return decision;
}

AdmissionDecision DecisionCore::admit(const domain::AdmissionCandidate& candidate,
                                      const domain::AccountSnapshot& account,
                                      const domain::MarketSnapshot& market) {
  AdmissionDecision decision;
  try {
    std::lock_guard lock(mutex_);
    decision = evaluateLocked(candidate, account, market);

    if (decision.allowed) {
      domain::Position p;
      p.id = candidate.position_id;
      p.symbol = candidate.symbol;
      p.strategy = candidate.strategy;
      p.entry_time_ms = market.now_ms != 0 ? market.now_ms : clock_.now_ms();
      p.expiry_ms = candidate.expiry_ms;
      p.entry_cost_basis = candidate.entry_cost_basis;
      p.current_mark = candidate.entry_cost_basis;
      p.quantity = candidate.quantity;
      p.strike = candidate.strike;
      p.right = candidate.right;
      p.correlation_group =
          correlation_->groupOf(candidate.symbol).value_or(std::string());
      p.state = LifecycleState::Open;

      lifecycle_->open(std::move(p));
      correlation_->registerPosition(candidate.position_id, candidate.symbol);
      std::cout << "[DecisionCore] admitted " << candidate.position_id << " "
                << candidate.symbol << " " << candidate.strategy << ": "
                << decision.reason << "\n";
    } else {
      std::cerr << "[DecisionCore] denied " << candidate.position_id << " "
                << candidate.symbol << " [" << domain::toString(decision.code)
                << "]: " << decision.reason << "\n";
    }

    queueEvent(AdmissionDecisionEvent{candidate.position_id, candidate.symbol,
                                      candidate.strategy, decision, now()});
  } catch (const std::exception&) {
    flushEvents();
    throw;
  }
  flushEvents();
  return decision;
}

// -----------------------------------------------------------------------------
// Sizing
// -----------------------------------------------------------------------------

SizingResult DecisionCore::sizePosition(const std::string& strategy,
                                        double win_rate, double avg_win,
                                        double avg_loss) const {
  std::lock_guard lock(mutex_);

  const int phase = phase_->currentPhase();
  if (phase == kBelowMinimumPhase || !phase_->isStrategyAllowed(strategy)) {
    SizingResult r;
    r.reason = "strategy " + strategy + " not tradable in phase " +
               std::to_string(phase);
    return r;
  }

  const double cap = std::min(params_->sizing.per_trade_risk_cap,
                              phase_->infoFor(phase).max_risk_per_trade);
  return sizer_->size(win_rate, avg_win, avg_loss, cap);
}

SizingResult DecisionCore::sizePosition(const std::string& strategy) const {
  domain::StrategyRule rule;
  {
    std::lock_guard lock(mutex_);
    rule = lifecycle_->ruleFor(strategy);
  }
  return sizePosition(strategy, rule.win_rate, rule.avg_win, rule.avg_loss);
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

void DecisionCore::transitionLocked(const domain::PositionId& id,
                                    LifecycleAction action, LifecycleState to,
                                    const std::string& reason) {
  const auto& p = lifecycle_->at(id);
  const LifecycleState from = p.state;
  const std::string symbol = p.symbol;
  lifecycle_->transition(id, to, reason);
  queueEvent(LifecycleActionEvent{id, symbol, action, from, to, reason, now()});
}

domain::LifecycleDecision DecisionCore::evaluatePositionLocked(
    const domain::PositionId& id, const domain::MarketSnapshot& market) {
  const auto& p = lifecycle_->at(id);

  if (auto it = market.option_marks.find(id); it != market.option_marks.end()) {
    if (auto mark = domain::usableValue(it->second)) {
      lifecycle_->updateMark(id, *mark);
    } else {
      const auto& u = std::get<domain::UnavailableValue>(it->second);
      if (u.severity >= DataSeverity::Critical) {
        throw DataUnavailableError(id, u.severity, u.reason);
      }
    }
  }

  LifecycleContext ctx;
  ctx.now_ms = market.now_ms != 0 ? market.now_ms : clock_.now_ms();

  if (auto it = market.underlyings.find(p.symbol);
      it != market.underlyings.end()) {
    if (auto spot = domain::usableValue(it->second)) {
      ctx.underlying_price = *spot;
    } else {
      const auto& u = std::get<domain::UnavailableValue>(it->second);
      if (u.severity == DataSeverity::Fatal) {
        haltLocked(p.symbol + " data fatal: " + u.reason);
      }
      const bool needs_spot =
          p.quantity < 0.0 && p.right != domain::OptionRight::None &&
          LifecycleStateMachine::daysToExpiry(p.expiry_ms, ctx.now_ms) <=
              params_->defensive.assignment_window_dte;
      if (needs_spot && u.severity >= DataSeverity::Critical) {
        throw DataUnavailableError(p.symbol, u.severity,
                                   "assignment check for " + id +
                                       " needs the underlying price: " +
                                       u.reason);
      }
    }
  }

  const auto decision = lifecycle_->evaluate(p, ctx);
  if (decision.next_state != p.state) {
    transitionLocked(id, decision.action, decision.next_state, decision.reason);
  }
  return decision;
}

domain::LifecycleDecision DecisionCore::evaluatePositionLifecycle(
    const domain::PositionId& id, const domain::MarketSnapshot& market) {
  domain::LifecycleDecision decision;
  try {
    std::lock_guard lock(mutex_);
    decision = evaluatePositionLocked(id, market);
  } catch (const std::exception&) {
    flushEvents();
    throw;
  }
  flushEvents();
  return decision;
}

domain::DefensePlan DecisionCore::planDefense(
    const domain::PositionId& id,
    const std::vector<domain::OptionContract>& chain, std::int64_t now_ms) {
  domain::DefensePlan plan;
  {
    std::lock_guard lock(mutex_);
    const auto& p = lifecycle_->at(id);
    if (p.state != LifecycleState::Challenged) {
      throw std::logic_error("cannot plan a defense for " + id + " in state " +
                             domain::toString(p.state));
    }

    plan = lifecycle_->planRoll(p, chain, now_ms);
    const LifecycleState to = plan.action == LifecycleAction::Roll
                                  ? LifecycleState::Defended
                                  : LifecycleState::Closed;
    transitionLocked(id, plan.action, to, plan.reason);
  }
  flushEvents();
  return plan;
}

void DecisionCore::registerFill(const domain::PositionId& id,
                                const domain::FillDetails& fill) {
  {
    std::lock_guard lock(mutex_);
    const auto& p = lifecycle_->at(id);

    switch (fill.kind) {
      case domain::FillKind::Open:
        lifecycle_->applyOpenFill(id, fill.price, fill.quantity);
        std::cout << "[DecisionCore] open fill " << id << " @ " << fill.price
                  << "\n";
        break;

      case domain::FillKind::Close: {
        if (p.state != LifecycleState::Closed) {
          transitionLocked(id, LifecycleAction::Close, LifecycleState::Closed,
                           "close fill without prior close decision");
        }
        const auto removed = lifecycle_->remove(id);
        correlation_->unregisterPosition(id);
        std::cout << "[DecisionCore] close fill " << id << " ("
                  << removed.symbol << ") @ " << fill.price
                  << "; position untracked\n";
        break;
      }

      case domain::FillKind::Roll: {
        if (!fill.new_contract) {
          throw std::invalid_argument("roll fill for " + id +
                                      " carries no replacement contract");
        }
        const std::string symbol = p.symbol;
        lifecycle_->applyRoll(id, *fill.new_contract, fill.price);
        queueEvent(LifecycleActionEvent{id, symbol, LifecycleAction::Roll,
                                        LifecycleState::Defended,
                                        LifecycleState::Open, "roll filled",
                                        now()});
        break;
      }
    }
  }
  flushEvents();
}

// -----------------------------------------------------------------------------
// Protocol and sweep
// -----------------------------------------------------------------------------

domain::ProtocolDirective DecisionCore::currentProtocol(
    const domain::RegimeReading& reading) {
  domain::ProtocolDirective directive;
  {
    std::lock_guard lock(mutex_);
    directive = emergency_->evaluate(reading);
  }
  flushEvents();
  return directive;
}

domain::ProtocolDirective DecisionCore::currentProtocol(
    const domain::MarketSnapshot& market) {
  domain::ProtocolDirective directive;
  try {
    std::lock_guard lock(mutex_);
    const auto reading = resolveRegimeLocked(market, phase_->currentPhase());
    directive = emergency_->evaluate(reading);
  } catch (const std::exception&) {
    flushEvents();
    throw;
  }
  flushEvents();
  return directive;
}

// -----------------------------------------------------------------------------
// applyProtocolClosesLocked()
// -----------------------------------------------------------------------------
// EMERGENCY closes everything expiring today. Entering a level that carries
// an exposure reduction closes ceil(pct * active) positions, worst P&L
// first, once per escalation edge.
// -----------------------------------------------------------------------------
void DecisionCore::applyProtocolClosesLocked(const domain::MarketSnapshot& market,
                                             SweepReport& report) {
  const auto& directive = report.directive;
  // A protocol close supersedes any lifecycle instruction for the same id.
  const auto emit = [&report](SweepInstruction instruction) {
    for (auto& existing : report.instructions) {
      if (existing.position_id == instruction.position_id) {
        existing = std::move(instruction);
        return;
      }
    }
    report.instructions.push_back(std::move(instruction));
  };
  const std::int64_t now_ms = market.now_ms != 0 ? market.now_ms
                                                 : clock_.now_ms();

  if (directive.close_same_day_expirations) {
    for (const auto& p : lifecycle_->positions()) {
      if (p.state == LifecycleState::Closed ||
          LifecycleStateMachine::daysToExpiry(p.expiry_ms, now_ms) != 0) {
        continue;
      }
      const std::string reason = "same-day expiration under EMERGENCY protocol";
      transitionLocked(p.id, LifecycleAction::EmergencyClose,
                       LifecycleState::Closed, reason);
      emit({p.id, p.symbol, LifecycleAction::EmergencyClose, reason});
    }
  }

  if (directive.level > reduced_for_level_ &&
      directive.exposure_reduction > 0.0) {
    std::vector<domain::Position> active;
    for (auto& p : lifecycle_->positions()) {
      if (p.state != LifecycleState::Closed) {
        active.push_back(std::move(p));
      }
    }
    std::stable_sort(active.begin(), active.end(),
                     [](const domain::Position& a, const domain::Position& b) {
                       return LifecycleStateMachine::pnlRatio(a) <
                              LifecycleStateMachine::pnlRatio(b);
                     });

    const auto count = static_cast<std::size_t>(std::ceil(
        directive.exposure_reduction * static_cast<double>(active.size()) -
        1e-9));
    std::ostringstream os;
    os << "exposure reduction " << directive.exposure_reduction * 100.0
       << "% on entering " << domain::toString(directive.level);
    for (std::size_t i = 0; i < count && i < active.size(); ++i) {
      transitionLocked(active[i].id, LifecycleAction::Close,
                       LifecycleState::Closed, os.str());
      emit({active[i].id, active[i].symbol, LifecycleAction::Close, os.str()});
    }
  }
  reduced_for_level_ = directive.level;
}

SweepReport DecisionCore::sweep(const domain::MarketSnapshot& market) {
  SweepReport report;
  {
    std::lock_guard lock(mutex_);

    try {
      const auto reading = resolveRegimeLocked(market, phase_->currentPhase());
      report.directive = emergency_->evaluate(reading);
    } catch (const DataUnavailableError& e) {
      std::cerr << "[DecisionCore] sweep without fresh protocol: " << e.what()
                << "\n";
      report.errors.push_back({e.instrument(), e.severity(), e.what()});
      report.directive = emergency_->currentDirective();
    }

    for (const auto& p : lifecycle_->positions()) {
      try {
        const auto decision = evaluatePositionLocked(p.id, market);
        if (decision.action != LifecycleAction::Hold) {
          report.instructions.push_back(
              {p.id, p.symbol, decision.action, decision.reason});
        }
      } catch (const DataUnavailableError& e) {
        std::cerr << "[DecisionCore] sweep skipped " << p.id << ": "
                  << e.what() << "\n";
        report.errors.push_back({e.instrument(), e.severity(), e.what()});
      }
    }

    applyProtocolClosesLocked(market, report);
  }
  flushEvents();
  return report;
}

// -----------------------------------------------------------------------------
// Hydration, reload, persistence
// -----------------------------------------------------------------------------

void DecisionCore::hydrate(const std::vector<domain::Position>& positions) {
  std::size_t hydrated = 0;
  {
    std::lock_guard lock(mutex_);
    for (auto p : positions) {
      if (p.state == LifecycleState::Closed) {
        std::cerr << "[DecisionCore] hydrate: skipping closed position "
                  << p.id << "\n";
        continue;
      }
      if (lifecycle_->contains(p.id)) {
        std::cerr << "[DecisionCore] hydrate: duplicate position " << p.id
                  << " ignored\n";
        continue;
      }
      p.correlation_group =
          correlation_->groupOf(p.symbol).value_or(std::string());
      const auto id = p.id;
      const auto symbol = p.symbol;
      lifecycle_->open(std::move(p));
      correlation_->registerPosition(id, symbol);
      ++hydrated;
    }
  }
  std::cout << "[DecisionCore] hydrated " << hydrated << " position(s)\n";
}

void DecisionCore::reloadParameters(
    std::shared_ptr<const domain::RiskParameters> params) {
  {
    std::lock_guard lock(mutex_);
    const auto counters = correlation_->snapshot();
    const auto tracked = lifecycle_->positions();
    const std::string previous = params_->version;
    auto previous_protocol = std::move(emergency_);

    params_ = std::move(params);
    buildComponentsLocked();
    emergency_->adoptStateFrom(*previous_protocol);

    correlation_->restore(counters);
    for (auto p : tracked) {
      p.correlation_group =
          correlation_->groupOf(p.symbol).value_or(std::string());
      lifecycle_->open(std::move(p));
    }

    suppress_phase_events_ = true;
    account_.phase = phase_->update(account_.equity);
    suppress_phase_events_ = false;

    std::cout << "[DecisionCore] parameters reloaded: '" << previous
              << "' -> '" << params_->version << "'\n";
  }
  flushEvents();
}

nlohmann::json DecisionCore::snapshotCounters() const {
  std::lock_guard lock(mutex_);
  return correlation_->snapshot();
}

void DecisionCore::restoreCounters(const nlohmann::json& snapshot) {
  std::lock_guard lock(mutex_);
  correlation_->restore(snapshot);
}

StressTestResult DecisionCore::stressTest(
    const std::vector<StressPosition>& positions, double vix) const {
  std::lock_guard lock(mutex_);
  return correlation_->stressTest(positions, vix);
}

domain::Account DecisionCore::account() const {
  std::lock_guard lock(mutex_);
  return account_;
}

std::vector<domain::Position> DecisionCore::positions() const {
  std::lock_guard lock(mutex_);
  return lifecycle_->positions();
}

CorrelationSummary DecisionCore::correlationSummary() const {
  std::lock_guard lock(mutex_);
  return correlation_->summary();
}

PhaseMetrics DecisionCore::phaseMetrics() const {
  std::lock_guard lock(mutex_);
  return phase_->metrics();
}

domain::ProtocolLevel DecisionCore::protocolLevel() const {
  std::lock_guard lock(mutex_);
  return emergency_->currentLevel();
}

std::shared_ptr<const domain::RiskParameters> DecisionCore::parameters() const {
  std::lock_guard lock(mutex_);
  return params_;
}

}  // namespace optguard
