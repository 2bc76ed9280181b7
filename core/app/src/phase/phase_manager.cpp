#include "optguard/phase/phase_manager.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <utility>

namespace optguard {

PhaseManager::PhaseManager(std::shared_ptr<const domain::RiskParameters> params,
                           TransitionCallback on_transition)
    : params_(std::move(params)), on_transition_(std::move(on_transition)) {}

int PhaseManager::phaseFor(double equity) const {
  if (!std::isfinite(equity)) {
    return kBelowMinimumPhase;
  }

  int phase = kBelowMinimumPhase;
  for (const auto& def : params_->phases) {
    if (equity >= def.min_equity) {
      phase = def.phase;
    }
  }
  return phase;
}

const domain::PhaseDefinition* PhaseManager::definitionFor(int phase) const {
  for (const auto& def : params_->phases) {
    if (def.phase == phase) {
      return &def;
    }
  }
  return nullptr;
}

PhaseInfo PhaseManager::infoFor(int phase) const {
  PhaseInfo info;
  info.phase = phase;

  const auto& phases = params_->phases;
  const auto* def = definitionFor(phase);
  if (def == nullptr) {
    // Phase 0: everything below the first threshold, nothing allowed.
    info.phase = kBelowMinimumPhase;
    info.max_equity = phases.empty() ? 0.0 : phases.front().min_equity;
    info.description = "Below minimum equity";
    return info;
  }

  info.min_equity = def->min_equity;
  info.max_equity = std::numeric_limits<double>::infinity();
  if (const auto* next = definitionFor(phase + 1)) {
    info.max_equity = next->min_equity;
  }
  info.max_positions = def->max_positions;
  info.max_risk_per_trade = def->max_risk_per_trade;
  info.default_units = def->default_units;
  info.monthly_target = def->monthly_target;
  info.allowed_strategies = def->allowed_strategies;
  info.description = def->description;
  return info;
}

int PhaseManager::update(double equity) {
  const int next = phaseFor(equity);
  const int previous = current_phase_;
  current_equity_ = equity;

  if (next != previous) {
    current_phase_ = next;
    std::cout << "[PhaseManager] phase transition " << previous << " -> "
              << next << " at equity " << equity << "\n";
    if (on_transition_) {
      on_transition_(previous, next, equity);
    }
  }
  return current_phase_;
}

bool PhaseManager::isStrategyAllowed(const std::string& strategy) const {
  return isStrategyAllowed(current_phase_, strategy);
}

bool PhaseManager::isStrategyAllowed(int phase,
                                     const std::string& strategy) const {
  const auto* def = definitionFor(phase);
  if (def == nullptr) {
    return false;
  }
  for (const auto& allowed : def->allowed_strategies) {
    if (allowed == domain::kAllStrategies || allowed == strategy) {
      return true;
    }
  }
  return false;
}

int PhaseManager::calculatePositionSize(const std::string& strategy,
                                        double risk_amount) const {
  const auto* def = definitionFor(current_phase_);
  if (def == nullptr || !isStrategyAllowed(strategy)) {
    return 0;
  }
  if (!std::isfinite(risk_amount) || risk_amount <= 0.0) {
    std::cerr << "[PhaseManager] invalid risk amount " << risk_amount
              << " for " << strategy << "; sizing to 0\n";
    return 0;
  }

  const double budget = current_equity_ * def->max_risk_per_trade;
  // Clamp before narrowing: a tiny risk amount overflows int.
  const double affordable = std::min<double>(def->default_units,
                                             std::floor(budget / risk_amount));
  return std::max(0, static_cast<int>(affordable));
}

double PhaseManager::applyRiskCap(double risk_fraction) const {
  if (!std::isfinite(risk_fraction) || risk_fraction <= 0.0) {
    return 0.0;
  }
  double cap = params_->sizing.per_trade_risk_cap;
  if (const auto* def = definitionFor(current_phase_)) {
    cap = std::min(cap, def->max_risk_per_trade);
  } else {
    cap = 0.0;
  }
  return std::min(risk_fraction, cap);
}

PhaseMetrics PhaseManager::metrics() const {
  PhaseMetrics m;
  m.info = infoFor(current_phase_);
  m.equity = current_equity_;

  if (std::isinf(m.info.max_equity)) {
    m.progress_to_next = 100.0;
    m.equity_to_next = 0.0;
    return m;
  }

  const double span = m.info.max_equity - m.info.min_equity;
  if (span > 0.0) {
    const double done = (current_equity_ - m.info.min_equity) / span * 100.0;
    m.progress_to_next = std::clamp(done, 0.0, 100.0);
  }
  m.equity_to_next = std::max(0.0, m.info.max_equity - current_equity_);
  return m;
}

}  // namespace optguard
