#include "optguard/emergency/emergency_protocol.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace optguard {

using domain::ProtocolDirective;
using domain::ProtocolLevel;

EmergencyProtocol::EmergencyProtocol(domain::EmergencyPolicy policy,
                                     ChangeCallback on_change)
    : policy_(policy), on_change_(std::move(on_change)) {
  current_ = directiveFor(ProtocolLevel::Normal, 0.0, false);
}

ProtocolLevel EmergencyProtocol::levelFor(const domain::EmergencyPolicy& policy,
                                          double vix) {
  if (vix >= policy.emergency_vix) {
    return ProtocolLevel::Emergency;
  }
  if (vix >= policy.elevated_vix) {
    return ProtocolLevel::Elevated;
  }
  if (vix >= policy.preventive_vix) {
    return ProtocolLevel::Preventive;
  }
  return ProtocolLevel::Normal;
}

bool EmergencyProtocol::isSpike(double vix) const {
  const auto lookback = static_cast<std::size_t>(policy_.spike_lookback);
  if (history_.size() < lookback || vix <= policy_.spike_floor_vix) {
    return false;
  }
  const double reference = history_[history_.size() - lookback];
  if (reference <= 0.0) {
    return false;
  }
  return (vix - reference) / reference >= policy_.spike_rise_fraction;
}

ProtocolDirective EmergencyProtocol::directiveFor(ProtocolLevel level,
                                                  double vix,
                                                  bool spike) const {
  ProtocolDirective d;
  d.level = level;
  d.vix = vix;
  d.spike_detected = spike;

  switch (level) {
    case ProtocolLevel::Normal:
      d.actions = {"normal operations"};
      break;
    case ProtocolLevel::Preventive:
      d.bp_headroom_multiplier = policy_.preventive_bp_multiplier;
      d.actions = {"tighten buying-power headroom",
                   "review positions near the defensive window"};
      break;
    case ProtocolLevel::Elevated:
      d.bp_headroom_multiplier = policy_.elevated_bp_multiplier;
      d.block_new_entries = true;
      d.exposure_reduction = policy_.elevated_exposure_reduction;
      d.actions = {"block new entries", "reduce exposure on worst positions"};
      break;
    case ProtocolLevel::Emergency:
      d.bp_headroom_multiplier = policy_.emergency_bp_multiplier;
      d.block_new_entries = true;
      d.exposure_reduction = policy_.emergency_exposure_reduction;
      d.close_same_day_expirations = true;
      d.critical_alert = true;
      d.actions = {"block new entries", "reduce exposure on worst positions",
                   "close same-day expirations", "page operator"};
      break;
  }
  if (spike) {
    d.actions.push_back("volatility spike detected");
  }
  return d;
}

ProtocolDirective EmergencyProtocol::assess(
    const domain::RegimeReading& reading) const {
  const bool spike = isSpike(reading.vix);
  ProtocolLevel level = levelFor(policy_, reading.vix);
  if (spike) {
    level = ProtocolLevel::Emergency;
  }
  return directiveFor(level, reading.vix, spike);
}

void EmergencyProtocol::adoptStateFrom(const EmergencyProtocol& previous) {
  history_ = previous.history_;
  while (history_.size() > static_cast<std::size_t>(policy_.spike_lookback)) {
    history_.pop_front();
  }
  const auto& last = previous.current_;
  current_ = directiveFor(last.level, last.vix, last.spike_detected);
}

ProtocolDirective EmergencyProtocol::evaluate(
    const domain::RegimeReading& reading) {
  ProtocolDirective next = assess(reading);

  history_.push_back(reading.vix);
  while (history_.size() > static_cast<std::size_t>(policy_.spike_lookback)) {
    history_.pop_front();
  }

  const ProtocolLevel previous = current_.level;
  current_ = next;

  if (next.level != previous) {
    auto& out = next.level > previous ? std::cerr : std::cout;
    out << "[EmergencyProtocol] " << domain::toString(previous) << " -> "
        << domain::toString(next.level) << " at VIX " << reading.vix
        << (next.spike_detected ? " (spike)" : "") << "\n";
    if (next.critical_alert) {
      std::cerr << "[EmergencyProtocol] CRITICAL ALERT: emergency protocol "
                   "active\n";
    }
    if (on_change_) {
      on_change_(previous, next.level, next);
    }
  }
  return next;
}

}  // namespace optguard
