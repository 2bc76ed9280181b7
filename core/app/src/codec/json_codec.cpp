#include "optguard/codec/json_codec.hpp"

#include "optguard/time/time_utils.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>

namespace optguard {

namespace codec {

namespace {

template <typename Enum, std::size_t N>
Enum parseEnum(const std::string& s, const Enum (&values)[N],
               const char* type_name) {
  for (Enum v : values) {
    if (s == domain::toString(v)) {
      return v;
    }
  }
  throw std::invalid_argument(std::string("unknown ") + type_name + " '" + s +
                              "'");
}

// Null or absent -> nullopt; anything else must be a number.
std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

}  // namespace

domain::Regime parseRegime(const std::string& s) {
  static constexpr domain::Regime kValues[] = {
      domain::Regime::VeryLow, domain::Regime::Low, domain::Regime::Normal,
      domain::Regime::High, domain::Regime::VeryHigh};
  return parseEnum(s, kValues, "regime");
}

domain::LifecycleState parseLifecycleState(const std::string& s) {
  static constexpr domain::LifecycleState kValues[] = {
      domain::LifecycleState::Open, domain::LifecycleState::Challenged,
      domain::LifecycleState::Defended, domain::LifecycleState::Closed};
  return parseEnum(s, kValues, "lifecycle state");
}

domain::OptionRight parseOptionRight(const std::string& s) {
  static constexpr domain::OptionRight kValues[] = {
      domain::OptionRight::None, domain::OptionRight::Call,
      domain::OptionRight::Put};
  return parseEnum(s, kValues, "option right");
}

domain::FillKind parseFillKind(const std::string& s) {
  static constexpr domain::FillKind kValues[] = {
      domain::FillKind::Open, domain::FillKind::Close, domain::FillKind::Roll};
  return parseEnum(s, kValues, "fill kind");
}

domain::DataSeverity parseDataSeverity(const std::string& s) {
  static constexpr domain::DataSeverity kValues[] = {
      domain::DataSeverity::Expected, domain::DataSeverity::Warning,
      domain::DataSeverity::Critical, domain::DataSeverity::Fatal};
  return parseEnum(s, kValues, "data severity");
}

domain::MarketSnapshot marketFromJson(const nlohmann::json& j,
                                      const DataQualityClassifier& quality,
                                      std::int64_t default_now_ms) {
  domain::MarketSnapshot m;
  m.now_ms = j.value("now_ms", default_now_ms);
  const int minute = j.at("session_minute").get<int>();

  m.vix = quality.classifyVix(optionalNumber(j, "vix"), minute,
                              j.value("vix_age_ms", std::int64_t{0}));

  if (auto it = j.find("underlyings"); it != j.end()) {
    for (auto u = it->begin(); u != it->end(); ++u) {
      std::optional<double> raw;
      if (!u.value().is_null()) {
        raw = u.value().get<double>();
      }
      m.underlyings[u.key()] = quality.classifyUnderlying(u.key(), raw, minute);
    }
  }

  if (auto it = j.find("option_marks"); it != j.end()) {
    for (auto o = it->begin(); o != it->end(); ++o) {
      std::optional<double> raw;
      if (!o.value().is_null()) {
        raw = o.value().get<double>();
      }
      m.option_marks[o.key()] = quality.classifyOptionMark(raw, minute);
    }
  }
  return m;
}

nlohmann::json marketValueToJson(const domain::MarketValue& v) {
  nlohmann::json j;
  if (const auto* a = std::get_if<domain::AvailableValue>(&v)) {
    j["status"] = "AVAILABLE";
    j["value"] = a->value;
  } else if (const auto* d = std::get_if<domain::DegradedValue>(&v)) {
    j["status"] = "DEGRADED";
    j["value"] = d->value;
    j["reason"] = d->reason;
  } else if (const auto* u = std::get_if<domain::UnavailableValue>(&v)) {
    j["status"] = "UNAVAILABLE";
    j["severity"] = domain::toString(u->severity);
    j["reason"] = u->reason;
  }
  return j;
}

nlohmann::json eventToJson(const Event& event) {
  nlohmann::json j;
  if (const auto* e = std::get_if<PhaseTransitionEvent>(&event)) {
    j["type"] = "phase_transition";
    j["from_phase"] = e->from_phase;
    j["to_phase"] = e->to_phase;
    j["equity"] = e->equity;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
  } else if (const auto* e = std::get_if<RegimeChangeEvent>(&event)) {
    j["type"] = "regime_change";
    j["from"] = domain::toString(e->from);
    j["to"] = domain::toString(e->to);
    j["vix"] = e->vix;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
  } else if (const auto* e = std::get_if<AdmissionDecisionEvent>(&event)) {
    j["type"] = "admission_decision";
    j["position_id"] = e->position_id;
    j["symbol"] = e->symbol;
    j["strategy"] = e->strategy;
    j["decision"] = e->decision;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
  } else if (const auto* e = std::get_if<LifecycleActionEvent>(&event)) {
    j["type"] = "lifecycle_action";
    j["position_id"] = e->position_id;
    j["symbol"] = e->symbol;
    j["action"] = domain::toString(e->action);
    j["from_state"] = domain::toString(e->from_state);
    j["to_state"] = domain::toString(e->to_state);
    j["reason"] = e->reason;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
  } else if (const auto* e = std::get_if<ProtocolChangeEvent>(&event)) {
    j["type"] = "protocol_change";
    j["from"] = domain::toString(e->from);
    j["to"] = domain::toString(e->to);
    j["directive"] = e->directive;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
  } else if (const auto* e = std::get_if<CoreHaltEvent>(&event)) {
    j["type"] = "core_halt";
    j["reason"] = e->reason;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
  }
  return j;
}

}  // namespace codec

namespace domain {

void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"id", p.id},
                     {"symbol", p.symbol},
                     {"strategy", p.strategy},
                     {"entry_time_ms", p.entry_time_ms},
                     {"expiry_ms", p.expiry_ms},
                     {"entry_cost_basis", p.entry_cost_basis},
                     {"current_mark", p.current_mark},
                     {"quantity", p.quantity},
                     {"strike", p.strike},
                     {"right", toString(p.right)},
                     {"correlation_group", p.correlation_group},
                     {"state", toString(p.state)},
                     {"roll_count", p.roll_count}};
}

void from_json(const nlohmann::json& j, Position& p) {
  p.id = j.at("id").get<std::string>();
  p.symbol = j.at("symbol").get<std::string>();
  p.strategy = j.at("strategy").get<std::string>();
  p.entry_time_ms = j.value("entry_time_ms", std::int64_t{0});
  p.expiry_ms = j.at("expiry_ms").get<std::int64_t>();
  p.entry_cost_basis = j.at("entry_cost_basis").get<double>();
  p.current_mark = j.value("current_mark", p.entry_cost_basis);
  p.quantity = j.at("quantity").get<double>();
  p.strike = j.value("strike", 0.0);
  p.right = codec::parseOptionRight(j.value("right", std::string("NONE")));
  p.correlation_group = j.value("correlation_group", std::string());
  p.state = codec::parseLifecycleState(j.value("state", std::string("OPEN")));
  p.roll_count = j.value("roll_count", 0);
}

void to_json(nlohmann::json& j, const OptionContract& c) {
  j = nlohmann::json{{"underlying", c.underlying},
                     {"expiry_ms", c.expiry_ms},
                     {"strike", c.strike},
                     {"right", toString(c.right)},
                     {"mark", c.mark}};
}

void from_json(const nlohmann::json& j, OptionContract& c) {
  c.underlying = j.at("underlying").get<std::string>();
  c.expiry_ms = j.at("expiry_ms").get<std::int64_t>();
  c.strike = j.at("strike").get<double>();
  c.right = codec::parseOptionRight(j.at("right").get<std::string>());
  c.mark = j.value("mark", 0.0);
}

void from_json(const nlohmann::json& j, AdmissionCandidate& c) {
  c.position_id = j.at("position_id").get<std::string>();
  c.symbol = j.at("symbol").get<std::string>();
  c.strategy = j.at("strategy").get<std::string>();
  c.bp_required = j.value("bp_required", 0.0);
  c.expiry_ms = j.value("expiry_ms", std::int64_t{0});
  c.strike = j.value("strike", 0.0);
  c.right = codec::parseOptionRight(j.value("right", std::string("NONE")));
  c.quantity = j.value("quantity", 0.0);
  c.entry_cost_basis = j.value("entry_cost_basis", 0.0);
}

void from_json(const nlohmann::json& j, AccountSnapshot& a) {
  a.account_id = j.value("account_id", std::string());
  a.equity = j.at("equity").get<double>();
  a.buying_power_used = j.value("buying_power_used", 0.0);
}

void from_json(const nlohmann::json& j, FillDetails& f) {
  f.kind = codec::parseFillKind(j.at("kind").get<std::string>());
  f.price = j.at("price").get<double>();
  f.quantity = j.value("quantity", 0.0);
  if (auto it = j.find("new_contract"); it != j.end() && !it->is_null()) {
    f.new_contract = it->get<OptionContract>();
  }
}

void to_json(nlohmann::json& j, const Account& a) {
  j = nlohmann::json{{"account_id", a.account_id},
                     {"equity", a.equity},
                     {"phase", a.phase},
                     {"regime", toString(a.regime)},
                     {"buying_power_used", a.buying_power_used}};
}

void to_json(nlohmann::json& j, const AdmissionDecision& d) {
  j = nlohmann::json{{"allowed", d.allowed},
                     {"code", toString(d.code)},
                     {"reason", d.reason},
                     {"group", d.group},
                     {"current_count", d.current_count},
                     {"limit", d.limit}};
}

void to_json(nlohmann::json& j, const LifecycleDecision& d) {
  j = nlohmann::json{{"action", toString(d.action)},
                     {"reason", d.reason},
                     {"next_state", toString(d.next_state)}};
}

void to_json(nlohmann::json& j, const DefensePlan& p) {
  j = nlohmann::json{{"action", toString(p.action)},
                     {"reason", p.reason},
                     {"degraded", p.degraded}};
  j["replacement"] = p.replacement ? nlohmann::json(*p.replacement)
                                   : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const ProtocolDirective& d) {
  j = nlohmann::json{{"level", toString(d.level)},
                     {"vix", d.vix},
                     {"bp_headroom_multiplier", d.bp_headroom_multiplier},
                     {"block_new_entries", d.block_new_entries},
                     {"exposure_reduction", d.exposure_reduction},
                     {"close_same_day_expirations", d.close_same_day_expirations},
                     {"critical_alert", d.critical_alert},
                     {"spike_detected", d.spike_detected},
                     {"actions", d.actions}};
}

void to_json(nlohmann::json& j, const RegimeReading& r) {
  j = nlohmann::json{{"vix", r.vix},
                     {"regime", toString(r.regime)},
                     {"phase", r.phase},
                     {"max_bp_fraction", r.max_bp_fraction}};
}

}  // namespace domain

void to_json(nlohmann::json& j, const SizingResult& r) {
  j = nlohmann::json{{"risk_fraction", r.risk_fraction},
                     {"should_trade", r.should_trade},
                     {"error", PositionSizer::toString(r.error)},
                     {"raw_kelly", r.raw_kelly},
                     {"reason", r.reason}};
}

void to_json(nlohmann::json& j, const PhaseMetrics& m) {
  j = nlohmann::json{{"phase", m.info.phase},
                     {"description", m.info.description},
                     {"equity", m.equity},
                     {"min_equity", m.info.min_equity},
                     {"max_positions", m.info.max_positions},
                     {"max_risk_per_trade", m.info.max_risk_per_trade},
                     {"monthly_target", m.info.monthly_target},
                     {"progress_to_next", m.progress_to_next},
                     {"equity_to_next", m.equity_to_next},
                     {"allowed_strategies", m.info.allowed_strategies}};
  // JSON has no infinity.
  j["max_equity"] = std::isinf(m.info.max_equity)
                        ? nlohmann::json(nullptr)
                        : nlohmann::json(m.info.max_equity);
}

void to_json(nlohmann::json& j, const CorrelationSummary& s) {
  j = nlohmann::json{{"risk_score", s.risk_score},
                     {"crisis_var", s.crisis_var},
                     {"total_positions", s.total_positions},
                     {"groups_used", s.groups_used},
                     {"warnings", s.warnings},
                     {"opportunities", s.opportunities}};
}

void to_json(nlohmann::json& j, const StressTestResult& r) {
  j = nlohmann::json{{"vix", r.vix},
                     {"total_value", r.total_value},
                     {"loss_rate", r.loss_rate},
                     {"estimated_loss", r.estimated_loss},
                     {"unprotected_loss", r.unprotected_loss},
                     {"violation_count", r.violation_count},
                     {"protection_effectiveness", r.protection_effectiveness},
                     {"risk_level", toString(r.risk_level)},
                     {"risk_score", r.risk_score},
                     {"recommendations", r.recommendations}};
}

}  // namespace optguard
