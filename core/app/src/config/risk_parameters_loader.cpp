#include "optguard/config/risk_parameters_loader.hpp"

#include "optguard/errors/errors.hpp"

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <set>
#include <sstream>

namespace optguard {

namespace {

using nlohmann::json;
using domain::CorrelationGroupDefinition;
using domain::EquityTier;
using domain::PhaseDefinition;
using domain::RiskParameters;
using domain::StrategyRule;

void requireObject(const json& j, const std::string& path) {
  if (!j.is_object()) {
    throw ConfigError(path + ": expected an object");
  }
}

void rejectUnknownKeys(const json& j, std::initializer_list<const char*> allowed,
                       const std::string& path) {
  for (auto it = j.begin(); it != j.end(); ++it) {
    bool known = false;
    for (const char* key : allowed) {
      if (it.key() == key) {
        known = true;
        break;
      }
    }
    if (!known) {
      throw ConfigError(path + ": unknown key '" + it.key() + "'");
    }
  }
}

// Leaves `out` untouched when the key is absent.
template <typename T>
void readOptional(const json& j, const char* key, T& out,
                  const std::string& path) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(path + "." + key + ": " + e.what());
  }
}

template <typename T>
T readRequired(const json& j, const char* key, const std::string& path) {
  if (!j.contains(key)) {
    throw ConfigError(path + ": missing required key '" + key + "'");
  }
  T out{};
  readOptional(j, key, out, path);
  return out;
}

PhaseDefinition parsePhase(const json& j, const std::string& path) {
  requireObject(j, path);
  rejectUnknownKeys(j,
                    {"phase", "min_equity", "max_positions",
                     "max_risk_per_trade", "default_units", "monthly_target",
                     "allowed_strategies", "max_bp_by_regime", "description"},
                    path);
  PhaseDefinition p;
  p.phase = readRequired<int>(j, "phase", path);
  p.min_equity = readRequired<double>(j, "min_equity", path);
  p.max_positions = readRequired<int>(j, "max_positions", path);
  p.max_risk_per_trade = readRequired<double>(j, "max_risk_per_trade", path);
  readOptional(j, "default_units", p.default_units, path);
  readOptional(j, "monthly_target", p.monthly_target, path);
  p.allowed_strategies =
      readRequired<std::vector<std::string>>(j, "allowed_strategies", path);

  auto bp = readRequired<std::vector<double>>(j, "max_bp_by_regime", path);
  if (bp.size() != p.max_bp_by_regime.size()) {
    throw ConfigError(path + ".max_bp_by_regime: expected " +
                      std::to_string(p.max_bp_by_regime.size()) + " values");
  }
  for (std::size_t i = 0; i < bp.size(); ++i) {
    p.max_bp_by_regime[i] = bp[i];
  }
  readOptional(j, "description", p.description, path);
  return p;
}

CorrelationGroupDefinition parseGroup(const json& j, const std::string& path) {
  requireObject(j, path);
  rejectUnknownKeys(j, {"id", "description", "symbols", "crisis_weight"}, path);
  CorrelationGroupDefinition g;
  g.id = readRequired<std::string>(j, "id", path);
  readOptional(j, "description", g.description, path);
  g.symbols = readRequired<std::vector<std::string>>(j, "symbols", path);
  g.crisis_weight = readRequired<double>(j, "crisis_weight", path);
  return g;
}

// max_equity omitted means "no upper bound" (the top tier).
EquityTier parseTier(const json& j, const std::string& path) {
  requireObject(j, path);
  rejectUnknownKeys(j, {"name", "max_equity", "group_limits", "default_limit"},
                    path);
  EquityTier t;
  t.name = readRequired<std::string>(j, "name", path);
  readOptional(j, "max_equity", t.max_equity, path);
  t.group_limits =
      readRequired<std::map<std::string, int>>(j, "group_limits", path);
  readOptional(j, "default_limit", t.default_limit, path);
  return t;
}

StrategyRule parseRule(const json& j, const std::string& path) {
  requireObject(j, path);
  rejectUnknownKeys(j,
                    {"profit_target", "stop_loss", "management_dte",
                     "max_rolls", "win_rate", "avg_win", "avg_loss",
                     "bp_requirement"},
                    path);
  StrategyRule r;
  readOptional(j, "profit_target", r.profit_target, path);
  readOptional(j, "stop_loss", r.stop_loss, path);
  readOptional(j, "management_dte", r.management_dte, path);
  readOptional(j, "max_rolls", r.max_rolls, path);
  readOptional(j, "win_rate", r.win_rate, path);
  readOptional(j, "avg_win", r.avg_win, path);
  readOptional(j, "avg_loss", r.avg_loss, path);
  readOptional(j, "bp_requirement", r.bp_requirement, path);
  return r;
}

void parseCorrelation(const json& j, domain::CorrelationPolicy& out) {
  const std::string path = "correlation";
  requireObject(j, path);
  rejectUnknownKeys(j,
                    {"groups", "tiers", "equity_aggregate",
                     "high_regime_reduction", "reject_unmapped_symbols",
                     "risk_score_warning"},
                    path);

  if (auto it = j.find("groups"); it != j.end()) {
    if (!it->is_array()) {
      throw ConfigError(path + ".groups: expected an array");
    }
    out.groups.clear();
    for (std::size_t i = 0; i < it->size(); ++i) {
      out.groups.push_back(
          parseGroup((*it)[i], path + ".groups[" + std::to_string(i) + "]"));
    }
  }

  if (auto it = j.find("tiers"); it != j.end()) {
    if (!it->is_array()) {
      throw ConfigError(path + ".tiers: expected an array");
    }
    out.tiers.clear();
    for (std::size_t i = 0; i < it->size(); ++i) {
      out.tiers.push_back(
          parseTier((*it)[i], path + ".tiers[" + std::to_string(i) + "]"));
    }
  }

  if (auto it = j.find("equity_aggregate"); it != j.end()) {
    const std::string agg_path = path + ".equity_aggregate";
    requireObject(*it, agg_path);
    rejectUnknownKeys(*it, {"name", "groups", "cap"}, agg_path);
    domain::EquityAggregateRule rule;
    readOptional(*it, "name", rule.name, agg_path);
    rule.groups =
        readRequired<std::vector<std::string>>(*it, "groups", agg_path);
    rule.cap = readRequired<int>(*it, "cap", agg_path);
    out.equity_aggregate = rule;
  }

  readOptional(j, "high_regime_reduction", out.high_regime_reduction, path);
  readOptional(j, "reject_unmapped_symbols", out.reject_unmapped_symbols, path);
  readOptional(j, "risk_score_warning", out.risk_score_warning, path);
}

void parseSizing(const json& j, domain::SizingPolicy& out) {
  const std::string path = "sizing";
  requireObject(j, path);
  rejectUnknownKeys(j, {"kelly_multiplier", "per_trade_risk_cap"}, path);
  domain::SizingPolicy s;
  readOptional(j, "kelly_multiplier", s.kelly_multiplier, path);
  readOptional(j, "per_trade_risk_cap", s.per_trade_risk_cap, path);
  out = s;
}

void parseDefensive(const json& j, domain::DefensivePolicy& out) {
  const std::string path = "defensive";
  requireObject(j, path);
  rejectUnknownKeys(j,
                    {"absolute_dte", "roll_min_dte", "roll_max_dte",
                     "assignment_window_dte", "put_itm_buffer",
                     "call_itm_buffer"},
                    path);
  domain::DefensivePolicy d;
  readOptional(j, "absolute_dte", d.absolute_dte, path);
  readOptional(j, "roll_min_dte", d.roll_min_dte, path);
  readOptional(j, "roll_max_dte", d.roll_max_dte, path);
  readOptional(j, "assignment_window_dte", d.assignment_window_dte, path);
  readOptional(j, "put_itm_buffer", d.put_itm_buffer, path);
  readOptional(j, "call_itm_buffer", d.call_itm_buffer, path);
  out = d;
}

void parseEmergency(const json& j, domain::EmergencyPolicy& out) {
  const std::string path = "emergency";
  requireObject(j, path);
  rejectUnknownKeys(j,
                    {"preventive_vix", "elevated_vix", "emergency_vix",
                     "preventive_bp_multiplier", "elevated_bp_multiplier",
                     "emergency_bp_multiplier", "elevated_exposure_reduction",
                     "emergency_exposure_reduction", "spike_rise_fraction",
                     "spike_floor_vix", "spike_lookback"},
                    path);
  domain::EmergencyPolicy e;
  readOptional(j, "preventive_vix", e.preventive_vix, path);
  readOptional(j, "elevated_vix", e.elevated_vix, path);
  readOptional(j, "emergency_vix", e.emergency_vix, path);
  readOptional(j, "preventive_bp_multiplier", e.preventive_bp_multiplier, path);
  readOptional(j, "elevated_bp_multiplier", e.elevated_bp_multiplier, path);
  readOptional(j, "emergency_bp_multiplier", e.emergency_bp_multiplier, path);
  readOptional(j, "elevated_exposure_reduction", e.elevated_exposure_reduction,
               path);
  readOptional(j, "emergency_exposure_reduction",
               e.emergency_exposure_reduction, path);
  readOptional(j, "spike_rise_fraction", e.spike_rise_fraction, path);
  readOptional(j, "spike_floor_vix", e.spike_floor_vix, path);
  readOptional(j, "spike_lookback", e.spike_lookback, path);
  out = e;
}

void parseDataQuality(const json& j, domain::DataQualityPolicy& out) {
  const std::string path = "data_quality";
  requireObject(j, path);
  rejectUnknownKeys(j,
                    {"session_open_minute", "session_close_minute",
                     "warmup_minutes", "min_plausible_vix",
                     "max_plausible_vix", "stale_after_ms",
                     "major_underlyings"},
                    path);
  domain::DataQualityPolicy d;
  readOptional(j, "session_open_minute", d.session_open_minute, path);
  readOptional(j, "session_close_minute", d.session_close_minute, path);
  readOptional(j, "warmup_minutes", d.warmup_minutes, path);
  readOptional(j, "min_plausible_vix", d.min_plausible_vix, path);
  readOptional(j, "max_plausible_vix", d.max_plausible_vix, path);
  readOptional(j, "stale_after_ms", d.stale_after_ms, path);
  readOptional(j, "major_underlyings", d.major_underlyings, path);
  out = d;
}

bool inUnitInterval(double v) { return std::isfinite(v) && v > 0.0 && v <= 1.0; }

void check(bool ok, const std::string& message) {
  if (!ok) {
    throw ConfigError(message);
  }
}

}  // namespace

std::shared_ptr<const domain::RiskParameters> RiskParametersLoader::fromJson(
    const nlohmann::json& doc) {
  requireObject(doc, "<root>");
  rejectUnknownKeys(doc,
                    {"version", "regime_upper_bounds", "phases", "correlation",
                     "strategy_rules", "default_strategy_rule", "sizing",
                     "defensive", "emergency", "data_quality"},
                    "<root>");

  auto params = std::make_shared<RiskParameters>();
  params->version = readRequired<std::string>(doc, "version", "<root>");

  readOptional(doc, "regime_upper_bounds", params->regime_upper_bounds,
               "<root>");

  if (auto it = doc.find("phases"); it != doc.end()) {
    if (!it->is_array()) {
      throw ConfigError("phases: expected an array");
    }
    params->phases.clear();
    for (std::size_t i = 0; i < it->size(); ++i) {
      params->phases.push_back(
          parsePhase((*it)[i], "phases[" + std::to_string(i) + "]"));
    }
  }

  if (auto it = doc.find("correlation"); it != doc.end()) {
    parseCorrelation(*it, params->correlation);
  }

  if (auto it = doc.find("strategy_rules"); it != doc.end()) {
    requireObject(*it, "strategy_rules");
    params->strategy_rules.clear();
    for (auto rule = it->begin(); rule != it->end(); ++rule) {
      params->strategy_rules[rule.key()] =
          parseRule(rule.value(), "strategy_rules." + rule.key());
    }
  }

  if (auto it = doc.find("default_strategy_rule"); it != doc.end()) {
    params->default_strategy_rule = parseRule(*it, "default_strategy_rule");
  }
  if (auto it = doc.find("sizing"); it != doc.end()) {
    parseSizing(*it, params->sizing);
  }
  if (auto it = doc.find("defensive"); it != doc.end()) {
    parseDefensive(*it, params->defensive);
  }
  if (auto it = doc.find("emergency"); it != doc.end()) {
    parseEmergency(*it, params->emergency);
  }
  if (auto it = doc.find("data_quality"); it != doc.end()) {
    parseDataQuality(*it, params->data_quality);
  }

  validate(*params);
  return params;
}

std::shared_ptr<const domain::RiskParameters> RiskParametersLoader::fromString(
    const std::string& text) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("risk parameters: invalid JSON: ") +
                      e.what());
  }
  return fromJson(doc);
}

std::shared_ptr<const domain::RiskParameters> RiskParametersLoader::fromFile(
    const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("risk parameters: cannot open '" + path + "'");
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto params = fromString(buffer.str());
  std::cout << "[RiskParametersLoader] loaded version '" << params->version
            << "' from " << path << "\n";
  return params;
}

std::shared_ptr<const domain::RiskParameters>
RiskParametersLoader::defaults() {
  auto params = std::make_shared<const RiskParameters>();
  validate(*params);
  return params;
}

void RiskParametersLoader::validate(const domain::RiskParameters& p) {
  check(!p.version.empty(), "version: must not be empty");

  // Regime bands.
  check(p.regime_upper_bounds.size() ==
            static_cast<std::size_t>(domain::kRegimeCount - 1),
        "regime_upper_bounds: expected " +
            std::to_string(domain::kRegimeCount - 1) + " boundaries");
  for (std::size_t i = 0; i < p.regime_upper_bounds.size(); ++i) {
    const double b = p.regime_upper_bounds[i];
    check(std::isfinite(b) && b > 0.0,
          "regime_upper_bounds: boundaries must be positive and finite");
    check(i == 0 || b > p.regime_upper_bounds[i - 1],
          "regime_upper_bounds: boundaries must be strictly ascending");
  }

  // Phases.
  check(!p.phases.empty(), "phases: at least one phase required");
  for (std::size_t i = 0; i < p.phases.size(); ++i) {
    const auto& ph = p.phases[i];
    const std::string where = "phases[" + std::to_string(i) + "]";
    check(ph.phase == static_cast<int>(i) + 1,
          where + ": phases must be numbered 1..N in order");
    check(std::isfinite(ph.min_equity) && ph.min_equity > 0.0,
          where + ": min_equity must be positive");
    check(i == 0 || ph.min_equity > p.phases[i - 1].min_equity,
          where + ": min_equity must be strictly ascending");
    check(ph.max_positions > 0, where + ": max_positions must be positive");
    check(inUnitInterval(ph.max_risk_per_trade),
          where + ": max_risk_per_trade must be in (0, 1]");
    check(ph.default_units >= 1, where + ": default_units must be >= 1");
    check(!ph.allowed_strategies.empty(),
          where + ": allowed_strategies must not be empty");
    for (double bp : ph.max_bp_by_regime) {
      check(inUnitInterval(bp), where + ": max_bp_by_regime must be in (0, 1]");
    }
  }

  // Correlation groups: unique ids, each symbol in at most one group.
  const auto& corr = p.correlation;
  std::set<std::string> group_ids;
  std::set<std::string> symbols;
  for (const auto& g : corr.groups) {
    check(!g.id.empty(), "correlation.groups: group id must not be empty");
    check(group_ids.insert(g.id).second,
          "correlation.groups: duplicate group '" + g.id + "'");
    check(!g.symbols.empty(),
          "correlation.groups." + g.id + ": symbols must not be empty");
    check(std::isfinite(g.crisis_weight) && std::fabs(g.crisis_weight) <= 1.0,
          "correlation.groups." + g.id + ": crisis_weight must be in [-1, 1]");
    for (const auto& s : g.symbols) {
      check(symbols.insert(s).second,
            "correlation.groups: symbol '" + s +
                "' belongs to more than one group");
    }
  }

  check(!corr.tiers.empty(), "correlation.tiers: at least one tier required");
  for (std::size_t i = 0; i < corr.tiers.size(); ++i) {
    const auto& t = corr.tiers[i];
    const std::string where = "correlation.tiers[" + std::to_string(i) + "]";
    check(i == 0 || t.max_equity > corr.tiers[i - 1].max_equity,
          where + ": max_equity must be strictly ascending");
    check(t.default_limit >= 1, where + ": default_limit must be >= 1");
    for (const auto& [group, limit] : t.group_limits) {
      check(group_ids.count(group) == 1,
            where + ": limit for unknown group '" + group + "'");
      check(limit >= 1, where + ": limit for '" + group + "' must be >= 1");
    }
  }
  check(std::isinf(corr.tiers.back().max_equity),
        "correlation.tiers: last tier must have no max_equity");

  check(!corr.equity_aggregate.groups.empty(),
        "correlation.equity_aggregate: groups must not be empty");
  for (const auto& g : corr.equity_aggregate.groups) {
    check(group_ids.count(g) == 1,
          "correlation.equity_aggregate: unknown group '" + g + "'");
  }
  check(corr.equity_aggregate.cap >= 1,
        "correlation.equity_aggregate: cap must be >= 1");
  check(corr.high_regime_reduction >= 0,
        "correlation.high_regime_reduction: must be >= 0");

  // Strategy rules.
  auto checkRule = [](const StrategyRule& r, const std::string& where) {
    check(inUnitInterval(r.profit_target),
          where + ": profit_target must be in (0, 1]");
    check(std::isfinite(r.stop_loss) && r.stop_loss > 0.0,
          where + ": stop_loss must be positive");
    check(r.management_dte >= 0, where + ": management_dte must be >= 0");
    check(r.max_rolls >= 0, where + ": max_rolls must be >= 0");
    check(std::isfinite(r.win_rate) && r.win_rate > 0.0 && r.win_rate < 1.0,
          where + ": win_rate must be in (0, 1)");
    check(std::isfinite(r.avg_win) && r.avg_win > 0.0,
          where + ": avg_win must be positive");
    check(std::isfinite(r.avg_loss) && r.avg_loss > 0.0,
          where + ": avg_loss must be positive");
    check(inUnitInterval(r.bp_requirement),
          where + ": bp_requirement must be in (0, 1]");
  };
  for (const auto& [tag, rule] : p.strategy_rules) {
    checkRule(rule, "strategy_rules." + tag);
  }
  checkRule(p.default_strategy_rule, "default_strategy_rule");

  // Sizing.
  check(inUnitInterval(p.sizing.kelly_multiplier),
        "sizing.kelly_multiplier must be in (0, 1]");
  check(inUnitInterval(p.sizing.per_trade_risk_cap),
        "sizing.per_trade_risk_cap must be in (0, 1]");

  // Defensive window: rolls must land strictly after the defend threshold.
  const auto& d = p.defensive;
  check(d.absolute_dte >= 1, "defensive.absolute_dte must be >= 1");
  check(d.roll_min_dte > d.absolute_dte,
        "defensive.roll_min_dte must be greater than absolute_dte");
  check(d.roll_max_dte >= d.roll_min_dte,
        "defensive.roll_max_dte must be >= roll_min_dte");
  check(d.assignment_window_dte >= 0 && d.assignment_window_dte < d.absolute_dte,
        "defensive.assignment_window_dte must be in [0, absolute_dte)");
  check(d.put_itm_buffer >= 0.0 && d.call_itm_buffer >= 0.0,
        "defensive: ITM buffers must be >= 0");

  // Emergency ladder.
  const auto& e = p.emergency;
  check(e.preventive_vix > 0.0 && e.preventive_vix < e.elevated_vix &&
            e.elevated_vix < e.emergency_vix,
        "emergency: thresholds must be positive and strictly ascending");
  for (double m : {e.preventive_bp_multiplier, e.elevated_bp_multiplier,
                   e.emergency_bp_multiplier, e.elevated_exposure_reduction,
                   e.emergency_exposure_reduction}) {
    check(std::isfinite(m) && m >= 0.0 && m <= 1.0,
          "emergency: multipliers and reductions must be in [0, 1]");
  }
  check(e.spike_rise_fraction > 0.0,
        "emergency.spike_rise_fraction must be positive");
  check(e.spike_lookback >= 1, "emergency.spike_lookback must be >= 1");

  // Data quality.
  const auto& q = p.data_quality;
  check(q.session_open_minute >= 0 &&
            q.session_open_minute < q.session_close_minute &&
            q.session_close_minute <= 24 * 60,
        "data_quality: session minutes must satisfy 0 <= open < close <= 1440");
  check(q.warmup_minutes >= 0, "data_quality.warmup_minutes must be >= 0");
  check(q.min_plausible_vix >= 0.0 && q.min_plausible_vix < q.max_plausible_vix,
        "data_quality: plausible VIX range is empty");
  check(q.stale_after_ms > 0, "data_quality.stale_after_ms must be positive");
}

}  // namespace optguard
