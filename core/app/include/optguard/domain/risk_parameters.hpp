#pragma once

#include "optguard/domain/regime.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace optguard {
namespace domain {

// -----------------------------------------------------------------------------
// PhaseDefinition — one account-equity tier
// -----------------------------------------------------------------------------
//
// @brief  Entry threshold, position/risk ceilings, strategy allow-list and
//         regime-dependent buying-power table for one phase.
//
// @details
// allowed_strategies is cumulative (phase 2 lists phase 1's strategies too).
// The single entry "ALL" is a wildcard admitting every strategy tag.
// max_bp_by_regime is indexed by static_cast<int>(Regime).
// -----------------------------------------------------------------------------
struct PhaseDefinition {
  int phase{1};
  double min_equity{0.0};
  int max_positions{0};
  double max_risk_per_trade{0.0};
  int default_units{1};
  double monthly_target{0.0};
  std::vector<std::string> allowed_strategies;
  std::array<double, kRegimeCount> max_bp_by_regime{};
  std::string description;
};

constexpr const char* kAllStrategies = "ALL";

// A set of instruments assumed to move together under stress.
struct CorrelationGroupDefinition {
  std::string id;
  std::string description;
  std::vector<std::string> symbols;
  double crisis_weight{0.0};  // Signed crisis correlation; |w| drives risk
};

// -----------------------------------------------------------------------------
// EquityTier — per-group position-count limits for accounts below max_equity
// -----------------------------------------------------------------------------
// Tiers are ordered by max_equity; the last tier has max_equity = +inf.
// A group missing from group_limits gets default_limit.
// -----------------------------------------------------------------------------
struct EquityTier {
  std::string name;
  double max_equity{std::numeric_limits<double>::infinity()};
  std::map<std::string, int> group_limits;
  int default_limit{1};
};

// Combined cap across the equity-like groups.
struct EquityAggregateRule {
  std::string name{"A1+A2"};
  std::vector<std::string> groups{"A1", "A2"};
  int cap{3};
};

struct CorrelationPolicy {
  std::vector<CorrelationGroupDefinition> groups{
      {"A1", "Equity index futures",
       {"ES", "MES", "NQ", "MNQ", "RTY", "M2K", "YM", "MYM"}, 0.95},
      {"A2", "Equity index ETFs", {"SPY", "QQQ", "IWM", "DIA"}, 0.90},
      {"B1", "Safe haven", {"GC", "MGC", "GLD", "TLT", "ZB", "ZN"}, -0.20},
      {"B2", "Industrial metals", {"SI", "SIL", "SLV", "HG", "PL", "PA"}, 0.60},
      {"C1", "Crude complex", {"CL", "MCL", "QM", "RB", "HO", "XLE", "XOP"}, 0.70},
      {"C2", "Natural gas", {"NG"}, 0.65},
      {"D1", "Grains", {"ZC", "ZS", "ZW"}, 0.50},
      {"D2", "Proteins", {"LE", "HE", "GF"}, 0.45},
      {"E", "Currencies", {"6E", "6B", "6A", "6C", "M6E", "M6A", "DXY"}, 0.30},
  };

  std::vector<EquityTier> tiers{
      {"SMALL", 30000.0, {{"A1", 1}, {"A2", 2}}, 1},
      {"MEDIUM", 65000.0,
       {{"A1", 2}, {"A2", 3}, {"B1", 2}, {"B2", 2}, {"C1", 2},
        {"C2", 1}, {"D1", 2}, {"D2", 1}, {"E", 2}},
       1},
      {"LARGE", std::numeric_limits<double>::infinity(),
       {{"A1", 2}, {"A2", 3}, {"B1", 2}, {"B2", 2}, {"C1", 2},
        {"C2", 1}, {"D1", 2}, {"D2", 1}, {"E", 2}},
       1},
  };

  EquityAggregateRule equity_aggregate;

  // Limits shrink by this much (floor 1) when regime >= High.
  int high_regime_reduction{1};

  // When false, symbols outside every group are admitted with a POLICY GAP
  // warning and recorded in unmappedSymbols().
  bool reject_unmapped_symbols{false};

  double risk_score_warning{70.0};
};

// -----------------------------------------------------------------------------
// StrategyRule — data-driven management rules keyed by strategy tag
// -----------------------------------------------------------------------------
//
//   profit_target    close at this fraction of max profit (0.50 = 50%)
//   stop_loss        close when loss reaches this multiple of the basis
//   management_dte   strategy-specific defend threshold; the effective
//                    threshold is max(DefensivePolicy::absolute_dte, this)
//   max_rolls        rolls allowed before a defense degrades to CLOSE
//   win_rate / avg_win / avg_loss   Kelly priors for sizePosition(strategy)
//   bp_requirement   buying power (fraction of equity) per new position
// -----------------------------------------------------------------------------
struct StrategyRule {
  double profit_target{0.50};
  double stop_loss{2.0};
  int management_dte{21};
  int max_rolls{1};
  double win_rate{0.60};
  double avg_win{0.50};
  double avg_loss{1.00};
  double bp_requirement{0.05};
};

struct SizingPolicy {
  double kelly_multiplier{0.25};
  double per_trade_risk_cap{0.05};
};

struct DefensivePolicy {
  int absolute_dte{21};
  int roll_min_dte{30};
  int roll_max_dte{45};
  int assignment_window_dte{1};
  double put_itm_buffer{0.02};   // Short put ITM by more than 2% -> emergency
  double call_itm_buffer{0.01};  // Short call ITM by more than 1% -> emergency
};

// -----------------------------------------------------------------------------
// EmergencyPolicy — VIX ladder for the emergency protocol
// -----------------------------------------------------------------------------
// Thresholds are inclusive lower bounds and must be strictly ascending.
// -----------------------------------------------------------------------------
struct EmergencyPolicy {
  double preventive_vix{25.0};
  double elevated_vix{35.0};
  double emergency_vix{40.0};
  double preventive_bp_multiplier{0.80};
  double elevated_bp_multiplier{0.50};
  double emergency_bp_multiplier{0.0};
  double elevated_exposure_reduction{0.15};
  double emergency_exposure_reduction{0.40};
  double spike_rise_fraction{0.50};
  double spike_floor_vix{30.0};
  int spike_lookback{5};
};

// -----------------------------------------------------------------------------
// DataQualityPolicy — exchange-session constants for severity assignment
// -----------------------------------------------------------------------------
// Minutes are exchange-local minutes after midnight (570 = 09:30).
// -----------------------------------------------------------------------------
struct DataQualityPolicy {
  int session_open_minute{570};
  int session_close_minute{960};
  int warmup_minutes{5};
  double min_plausible_vix{5.0};
  double max_plausible_vix{150.0};
  std::int64_t stale_after_ms{5 * 60 * 1000};
  std::vector<std::string> major_underlyings{"SPY", "QQQ", "IWM", "ES", "NQ"};
};

// -----------------------------------------------------------------------------
// RiskParameters — the complete, versioned policy table
// -----------------------------------------------------------------------------
//
// @brief  Immutable configuration value injected into every decision
//         component at construction time.
//
// @details
// Defaults below are the production policy. RiskParametersLoader replaces
// whole sections from a JSON document and validates the result; the
// validated table is then shared as std::shared_ptr<const RiskParameters>.
// Nothing mutates a published table. Reload means building a new one and
// handing it to DecisionCore::reloadParameters().
//
// regime_upper_bounds holds kRegimeCount - 1 ascending VIX boundaries:
//   vix < b[0] VeryLow, [b[0], b[1]) Low, [b[1], b[2]) Normal,
//   [b[2], b[3]) High, >= b[3] VeryHigh.
// -----------------------------------------------------------------------------
struct RiskParameters {
  std::string version{"builtin-1"};

  std::vector<double> regime_upper_bounds{15.0, 20.0, 30.0, 40.0};

  std::vector<PhaseDefinition> phases{
      {1, 30000.0, 6, 0.03, 1, 0.05,
       {"FRIDAY_0DTE", "LONG_TERM_112", "FUTURES_STRANGLES"},
       {0.45, 0.52, 0.65, 0.75, 0.80},
       "Foundation: MES/MCL strangles, 0DTE, LT112"},
      {2, 40000.0, 10, 0.04, 2, 0.08,
       {"FRIDAY_0DTE", "LONG_TERM_112", "FUTURES_STRANGLES", "IPMCC",
        "POOR_MANS_COVERED_CALL"},
       {0.50, 0.55, 0.65, 0.75, 0.80},
       "Growth: adds IPMCC and diagonals"},
      {3, 60000.0, 12, 0.05, 3, 0.10,
       {"FRIDAY_0DTE", "LONG_TERM_112", "FUTURES_STRANGLES", "IPMCC",
        "POOR_MANS_COVERED_CALL", "LEAP_PUT_LADDERS", "ENHANCED_BUTTERFLY",
        "RATIO_SPREADS"},
       {0.52, 0.60, 0.68, 0.75, 0.80},
       "Advanced: adds butterflies, ratios, LEAP ladders"},
      {4, 75000.0, 15, 0.05, 5, 0.12,
       {kAllStrategies},
       {0.55, 0.65, 0.70, 0.78, 0.82},
       "Professional: all strategies"},
  };

  CorrelationPolicy correlation;

  std::map<std::string, StrategyRule> strategy_rules{
      {"FRIDAY_0DTE", {0.50, 2.0, 0, 0, 0.88, 0.50, 1.00, 0.02}},
      {"LONG_TERM_112", {0.90, 3.0, 21, 2, 0.95, 0.90, 3.00, 0.06}},
      {"FUTURES_STRANGLES", {0.50, 2.0, 21, 1, 0.80, 0.50, 1.50, 0.05}},
      {"IPMCC", {0.50, 2.0, 21, 2, 0.75, 0.50, 1.00, 0.08}},
      {"POOR_MANS_COVERED_CALL", {0.50, 2.0, 21, 2, 0.75, 0.50, 1.00, 0.08}},
      {"LEAP_PUT_LADDERS", {0.60, 2.0, 30, 1, 0.75, 0.60, 1.20, 0.06}},
      {"ENHANCED_BUTTERFLY", {0.75, 0.50, 30, 0, 0.55, 0.75, 0.50, 0.02}},
      {"RATIO_SPREADS", {0.60, 2.50, 21, 1, 0.70, 0.60, 1.50, 0.04}},
  };

  // Applied (and logged as a policy gap) for tags missing from the table.
  StrategyRule default_strategy_rule;

  SizingPolicy sizing;
  DefensivePolicy defensive;
  EmergencyPolicy emergency;
  DataQualityPolicy data_quality;
};

}  // namespace domain
}  // namespace optguard
