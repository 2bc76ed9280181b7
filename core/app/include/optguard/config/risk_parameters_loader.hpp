#pragma once

#include "optguard/domain/risk_parameters.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace optguard {

// -----------------------------------------------------------------------------
// RiskParametersLoader — JSON -> validated, immutable RiskParameters
// -----------------------------------------------------------------------------
//
// @brief  Builds the policy table from a versioned JSON document.
//
// @details
// Document shape (every section except "version" is optional):
//
//   {
//     "version": "2024-08-rev3",
//     "regime_upper_bounds": [15, 20, 30, 40],
//     "phases": [ { "phase": 1, "min_equity": 30000, ... }, ... ],
//     "correlation": { "groups": [...], "tiers": [...], ... },
//     "strategy_rules": { "LONG_TERM_112": { ... }, ... },
//     "default_strategy_rule": { ... },
//     "sizing": { ... }, "defensive": { ... },
//     "emergency": { ... }, "data_quality": { ... }
//   }
//
// A present section replaces the built-in default section wholesale; the
// loader never merges individual entries of a list. Unknown keys at any
// level are rejected so that a typo cannot silently fall back to a default.
//
// Error handling:
//   Every problem (parse error, wrong type, missing key, failed invariant)
//   is reported as ConfigError with a message naming the offending path.
// -----------------------------------------------------------------------------
class RiskParametersLoader {
 public:
  static std::shared_ptr<const domain::RiskParameters> fromJson(
      const nlohmann::json& doc);

  static std::shared_ptr<const domain::RiskParameters> fromString(
      const std::string& text);

  static std::shared_ptr<const domain::RiskParameters> fromFile(
      const std::string& path);

  // Built-in defaults, validated.
  static std::shared_ptr<const domain::RiskParameters> defaults();

  // Throws ConfigError on the first violated invariant.
  static void validate(const domain::RiskParameters& params);
};

}  // namespace optguard
