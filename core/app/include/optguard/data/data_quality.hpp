#pragma once

#include "optguard/domain/market_data.hpp"
#include "optguard/domain/risk_parameters.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace optguard {

// -----------------------------------------------------------------------------
// DataQualityClassifier
// -----------------------------------------------------------------------------
//
// @brief  Turns a raw optional reading into the MarketValue sum type,
//         assigning a severity to anything that is missing or implausible.
//
// @details
// Severity of a missing reading depends on the exchange session:
//
//   before open / after close      EXPECTED
//   first warmup_minutes of session WARNING
//   in session                      CRITICAL
//   missing major underlying,
//   in session after warmup         FATAL
//
// A VIX outside [min_plausible_vix, max_plausible_vix] is treated as
// missing. A reading older than stale_after_ms is Degraded (the value is
// kept, flagged as stale).
//
// session_minute is minutes after exchange-local midnight.
// -----------------------------------------------------------------------------
class DataQualityClassifier {
 public:
  explicit DataQualityClassifier(domain::DataQualityPolicy policy);

  domain::MarketValue classifyVix(std::optional<double> raw, int session_minute,
                                  std::int64_t age_ms = 0) const;

  domain::MarketValue classifyUnderlying(const std::string& symbol,
                                         std::optional<double> raw,
                                         int session_minute,
                                         std::int64_t age_ms = 0) const;

  domain::MarketValue classifyOptionMark(std::optional<double> raw,
                                         int session_minute,
                                         std::int64_t age_ms = 0) const;

  domain::DataSeverity severityForMissing(int session_minute) const;

  bool isMajorUnderlying(const std::string& symbol) const;

 private:
  domain::MarketValue classify(std::optional<double> raw,
                               domain::DataSeverity missing_severity,
                               std::int64_t age_ms,
                               const std::string& what) const;

  domain::DataQualityPolicy policy_;
};

}  // namespace optguard
