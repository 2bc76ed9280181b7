#include "optguard/data/data_quality.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace optguard {

using domain::DataSeverity;
using domain::MarketValue;

DataQualityClassifier::DataQualityClassifier(domain::DataQualityPolicy policy)
    : policy_(std::move(policy)) {}

DataSeverity DataQualityClassifier::severityForMissing(
    int session_minute) const {
  if (session_minute < policy_.session_open_minute ||
      session_minute >= policy_.session_close_minute) {
    return DataSeverity::Expected;
  }
  if (session_minute < policy_.session_open_minute + policy_.warmup_minutes) {
    return DataSeverity::Warning;
  }
  return DataSeverity::Critical;
}

bool DataQualityClassifier::isMajorUnderlying(const std::string& symbol) const {
  const auto& majors = policy_.major_underlyings;
  return std::find(majors.begin(), majors.end(), symbol) != majors.end();
}

MarketValue DataQualityClassifier::classify(std::optional<double> raw,
                                            DataSeverity missing_severity,
                                            std::int64_t age_ms,
                                            const std::string& what) const {
  if (!raw || !std::isfinite(*raw) || *raw <= 0.0) {
    return domain::UnavailableValue{missing_severity, what + " missing"};
  }
  if (age_ms > policy_.stale_after_ms) {
    return domain::DegradedValue{
        *raw, what + " stale (" + std::to_string(age_ms / 1000) + "s old)"};
  }
  return domain::AvailableValue{*raw};
}

MarketValue DataQualityClassifier::classifyVix(std::optional<double> raw,
                                               int session_minute,
                                               std::int64_t age_ms) const {
  const DataSeverity missing = severityForMissing(session_minute);
  if (raw && std::isfinite(*raw) &&
      (*raw < policy_.min_plausible_vix || *raw > policy_.max_plausible_vix)) {
    return domain::UnavailableValue{
        missing, "VIX reading " + std::to_string(*raw) + " is implausible"};
  }
  return classify(raw, missing, age_ms, "VIX");
}

MarketValue DataQualityClassifier::classifyUnderlying(const std::string& symbol,
                                                      std::optional<double> raw,
                                                      int session_minute,
                                                      std::int64_t age_ms) const {
  DataSeverity missing = severityForMissing(session_minute);
  if (missing == DataSeverity::Critical && isMajorUnderlying(symbol)) {
    missing = DataSeverity::Fatal;
  }
  return classify(raw, missing, age_ms, symbol);
}

MarketValue DataQualityClassifier::classifyOptionMark(std::optional<double> raw,
                                                      int session_minute,
                                                      std::int64_t age_ms) const {
  // A zero mark is a legitimate worthless option; only NaN/negative/missing
  // count as unavailable.
  if (raw && std::isfinite(*raw) && *raw == 0.0) {
    return domain::AvailableValue{0.0};
  }
  return classify(raw, severityForMissing(session_minute), age_ms,
                  "option mark");
}

}  // namespace optguard
