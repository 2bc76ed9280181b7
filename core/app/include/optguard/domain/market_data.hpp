#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace optguard {
namespace domain {

// -----------------------------------------------------------------------------
// DataSeverity — how bad is a missing or untrustworthy reading
// -----------------------------------------------------------------------------
//
//   Expected  normal for the time of day (pre/post market). Log only.
//   Warning   concerning but not blocking (e.g. first minutes of session).
//   Critical  halts admission for the affected instrument.
//   Fatal     halts the whole decision core (kill switch).
// -----------------------------------------------------------------------------
enum class DataSeverity { Expected = 0, Warning = 1, Critical = 2, Fatal = 3 };

inline const char* toString(DataSeverity s) {
  switch (s) {
    case DataSeverity::Expected: return "EXPECTED";
    case DataSeverity::Warning:  return "WARNING";
    case DataSeverity::Critical: return "CRITICAL";
    case DataSeverity::Fatal:    return "FATAL";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// MarketValue — sum type returned for every market-data query
// -----------------------------------------------------------------------------
//
// @brief  {Value(x), Degraded(x, reason), Unavailable(severity)}.
//
// @details
// Every consumer must handle all three alternatives; there is no implicit
// conversion to double. Degraded still carries the last observed value
// (stale or suspicious) together with the reason it is not fully trusted.
// Unavailable carries no value at all, only the severity assigned by the
// data-quality classifier.
// -----------------------------------------------------------------------------
struct AvailableValue {
  double value{0.0};
};

struct DegradedValue {
  double value{0.0};
  std::string reason;
};

struct UnavailableValue {
  DataSeverity severity{DataSeverity::Critical};
  std::string reason;
};

using MarketValue = std::variant<AvailableValue, DegradedValue, UnavailableValue>;

// Returns the numeric payload for Available/Degraded, nullopt for Unavailable.
inline std::optional<double> usableValue(const MarketValue& v) {
  if (const auto* a = std::get_if<AvailableValue>(&v)) {
    return a->value;
  }
  if (const auto* d = std::get_if<DegradedValue>(&v)) {
    return d->value;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// MarketSnapshot — already-resolved market state injected on every tick
// -----------------------------------------------------------------------------
//
// @brief  The decision core never fetches data; the market-data layer hands
//         it one of these per decision tick.
//
// @details
//   now_ms         decision time (epoch ms). Drives days-to-expiry.
//   vix            volatility index reading.
//   underlyings    underlying price per symbol (e.g. "SPY" -> 545.2).
//   option_marks   current mark per position id.
//
// A symbol missing from a map means "not supplied on this tick", which is
// different from an Unavailable entry (supplied, but classified as unusable).
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  std::int64_t now_ms{0};
  MarketValue vix{UnavailableValue{DataSeverity::Critical, "not supplied"}};
  std::unordered_map<std::string, MarketValue> underlyings;
  std::unordered_map<std::string, MarketValue> option_marks;
};

}  // namespace domain
}  // namespace optguard
