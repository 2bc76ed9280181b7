#pragma once

#include <cstdint>

namespace optguard {

// -----------------------------------------------------------------------------
// ITimeProvider
// -----------------------------------------------------------------------------
// Source of "now" for event timestamps and for filling MarketSnapshot.now_ms
// when a caller leaves it unset. Live in production, simulated in tests and
// replays so that days-to-expiry arithmetic is reproducible.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace optguard
