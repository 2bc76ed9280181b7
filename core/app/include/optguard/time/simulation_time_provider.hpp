#pragma once

#include "optguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace optguard {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
// Clock that only moves when told to. advance_time() sets an absolute epoch
// ms value; readers on other threads see it through the atomic.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace optguard
