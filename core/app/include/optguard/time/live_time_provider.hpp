#pragma once

#include "optguard/time/i_time_provider.hpp"

namespace optguard {

// System clock.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace optguard
