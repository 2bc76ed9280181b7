#pragma once

#include <chrono>

namespace optguard {

// Wall-clock (or simulated) instant attached to every decision event.
using Timestamp = std::chrono::system_clock::time_point;

}  // namespace optguard
