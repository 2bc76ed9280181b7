#pragma once

namespace optguard {
namespace domain {

// -----------------------------------------------------------------------------
// Regime — discrete volatility bucket derived from the VIX reading
// -----------------------------------------------------------------------------
//
// @brief  Five ordered bands. Ordering is meaningful: callers compare with
//         `>=` (e.g. "regime >= High shrinks correlation limits").
//
// @details
// Band boundaries come from RiskParameters::regime_upper_bounds and are
// half-open [low, high). A reading exactly on a boundary belongs to the
// higher band.
// -----------------------------------------------------------------------------
enum class Regime { VeryLow = 0, Low = 1, Normal = 2, High = 3, VeryHigh = 4 };

constexpr int kRegimeCount = 5;

// Simplified two-band view used by policies that only care whether the
// market is stressed. High <=> Regime >= Regime::High.
enum class CoarseRegime { Normal, High };

// -----------------------------------------------------------------------------
// RegimeReading — output of RegimeClassifier::classify()
// -----------------------------------------------------------------------------
struct RegimeReading {
  double vix{0.0};
  Regime regime{Regime::Normal};
  int phase{0};
  double max_bp_fraction{0.0};  // Max buying-power usage for (phase, regime)
};

inline const char* toString(Regime r) {
  switch (r) {
    case Regime::VeryLow:  return "VERY_LOW";
    case Regime::Low:      return "LOW";
    case Regime::Normal:   return "NORMAL";
    case Regime::High:     return "HIGH";
    case Regime::VeryHigh: return "VERY_HIGH";
  }
  return "UNKNOWN";
}

inline const char* toString(CoarseRegime r) {
  return r == CoarseRegime::High ? "HIGH" : "NORMAL";
}

}  // namespace domain
}  // namespace optguard
