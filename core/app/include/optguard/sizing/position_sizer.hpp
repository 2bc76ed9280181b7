#pragma once

#include "optguard/domain/risk_parameters.hpp"

#include <string>

namespace optguard {

enum class SizingError {
  None,
  NonFiniteInput,
  WinRateOutOfRange,
  NonPositiveAverageWin,
  NegativeAverageLoss,
  ZeroAverageLoss,
  InvalidCap
};

// -----------------------------------------------------------------------------
// SizingResult
// -----------------------------------------------------------------------------
// Degenerate inputs are reported here, never thrown: risk_fraction = 0,
// should_trade = false, error != None. A valid but negative edge is not an
// error (error == None, should_trade == false).
// -----------------------------------------------------------------------------
struct SizingResult {
  double risk_fraction{0.0};
  bool should_trade{false};
  SizingError error{SizingError::None};
  double raw_kelly{0.0};
  std::string reason;
};

// -----------------------------------------------------------------------------
// PositionSizer — fractional Kelly with a hard ceiling
// -----------------------------------------------------------------------------
//
// @brief  f* = (p * b - q) / b with b = avg_win / avg_loss and q = 1 - p,
//         scaled by the Kelly multiplier (0.25) and clamped to [0, cap].
//
// @details
// The effective cap is min(cap argument, SizingPolicy::per_trade_risk_cap),
// so no caller can size above the global 5% ceiling. avg_loss is a positive
// magnitude.
//
// Thread-safety: stateless after construction.
// -----------------------------------------------------------------------------
class PositionSizer {
 public:
  explicit PositionSizer(domain::SizingPolicy policy);

  SizingResult size(double win_rate, double avg_win, double avg_loss,
                    double cap) const;

  // Uses the policy's per-trade cap.
  SizingResult size(double win_rate, double avg_win, double avg_loss) const;

  static const char* toString(SizingError e);

 private:
  static SizingResult reject(SizingError error, std::string reason);

  domain::SizingPolicy policy_;
};

}  // namespace optguard
