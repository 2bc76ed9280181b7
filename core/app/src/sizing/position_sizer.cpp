#include "optguard/sizing/position_sizer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace optguard {

PositionSizer::PositionSizer(domain::SizingPolicy policy) : policy_(policy) {}

SizingResult PositionSizer::reject(SizingError error, std::string reason) {
  SizingResult r;
  r.error = error;
  r.reason = std::move(reason);
  return r;
}

SizingResult PositionSizer::size(double win_rate, double avg_win,
                                 double avg_loss) const {
  return size(win_rate, avg_win, avg_loss, policy_.per_trade_risk_cap);
}

SizingResult PositionSizer::size(double win_rate, double avg_win,
                                 double avg_loss, double cap) const {
  if (!std::isfinite(win_rate) || !std::isfinite(avg_win) ||
      !std::isfinite(avg_loss) || !std::isfinite(cap)) {
    return reject(SizingError::NonFiniteInput, "non-finite sizing input");
  }
  if (win_rate <= 0.0 || win_rate >= 1.0) {
    return reject(SizingError::WinRateOutOfRange,
                  "win rate must be strictly between 0 and 1");
  }
  if (avg_win <= 0.0) {
    return reject(SizingError::NonPositiveAverageWin,
                  "average win must be positive");
  }
  if (avg_loss < 0.0) {
    return reject(SizingError::NegativeAverageLoss,
                  "average loss is a magnitude and must not be negative");
  }
  if (avg_loss == 0.0) {
    return reject(SizingError::ZeroAverageLoss,
                  "average loss of zero makes the payoff ratio undefined");
  }
  if (cap <= 0.0) {
    return reject(SizingError::InvalidCap, "risk cap must be positive");
  }

  const double b = avg_win / avg_loss;
  const double q = 1.0 - win_rate;
  const double kelly = (win_rate * b - q) / b;

  SizingResult r;
  r.raw_kelly = kelly;
  if (kelly <= 0.0) {
    r.reason = "negative edge";
    return r;
  }

  const double effective_cap = std::min(cap, policy_.per_trade_risk_cap);
  r.risk_fraction =
      std::clamp(kelly * policy_.kelly_multiplier, 0.0, effective_cap);
  r.should_trade = r.risk_fraction > 0.0;
  r.reason = r.risk_fraction < kelly * policy_.kelly_multiplier
                 ? "fractional kelly capped"
                 : "fractional kelly";
  return r;
}

const char* PositionSizer::toString(SizingError e) {
  switch (e) {
    case SizingError::None:                  return "NONE";
    case SizingError::NonFiniteInput:        return "NON_FINITE_INPUT";
    case SizingError::WinRateOutOfRange:     return "WIN_RATE_OUT_OF_RANGE";
    case SizingError::NonPositiveAverageWin: return "NON_POSITIVE_AVERAGE_WIN";
    case SizingError::NegativeAverageLoss:   return "NEGATIVE_AVERAGE_LOSS";
    case SizingError::ZeroAverageLoss:       return "ZERO_AVERAGE_LOSS";
    case SizingError::InvalidCap:            return "INVALID_CAP";
  }
  return "UNKNOWN";
}

}  // namespace optguard
