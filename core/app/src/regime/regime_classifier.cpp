#include "optguard/regime/regime_classifier.hpp"

#include "optguard/errors/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace optguard {

RegimeClassifier::RegimeClassifier(
    std::shared_ptr<const domain::RiskParameters> params)
    : params_(std::move(params)) {}

domain::Regime RegimeClassifier::regimeFor(double vix) const {
  if (!std::isfinite(vix) || vix < 0.0) {
    throw DataUnavailableError("VIX", domain::DataSeverity::Critical,
                               "reading " + std::to_string(vix) +
                                   " is not a valid volatility level");
  }

  const auto& bounds = params_->regime_upper_bounds;
  for (std::size_t i = 0; i < bounds.size(); ++i) {
    // Strict '<': a reading equal to the boundary belongs to the next band.
    if (vix < bounds[i]) {
      return static_cast<domain::Regime>(i);
    }
  }
  return domain::Regime::VeryHigh;
}

domain::RegimeReading RegimeClassifier::classify(double vix, int phase) const {
  domain::RegimeReading reading;
  reading.vix = vix;
  reading.regime = regimeFor(vix);
  reading.phase = phase;
  reading.max_bp_fraction = maxBuyingPower(phase, reading.regime);
  return reading;
}

domain::CoarseRegime RegimeClassifier::classifyCoarse(double vix) const {
  return regimeFor(vix) >= domain::Regime::High ? domain::CoarseRegime::High
                                                : domain::CoarseRegime::Normal;
}

double RegimeClassifier::maxBuyingPower(int phase,
                                        domain::Regime regime) const {
  for (const auto& def : params_->phases) {
    if (def.phase == phase) {
      return def.max_bp_by_regime[static_cast<std::size_t>(regime)];
    }
  }
  return 0.0;
}

}  // namespace optguard
