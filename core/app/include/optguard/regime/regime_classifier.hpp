#pragma once

#include "optguard/domain/regime.hpp"
#include "optguard/domain/risk_parameters.hpp"

#include <memory>

namespace optguard {

// -----------------------------------------------------------------------------
// RegimeClassifier
// -----------------------------------------------------------------------------
//
// @brief  Maps a VIX reading to a discrete Regime and, together with the
//         account phase, to the maximum buying-power usage allowed.
//
// @details
// Pure function of (vix, phase) over the injected policy table. Bands are
// half-open [low, high): a reading exactly on a boundary always resolves to
// the higher band, so repeated calls on the same input never flip.
//
// Phase 0 (below minimum equity) carries a zero buying-power budget.
//
// Error handling:
//   A non-finite or negative VIX is not a reading. classify() throws
//   DataUnavailableError(Critical) rather than guessing a band; callers
//   that hold a MarketValue resolve availability before calling.
//
// Thread-safety:
//   Immutable after construction. Safe to call from any thread.
// -----------------------------------------------------------------------------
class RegimeClassifier {
 public:
  explicit RegimeClassifier(std::shared_ptr<const domain::RiskParameters> params);

  domain::Regime regimeFor(double vix) const;

  domain::RegimeReading classify(double vix, int phase) const;

  domain::CoarseRegime classifyCoarse(double vix) const;

  // 0.0 for phase 0 or a phase outside the table.
  double maxBuyingPower(int phase, domain::Regime regime) const;

 private:
  std::shared_ptr<const domain::RiskParameters> params_;
};

}  // namespace optguard
