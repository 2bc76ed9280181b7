#pragma once

#include "optguard/domain/regime.hpp"

#include <string>

namespace optguard {
namespace domain {

// Account state as reported by the broker layer on each decision tick.
struct AccountSnapshot {
  std::string account_id;
  double equity{0.0};
  double buying_power_used{0.0};  // Fraction of equity currently committed
};

// -----------------------------------------------------------------------------
// Account — the decision core's derived view of the account
// -----------------------------------------------------------------------------
// phase and regime are recomputed from every snapshot; never written by
// callers directly.
// -----------------------------------------------------------------------------
struct Account {
  std::string account_id;
  double equity{0.0};
  int phase{0};
  Regime regime{Regime::Normal};
  double buying_power_used{0.0};
};

}  // namespace domain
}  // namespace optguard
