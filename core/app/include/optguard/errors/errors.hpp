#pragma once

#include "optguard/domain/market_data.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace optguard {

// -----------------------------------------------------------------------------
// ConfigError — the policy table is malformed or inconsistent
// -----------------------------------------------------------------------------
// Thrown by RiskParametersLoader. The service refuses to start on it.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// DataUnavailableError — a decision needed market data that is not usable
// -----------------------------------------------------------------------------
//
// @brief  Fail-fast signal raised instead of substituting a default value.
//
// @details
// Carries the instrument ("VIX", an underlying symbol or a position id) and
// the severity assigned by the data-quality classifier. Callers decide what
// to do per severity; the decision core has already tripped its kill switch
// when severity is Fatal.
// -----------------------------------------------------------------------------
class DataUnavailableError : public std::runtime_error {
 public:
  DataUnavailableError(std::string instrument, domain::DataSeverity severity,
                       const std::string& reason)
      : std::runtime_error("data unavailable for " + instrument + " [" +
                           domain::toString(severity) + "]: " + reason),
        instrument_(std::move(instrument)),
        severity_(severity) {}

  const std::string& instrument() const noexcept { return instrument_; }
  domain::DataSeverity severity() const noexcept { return severity_; }

 private:
  std::string instrument_;
  domain::DataSeverity severity_;
};

}  // namespace optguard
