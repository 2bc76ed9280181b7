#pragma once

#include "optguard/domain/position.hpp"

#include <string>
#include <vector>

namespace optguard {

// -----------------------------------------------------------------------------
// IPositionSource — where previously open positions come from on start-up
// -----------------------------------------------------------------------------
//
// @brief  Persistence/broker collaborator queried once by
//         DecisionService::start() before any admission is served.
//
// @details
// Returned positions are hydrated into DecisionCore without admission
// checks: they already exist at the broker, so refusing them would only
// blind the core to real exposure. Over-limit groups are logged.
// Implementations throw on an unreadable source; start() lets that
// propagate so the service does not run with an unknown book.
// -----------------------------------------------------------------------------
class IPositionSource {
 public:
  virtual ~IPositionSource() = default;

  virtual std::vector<domain::Position> loadOpenPositions() = 0;
};

// -----------------------------------------------------------------------------
// JsonFilePositionSource — reads a JSON array of positions from disk
// -----------------------------------------------------------------------------
// Format: [ { "id": "...", "symbol": "SPY", "strategy": "...", ... }, ... ]
// (see codec::from_json(Position)). Throws std::runtime_error when the file
// cannot be opened or parsed.
// -----------------------------------------------------------------------------
class JsonFilePositionSource : public IPositionSource {
 public:
  explicit JsonFilePositionSource(std::string path);

  std::vector<domain::Position> loadOpenPositions() override;

 private:
  std::string path_;
};

}  // namespace optguard
