#include "optguard/source/i_position_source.hpp"

#include "optguard/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace optguard {

JsonFilePositionSource::JsonFilePositionSource(std::string path)
    : path_(std::move(path)) {}

std::vector<domain::Position> JsonFilePositionSource::loadOpenPositions() {
  std::ifstream in(path_);
  if (!in) {
    throw std::runtime_error("cannot open position file '" + path_ + "'");
  }

  std::vector<domain::Position> positions;
  try {
    const auto doc = nlohmann::json::parse(in);
    positions = doc.get<std::vector<domain::Position>>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("position file '" + path_ +
                             "' is malformed: " + e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("position file '" + path_ +
                             "' has an invalid value: " + e.what());
  }

  std::cout << "[PositionSource] loaded " << positions.size()
            << " position(s) from " << path_ << "\n";
  return positions;
}

}  // namespace optguard
