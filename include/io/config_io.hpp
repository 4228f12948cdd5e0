#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace transit::io {

// Run configuration from JSON. "band" is required; every other key is
// optional and keeps the RunConfig default when absent.
//
//   {
//     "reference": { "latitude": 51.1537, "longitude": -0.1821 },
//     "band": { "inner_nm": 48, "outer_nm": 100 },
//     "batch_size": 5,
//     "group_by": "callsign",                      // or "callsign+icao24"
//     "outlier_filters": "default"                 // or { "velocity": [100, 250], ... }
//   }
//
// The result is validated; any problem surfaces as ConfigError.
class ConfigIO {
public:
  static RunConfig Load(const std::string& path);
  static RunConfig FromJson(const nlohmann::json& root);
  static nlohmann::json ToJson(const RunConfig& cfg);
};

} // namespace transit::io
