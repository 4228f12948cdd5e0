#include "common/run_config.hpp"

#include <cmath>
#include <sstream>

#include "common/errors.hpp"

namespace transit {

namespace {

bool IsKnownNumericColumn(const std::string& column) {
  const auto& cols = DatasetColumns();
  for (const auto& c : cols) {
    if (c == column) return column != "callsign" && column != "icao24";
  }
  return false;
}

} // namespace

void ValidateRunConfig(const RunConfig& cfg) {
  const auto& ref = cfg.reference;
  if (!std::isfinite(ref.lat_deg) || ref.lat_deg < -90.0 || ref.lat_deg > 90.0) {
    throw ConfigError("reference latitude out of range: " + std::to_string(ref.lat_deg));
  }
  if (!std::isfinite(ref.lon_deg) || ref.lon_deg < -180.0 || ref.lon_deg > 180.0) {
    throw ConfigError("reference longitude out of range: " + std::to_string(ref.lon_deg));
  }

  if (!cfg.band) {
    throw ConfigError("distance band not set");
  }
  const auto& band = *cfg.band;
  if (!std::isfinite(band.inner_nm) || !std::isfinite(band.outer_nm) ||
      band.inner_nm < 0.0 || band.inner_nm > band.outer_nm) {
    std::ostringstream oss;
    oss << "invalid distance band [" << band.inner_nm << ", " << band.outer_nm << "]";
    throw ConfigError(oss.str());
  }

  if (cfg.batch_size == 0) {
    throw ConfigError("batch_size must be a positive integer");
  }

  if (cfg.outlier_filters.enabled) {
    for (const auto& kv : cfg.outlier_filters.ranges) {
      if (!IsKnownNumericColumn(kv.first)) {
        throw ConfigError("outlier filter on unknown column: " + kv.first);
      }
      if (!(kv.second.min_exclusive < kv.second.max_inclusive)) {
        throw ConfigError("outlier filter for " + kv.first + " needs min < max");
      }
    }
  }
}

GroupingKey ParseGroupingKey(const std::string& text) {
  if (text == "callsign") return GroupingKey::kCallsign;
  if (text == "callsign+icao24") return GroupingKey::kCallsignIcao24;
  throw ConfigError("unknown group_by value: " + text);
}

std::string ToString(GroupingKey key) {
  return key == GroupingKey::kCallsignIcao24 ? "callsign+icao24" : "callsign";
}

} // namespace transit
