#include "stages/drop_missing_stage.hpp"

#include <utility>

namespace transit {

std::optional<TrainingSample> DropMissingStage::ToSample(const DatasetRow& row) {
  if (row.callsign.empty() || row.icao24.empty()) return std::nullopt;
  if (!row.lat_deg || !row.lon_deg || !row.velocity || !row.heading || !row.vertrate ||
      !row.baroaltitude || !row.geoaltitude || !row.hour_epoch_s ||
      !row.arrival_time_s || !row.transit_time_s) {
    return std::nullopt;
  }

  TrainingSample s;
  s.callsign = row.callsign;
  s.icao24 = row.icao24;
  s.lat_deg = *row.lat_deg;
  s.lon_deg = *row.lon_deg;
  s.velocity = *row.velocity;
  s.heading = *row.heading;
  s.vertrate = *row.vertrate;
  s.baroaltitude = *row.baroaltitude;
  s.geoaltitude = *row.geoaltitude;
  s.hour_epoch_s = *row.hour_epoch_s;
  s.arrival_time_s = *row.arrival_time_s;
  s.transit_time_s = *row.transit_time_s;
  return s;
}

void DropMissingStage::Run(AssemblyContext& ctx) {
  ctx.samples.clear();
  ctx.dropped_missing = 0;
  ctx.samples.reserve(ctx.rows.size());
  for (const auto& row : ctx.rows) {
    if (auto s = ToSample(row)) {
      ctx.samples.push_back(std::move(*s));
    } else {
      ++ctx.dropped_missing;
    }
  }
}

} // namespace transit
