#include "reduce/flight_reducer.hpp"

#include <algorithm>
#include <utility>

#include "geo/geodesic.hpp"

namespace transit {

FlightReducer::FlightReducer(ReferencePoint reference, DistanceBand band)
    : reference_(reference), band_(band) {}

std::optional<EntrySnapshot> FlightReducer::FindEntry(const std::vector<TelemetryPoint>& points,
                                                      const std::vector<double>& distances_nm,
                                                      const DistanceBand& band) {
  const std::size_t n = std::min(points.size(), distances_nm.size());
  for (std::size_t i = 0; i < n; ++i) {
    if (band.Contains(distances_nm[i])) {
      EntrySnapshot e;
      e.point = points[i];
      e.distance_nm = distances_nm[i];
      e.index = i;
      return e;
    }
  }
  return std::nullopt;
}

std::optional<std::size_t> FlightReducer::FindArrival(const std::vector<TelemetryPoint>& points) {
  std::optional<std::size_t> best;
  for (std::size_t i = 0; i < points.size(); ++i) {
    const auto& alt = points[i].baroaltitude;
    if (!alt) continue;
    // strict '<' keeps the first index on ties
    if (!best || *alt < *points[*best].baroaltitude) best = i;
  }
  return best;
}

ReduceResult FlightReducer::Reduce(Flight flight) const {
  ReduceResult result;
  auto& pts = flight.points;
  if (pts.empty()) {
    result.skip_reason = kEmptyFlight;
    return result;
  }

  // 1) time order
  std::stable_sort(pts.begin(), pts.end(), [](const TelemetryPoint& a, const TelemetryPoint& b) {
    return a.time_s < b.time_s;
  });

  // 2) distance to reference
  std::vector<double> lats, lons;
  lats.reserve(pts.size());
  lons.reserve(pts.size());
  for (const auto& p : pts) {
    lats.push_back(p.lat_deg);
    lons.push_back(p.lon_deg);
  }
  const std::vector<double> dist =
      geo::GeodesicDistance::DistanceVectorNm(lats, lons, reference_.lat_deg, reference_.lon_deg);

  // 3) first band crossing
  const auto entry = FindEntry(pts, dist, band_);
  if (!entry) {
    result.skip_reason = kNoBandCrossing;
    return result;
  }

  // 4) global altitude minimum
  const auto arrival_idx = FindArrival(pts);
  if (!arrival_idx) {
    result.skip_reason = kNoAltitudeData;
    return result;
  }
  const TelemetryPoint& arrival = pts[*arrival_idx];

  // 5) + 6)
  const TelemetryPoint& e = entry->point;
  LabeledRecord rec;
  rec.callsign = e.callsign;
  rec.icao24 = e.icao24;
  rec.lat_deg = e.lat_deg;
  rec.lon_deg = e.lon_deg;
  rec.velocity = e.velocity;
  rec.heading = e.heading;
  rec.vertrate = e.vertrate;
  rec.baroaltitude = e.baroaltitude;
  rec.geoaltitude = e.geoaltitude;
  rec.hour = e.hour;
  rec.entry_distance_nm = entry->distance_nm;
  rec.entry_time_s = e.time_s;
  rec.arrival_time_s = arrival.time_s;
  rec.transit_time_s = arrival.time_s - e.time_s;

  result.record = std::move(rec);
  return result;
}

} // namespace transit
