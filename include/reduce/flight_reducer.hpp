#pragma once
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"

namespace transit {

// ======================
// Flight -> one labeled record (or a skip)
//
// Input:
//   one flight's telemetry, the reference point and the distance band
//
// Steps:
//   1) stable sort by time (equal timestamps keep their row order)
//   2) distance of every point to the reference (geodesic, NM)
//   3) entry = earliest point with inner <= d <= outer (first crossing, not closest)
//   4) arrival = earliest point holding the minimum baroaltitude of the whole flight
//   5) transit_time = arrival.time - entry.time (signed)
//
// Known limitation: the altitude minimum stands for "landed". Go-arounds and
// missed approaches that bottom out away from the runway are not detected.
// ======================
class FlightReducer {
public:
  static constexpr const char* kNoBandCrossing = "no band crossing";
  static constexpr const char* kNoAltitudeData = "no altitude data";
  static constexpr const char* kEmptyFlight = "empty flight";

  FlightReducer(ReferencePoint reference, DistanceBand band);

  // Throws InvalidCoordinate if any point is out of range.
  ReduceResult Reduce(Flight flight) const;

  // Exposed for tests. `points` must already be time-sorted.
  static std::optional<EntrySnapshot> FindEntry(const std::vector<TelemetryPoint>& points,
                                                const std::vector<double>& distances_nm,
                                                const DistanceBand& band);
  static std::optional<std::size_t> FindArrival(const std::vector<TelemetryPoint>& points);

  const ReferencePoint& reference() const { return reference_; }
  const DistanceBand& band() const { return band_; }

private:
  ReferencePoint reference_;
  DistanceBand band_;
};

} // namespace transit
