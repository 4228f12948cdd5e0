#pragma once
#include <vector>

namespace transit::geo {

constexpr double kMetersPerNauticalMile = 1852.0;

// WGS84
constexpr double kWgs84A = 6378137.0;
constexpr double kWgs84F = 1.0 / 298.257223563;

// Geodesic (ellipsoidal great-circle) distance on WGS84.
//
// Inverse problem solved with Vincenty's iteration. For the distances this
// project deals with (a few hundred NM around an airport) it converges in a
// handful of iterations and is accurate to well under a metre. Nearly
// antipodal pairs, where the iteration does not settle, fall back to the
// shorter meridian route over a pole.
//
// All functions throw InvalidCoordinate when a latitude is outside [-90, 90],
// a longitude outside [-180, 180], or either is not finite. Nothing is clamped.
class GeodesicDistance {
public:
  static double DistanceMeters(double lat_a_deg, double lon_a_deg,
                               double lat_b_deg, double lon_b_deg);

  static double DistanceNm(double lat_a_deg, double lon_a_deg,
                           double lat_b_deg, double lon_b_deg);

  // Elementwise. All four vectors must have the same size.
  static std::vector<double> DistanceVectorNm(const std::vector<double>& lats_a,
                                              const std::vector<double>& lons_a,
                                              const std::vector<double>& lats_b,
                                              const std::vector<double>& lons_b);

  // Broadcast form: every (lats_a[i], lons_a[i]) against one fixed point.
  static std::vector<double> DistanceVectorNm(const std::vector<double>& lats_a,
                                              const std::vector<double>& lons_a,
                                              double lat_b_deg, double lon_b_deg);

  static void ValidateCoordinate(double lat_deg, double lon_deg);
};

} // namespace transit::geo
