#include "geo/geodesic.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "common/errors.hpp"

namespace transit::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr int kMaxIterations = 200;
constexpr double kLambdaTolerance = 1e-12;

inline double Deg2Rad(double deg) { return deg * kPi / 180.0; }

// Meridian arc from the equator to latitude `phi` (radians), signed.
double MeridianArc(double phi, double a, double f) {
  const double n = f / (2.0 - f);
  const double n2 = n * n;
  const double n3 = n2 * n;
  const double n4 = n2 * n2;
  return a / (1.0 + n) *
         ((1.0 + n2 / 4.0 + n4 / 64.0) * phi -
          1.5 * n * (1.0 - n2 / 8.0) * std::sin(2.0 * phi) +
          15.0 / 16.0 * n2 * (1.0 - n2 / 4.0) * std::sin(4.0 * phi) -
          35.0 / 48.0 * n3 * std::sin(6.0 * phi) +
          315.0 / 512.0 * n4 * std::sin(8.0 * phi));
}

} // namespace

void GeodesicDistance::ValidateCoordinate(double lat_deg, double lon_deg) {
  if (!std::isfinite(lat_deg) || !std::isfinite(lon_deg) ||
      lat_deg < -90.0 || lat_deg > 90.0 ||
      lon_deg < -180.0 || lon_deg > 180.0) {
    std::ostringstream oss;
    oss << "invalid coordinate (lat=" << lat_deg << ", lon=" << lon_deg << ")";
    throw InvalidCoordinate(oss.str());
  }
}

double GeodesicDistance::DistanceMeters(double lat_a_deg, double lon_a_deg,
                                        double lat_b_deg, double lon_b_deg) {
  ValidateCoordinate(lat_a_deg, lon_a_deg);
  ValidateCoordinate(lat_b_deg, lon_b_deg);

  const double a = kWgs84A;
  const double f = kWgs84F;
  const double b = (1.0 - f) * a;

  const double L = Deg2Rad(lon_b_deg - lon_a_deg);
  const double U1 = std::atan((1.0 - f) * std::tan(Deg2Rad(lat_a_deg)));
  const double U2 = std::atan((1.0 - f) * std::tan(Deg2Rad(lat_b_deg)));
  const double sinU1 = std::sin(U1), cosU1 = std::cos(U1);
  const double sinU2 = std::sin(U2), cosU2 = std::cos(U2);

  double lambda = L;
  double sin_sigma = 0.0, cos_sigma = 0.0, sigma = 0.0;
  double cos2_alpha = 0.0, cos_2sigma_m = 0.0;

  bool converged = false;
  for (int iter = 0; iter < kMaxIterations; ++iter) {
    const double sin_lambda = std::sin(lambda);
    const double cos_lambda = std::cos(lambda);

    const double t1 = cosU2 * sin_lambda;
    const double t2 = cosU1 * sinU2 - sinU1 * cosU2 * cos_lambda;
    sin_sigma = std::sqrt(t1 * t1 + t2 * t2);
    if (sin_sigma == 0.0) {
      return 0.0; // coincident points
    }
    cos_sigma = sinU1 * sinU2 + cosU1 * cosU2 * cos_lambda;
    sigma = std::atan2(sin_sigma, cos_sigma);

    const double sin_alpha = cosU1 * cosU2 * sin_lambda / sin_sigma;
    cos2_alpha = 1.0 - sin_alpha * sin_alpha;
    // equatorial line: cos2_alpha == 0
    cos_2sigma_m = (cos2_alpha != 0.0) ? cos_sigma - 2.0 * sinU1 * sinU2 / cos2_alpha : 0.0;

    const double C = f / 16.0 * cos2_alpha * (4.0 + f * (4.0 - 3.0 * cos2_alpha));
    const double lambda_prev = lambda;
    lambda = L + (1.0 - C) * f * sin_alpha *
                     (sigma + C * sin_sigma *
                                  (cos_2sigma_m + C * cos_sigma * (-1.0 + 2.0 * cos_2sigma_m * cos_2sigma_m)));
    if (std::fabs(lambda - lambda_prev) < kLambdaTolerance) {
      converged = true;
      break;
    }
  }

  if (!converged) {
    // Nearly antipodal: the geodesic runs over a pole. Shorter of the two
    // meridian routes; exact for antipodes on the equator.
    const double quarter = MeridianArc(kPi / 2.0, a, f);
    const double ma = MeridianArc(Deg2Rad(lat_a_deg), a, f);
    const double mb = MeridianArc(Deg2Rad(lat_b_deg), a, f);
    const double via_north = (quarter - ma) + (quarter - mb);
    const double via_south = (quarter + ma) + (quarter + mb);
    return std::min(via_north, via_south);
  }

  const double u2 = cos2_alpha * (a * a - b * b) / (b * b);
  const double A = 1.0 + u2 / 16384.0 * (4096.0 + u2 * (-768.0 + u2 * (320.0 - 175.0 * u2)));
  const double B = u2 / 1024.0 * (256.0 + u2 * (-128.0 + u2 * (74.0 - 47.0 * u2)));
  const double c2 = cos_2sigma_m * cos_2sigma_m;
  const double delta_sigma =
      B * sin_sigma *
      (cos_2sigma_m + B / 4.0 *
                          (cos_sigma * (-1.0 + 2.0 * c2) -
                           B / 6.0 * cos_2sigma_m * (-3.0 + 4.0 * sin_sigma * sin_sigma) * (-3.0 + 4.0 * c2)));

  return b * A * (sigma - delta_sigma);
}

double GeodesicDistance::DistanceNm(double lat_a_deg, double lon_a_deg,
                                    double lat_b_deg, double lon_b_deg) {
  return DistanceMeters(lat_a_deg, lon_a_deg, lat_b_deg, lon_b_deg) / kMetersPerNauticalMile;
}

std::vector<double> GeodesicDistance::DistanceVectorNm(const std::vector<double>& lats_a,
                                                       const std::vector<double>& lons_a,
                                                       const std::vector<double>& lats_b,
                                                       const std::vector<double>& lons_b) {
  const std::size_t n = lats_a.size();
  if (lons_a.size() != n || lats_b.size() != n || lons_b.size() != n) {
    throw std::invalid_argument("DistanceVectorNm: coordinate vectors differ in length");
  }
  std::vector<double> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(DistanceNm(lats_a[i], lons_a[i], lats_b[i], lons_b[i]));
  }
  return out;
}

std::vector<double> GeodesicDistance::DistanceVectorNm(const std::vector<double>& lats_a,
                                                       const std::vector<double>& lons_a,
                                                       double lat_b_deg, double lon_b_deg) {
  if (lats_a.size() != lons_a.size()) {
    throw std::invalid_argument("DistanceVectorNm: coordinate vectors differ in length");
  }
  ValidateCoordinate(lat_b_deg, lon_b_deg);
  std::vector<double> out;
  out.reserve(lats_a.size());
  for (std::size_t i = 0; i < lats_a.size(); ++i) {
    out.push_back(DistanceNm(lats_a[i], lons_a[i], lat_b_deg, lon_b_deg));
  }
  return out;
}

} // namespace transit::geo
