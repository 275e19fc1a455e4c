#include "shiptrack/geo/geo_math.hpp"

#include <algorithm>
#include <cmath>

namespace shiptrack {
namespace geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

double toRadians(double degrees) { return degrees * kPi / 180.0; }
double toDegrees(double radians) { return radians * 180.0 / kPi; }

}  // namespace

bool isValidCoordinate(double latitude, double longitude) {
  // Written as positive range checks so NaN (all comparisons false) fails.
  return latitude >= -90.0 && latitude <= 90.0 &&
         longitude >= -180.0 && longitude <= 180.0;
}

double distanceKm(const GeoPoint& a, const GeoPoint& b) {
  const double lat1 = toRadians(a.latitude);
  const double lat2 = toRadians(b.latitude);
  const double dlat = toRadians(b.latitude - a.latitude);
  const double dlon = toRadians(b.longitude - a.longitude);

  const double sin_dlat = std::sin(dlat / 2.0);
  const double sin_dlon = std::sin(dlon / 2.0);
  double h = sin_dlat * sin_dlat +
             std::cos(lat1) * std::cos(lat2) * sin_dlon * sin_dlon;
  h = std::clamp(h, 0.0, 1.0);

  const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
  return kEarthRadiusKm * c;
}

double distanceMeters(const GeoPoint& a, const GeoPoint& b) {
  return distanceKm(a, b) * 1000.0;
}

double initialBearingDeg(const GeoPoint& from, const GeoPoint& to) {
  if (from == to) {
    return 0.0;
  }
  const double lat1 = toRadians(from.latitude);
  const double lat2 = toRadians(to.latitude);
  const double dlon = toRadians(to.longitude - from.longitude);

  const double y = std::sin(dlon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) -
                   std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  const double bearing = std::fmod(toDegrees(std::atan2(y, x)) + 360.0, 360.0);
  return bearing;
}

}  // namespace geo
}  // namespace shiptrack
