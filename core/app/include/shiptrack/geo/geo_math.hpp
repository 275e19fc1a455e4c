#pragma once

namespace shiptrack {
namespace geo {

// Mean Earth radius used by every distance computation in the engine.
constexpr double kEarthRadiusKm = 6371.0;

// -----------------------------------------------------------------------------
// GeoPoint
// -----------------------------------------------------------------------------
// WGS84 latitude/longitude in decimal degrees. Plain value type; validation is
// the caller's job (see isValidCoordinate).
// -----------------------------------------------------------------------------
struct GeoPoint {
  double latitude{0.0};
  double longitude{0.0};
};

inline bool operator==(const GeoPoint& a, const GeoPoint& b) {
  return a.latitude == b.latitude && a.longitude == b.longitude;
}

inline bool operator!=(const GeoPoint& a, const GeoPoint& b) {
  return !(a == b);
}

// True iff latitude is in [-90, 90] and longitude in [-180, 180]. NaN fails.
bool isValidCoordinate(double latitude, double longitude);

// -------------------------------------------------------------------------
// distanceKm(a, b)
// -------------------------------------------------------------------------
// @brief  Great-circle distance in kilometers (Haversine, R = 6371 km).
//
// @details
// Pure and deterministic. Symmetric up to floating-point rounding, and
// exactly 0 for identical points. The intermediate `h` is clamped to [0, 1]
// so antipodal points cannot produce NaN through rounding.
// -------------------------------------------------------------------------
double distanceKm(const GeoPoint& a, const GeoPoint& b);

// distanceKm(a, b) * 1000.
double distanceMeters(const GeoPoint& a, const GeoPoint& b);

// -------------------------------------------------------------------------
// initialBearingDeg(from, to)
// -------------------------------------------------------------------------
// @brief  Forward azimuth at `from` toward `to`, normalised to [0, 360).
//         0 = north, 90 = east. Returns 0 for identical points.
// -------------------------------------------------------------------------
double initialBearingDeg(const GeoPoint& from, const GeoPoint& to);

}  // namespace geo
}  // namespace shiptrack
