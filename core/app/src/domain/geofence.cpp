#include "shiptrack/domain/geofence.hpp"

#include "shiptrack/common/error.hpp"

#include <cmath>
#include <utility>

namespace shiptrack {
namespace domain {

namespace {

constexpr double kPi = 3.14159265358979323846;

void validateName(const std::string& name) {
  if (name.empty()) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "geofence name must not be empty");
  }
}

}  // namespace

const char* geofenceTypeToString(GeofenceType type) {
  switch (type) {
    case GeofenceType::Circular: return "Circular";
    case GeofenceType::Polygon:  return "Polygon";
  }
  return "Unknown";
}

void validateRadius(double radius_m) {
  // Written as a negated range check so NaN is rejected too.
  if (!(radius_m > 0.0 && radius_m <= Geofence::kMaxRadiusMeters)) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "geofence radius must be in (0, 50000] meters, got " +
                            std::to_string(radius_m));
  }
}

Geofence Geofence::createCircular(std::string id, std::string name,
                                  std::string owner_id, geo::GeoPoint center,
                                  double radius_m) {
  validateName(name);
  validateRadius(radius_m);
  if (!geo::isValidCoordinate(center.latitude, center.longitude)) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "geofence center is not a valid coordinate");
  }

  Geofence fence;
  fence.id = std::move(id);
  fence.name = std::move(name);
  fence.owner_id = std::move(owner_id);
  fence.type = GeofenceType::Circular;
  fence.center = center;
  fence.radius_m = radius_m;
  return fence;
}

Geofence Geofence::createPolygon(std::string id, std::string name,
                                 std::string owner_id,
                                 std::vector<geo::GeoPoint> vertices) {
  validateName(name);
  if (vertices.size() < 3) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "polygon geofence needs at least 3 vertices, got " +
                            std::to_string(vertices.size()));
  }
  for (const auto& v : vertices) {
    if (!geo::isValidCoordinate(v.latitude, v.longitude)) {
      throw TrackingError(ErrorCode::InvalidArgument,
                          "polygon vertex is not a valid coordinate");
    }
  }

  Geofence fence;
  fence.id = std::move(id);
  fence.name = std::move(name);
  fence.owner_id = std::move(owner_id);
  fence.type = GeofenceType::Polygon;
  fence.vertices = std::move(vertices);
  return fence;
}

double Geofence::approximateAreaM2() const {
  switch (type) {
    case GeofenceType::Circular:
      return kPi * radius_m * radius_m;
    case GeofenceType::Polygon: {
      const double meters_per_deg = geo::kEarthRadiusKm * 1000.0 * kPi / 180.0;
      const auto& origin = vertices.front();
      const double lon_scale = std::cos(origin.latitude * kPi / 180.0);

      double twice_area = 0.0;
      for (std::size_t i = 0, n = vertices.size(); i < n; ++i) {
        const auto& a = vertices[i];
        const auto& b = vertices[(i + 1) % n];
        const double ax = (a.longitude - origin.longitude) * lon_scale * meters_per_deg;
        const double ay = (a.latitude - origin.latitude) * meters_per_deg;
        const double bx = (b.longitude - origin.longitude) * lon_scale * meters_per_deg;
        const double by = (b.latitude - origin.latitude) * meters_per_deg;
        twice_area += ax * by - bx * ay;
      }
      return std::fabs(twice_area) / 2.0;
    }
  }
  return 0.0;
}

}  // namespace domain
}  // namespace shiptrack
