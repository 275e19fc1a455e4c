#pragma once

#include "shiptrack/geo/geo_math.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace shiptrack {
namespace domain {

enum class GeofenceType { Circular, Polygon };

const char* geofenceTypeToString(GeofenceType type);

// Which transitions the fence reports, and after how long a stay counts as a
// dwell.
struct NotificationPolicy {
  bool notify_on_entry{true};
  bool notify_on_exit{true};
  bool notify_on_dwell{true};
  std::chrono::milliseconds dwell_threshold{std::chrono::minutes{15}};
};

// -----------------------------------------------------------------------------
// Geofence
// -----------------------------------------------------------------------------
//
// @brief  Virtual boundary, either a circle (center + radius) or a polygon
//         (ordered vertices, implicitly closed).
//
// @details
// Build through createCircular() / createPolygon(); both validate:
//   - radius_m in (0, kMaxRadiusMeters]
//   - at least 3 polygon vertices, every vertex a valid coordinate
//   - a non-empty name
// Fields irrelevant to the type are left at their defaults (center/radius
// for polygons, vertices for circles).
//
// name is unique per owner_id; the registry enforces that, not this type.
// priority breaks ties between overlapping fences (higher wins).
// -----------------------------------------------------------------------------
struct Geofence {
  static constexpr double kMaxRadiusMeters = 50000.0;

  std::string id;
  std::string name;
  std::string owner_id;
  GeofenceType type{GeofenceType::Circular};

  geo::GeoPoint center;
  double radius_m{0.0};
  std::vector<geo::GeoPoint> vertices;

  bool active{true};
  int priority{0};
  std::set<std::string> tags;
  NotificationPolicy policy;

  Timestamp created_at{};

  // Throws TrackingError(InvalidArgument) on any invariant violation.
  static Geofence createCircular(std::string id, std::string name,
                                 std::string owner_id, geo::GeoPoint center,
                                 double radius_m);
  static Geofence createPolygon(std::string id, std::string name,
                                std::string owner_id,
                                std::vector<geo::GeoPoint> vertices);

  // Approximate covered area in square meters; used only to order
  // overlapping fences. Polygons use the shoelace formula on an
  // equirectangular projection around the first vertex.
  double approximateAreaM2() const;
};

// Throws TrackingError(InvalidArgument) unless 0 < radius_m <= 50000.
void validateRadius(double radius_m);

}  // namespace domain
}  // namespace shiptrack
