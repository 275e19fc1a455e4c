#include "shiptrack/geofence/geofence_engine.hpp"

#include "shiptrack/common/error.hpp"

#include <algorithm>
#include <cmath>

namespace shiptrack {

namespace {

using domain::Geofence;
using domain::GeofenceTransition;

// Tolerance for "on the edge", in degrees (~1 mm at the equator).
constexpr double kEdgeEpsilonDeg = 1e-8;

bool onSegment(const geo::GeoPoint& p, const geo::GeoPoint& a,
               const geo::GeoPoint& b) {
  const double dx = b.longitude - a.longitude;
  const double dy = b.latitude - a.latitude;
  const double length = std::hypot(dx, dy);
  if (length > 0.0) {
    // Perpendicular distance from p to the line through a and b.
    const double cross = dx * (p.latitude - a.latitude) - dy * (p.longitude - a.longitude);
    if (std::fabs(cross) / length > kEdgeEpsilonDeg) {
      return false;
    }
  }
  return p.longitude >= std::min(a.longitude, b.longitude) - kEdgeEpsilonDeg &&
         p.longitude <= std::max(a.longitude, b.longitude) + kEdgeEpsilonDeg &&
         p.latitude >= std::min(a.latitude, b.latitude) - kEdgeEpsilonDeg &&
         p.latitude <= std::max(a.latitude, b.latitude) + kEdgeEpsilonDeg;
}

}  // namespace

GeofenceEngine::GeofenceEngine(IGeofenceRepository& repository,
                               const ITimeProvider& time, IdGenerator& ids)
    : repository_(repository), time_(time), ids_(ids) {}

// -----------------------------------------------------------------------------
// Containment
// -----------------------------------------------------------------------------
bool GeofenceEngine::containsCircular(const Geofence& fence,
                                      const geo::GeoPoint& point) {
  return geo::distanceKm(fence.center, point) * 1000.0 <= fence.radius_m;
}

// Ray casting with latitude as y and longitude as x. Edges are checked first
// so boundary points are inside regardless of how the crossing count falls.
bool GeofenceEngine::containsPolygon(const Geofence& fence,
                                     const geo::GeoPoint& point) {
  const auto& v = fence.vertices;
  if (v.size() < 3) {
    return false;
  }

  for (std::size_t i = 0, j = v.size() - 1; i < v.size(); j = i++) {
    if (onSegment(point, v[j], v[i])) {
      return true;
    }
  }

  bool inside = false;
  for (std::size_t i = 0, j = v.size() - 1; i < v.size(); j = i++) {
    if (((v[i].latitude > point.latitude) != (v[j].latitude > point.latitude)) &&
        (point.longitude < (v[j].longitude - v[i].longitude) *
                                   (point.latitude - v[i].latitude) /
                                   (v[j].latitude - v[i].latitude) +
                               v[i].longitude)) {
      inside = !inside;
    }
  }
  return inside;
}

bool GeofenceEngine::contains(const Geofence& fence, const geo::GeoPoint& point) {
  switch (fence.type) {
    case domain::GeofenceType::Circular: return containsCircular(fence, point);
    case domain::GeofenceType::Polygon:  return containsPolygon(fence, point);
  }
  return false;
}

bool GeofenceEngine::outranks(const Geofence& a, const Geofence& b) {
  if (a.priority != b.priority) {
    return a.priority > b.priority;
  }
  const double area_a = a.approximateAreaM2();
  const double area_b = b.approximateAreaM2();
  if (area_a != area_b) {
    return area_a < area_b;
  }
  return a.id < b.id;
}

std::vector<Geofence> GeofenceEngine::findActiveContaining(
    const geo::GeoPoint& point) const {
  std::vector<Geofence> hits;
  for (auto& fence : repository_.findAllActive()) {
    if (contains(fence, point)) {
      hits.push_back(std::move(fence));
    }
  }
  std::sort(hits.begin(), hits.end(), &GeofenceEngine::outranks);
  return hits;
}

// -----------------------------------------------------------------------------
// evaluate()
// -----------------------------------------------------------------------------
GeofenceEvaluation GeofenceEngine::evaluate(
    const std::optional<domain::GeofenceOccupancy>& prior,
    const geo::GeoPoint& point, Timestamp at) const {
  GeofenceEvaluation result;

  const auto hits = findActiveContaining(point);
  const Geofence* winner = hits.empty() ? nullptr : &hits.front();

  // Still inside the same fence: only a dwell can happen.
  if (prior.has_value() && winner != nullptr && winner->id == prior->geofence_id) {
    domain::GeofenceOccupancy occupancy = *prior;
    const auto stay =
        std::chrono::duration_cast<std::chrono::milliseconds>(at - occupancy.entered_at);
    if (!occupancy.dwell_emitted && winner->policy.notify_on_dwell &&
        stay >= winner->policy.dwell_threshold) {
      occupancy.dwell_emitted = true;
      result.signals.push_back(GeofenceSignal{GeofenceTransition::Dwell, winner->id,
                                              winner->name, stay});
    }
    result.occupancy = occupancy;
    return result;
  }

  if (prior.has_value()) {
    // The prior fence may have been deactivated or removed since; its
    // policy is read from the repository when it still exists.
    const auto prior_fence = repository_.findById(prior->geofence_id);
    const bool notify = !prior_fence.has_value() || prior_fence->policy.notify_on_exit;
    if (notify) {
      const auto stay =
          std::chrono::duration_cast<std::chrono::milliseconds>(at - prior->entered_at);
      result.signals.push_back(GeofenceSignal{GeofenceTransition::Exit,
                                              prior->geofence_id,
                                              prior->geofence_name, stay});
    }
  }

  if (winner != nullptr) {
    result.occupancy = domain::GeofenceOccupancy{winner->id, winner->name, at, false};
    if (winner->policy.notify_on_entry) {
      result.signals.push_back(GeofenceSignal{GeofenceTransition::Enter, winner->id,
                                              winner->name,
                                              std::chrono::milliseconds{0}});
    }
  }

  return result;
}

// -----------------------------------------------------------------------------
// Registry
// -----------------------------------------------------------------------------
Geofence GeofenceEngine::registerGeofence(Geofence fence) {
  std::lock_guard lock(registry_mutex_);

  if (fence.id.empty()) {
    fence.id = ids_.next_id();
  } else if (repository_.findById(fence.id).has_value()) {
    throw TrackingError(ErrorCode::AlreadyExists,
                        "geofence id already exists: " + fence.id);
  }

  if (repository_.findByOwnerAndName(fence.owner_id, fence.name).has_value()) {
    throw TrackingError(ErrorCode::AlreadyExists,
                        "geofence name '" + fence.name +
                            "' already exists for owner '" + fence.owner_id + "'");
  }

  fence.created_at = ms_to_timestamp(time_.now_ms());
  repository_.save(fence);
  return fence;
}

Geofence GeofenceEngine::activate(const std::string& geofence_id) {
  return setActive(geofence_id, true);
}

Geofence GeofenceEngine::deactivate(const std::string& geofence_id) {
  return setActive(geofence_id, false);
}

Geofence GeofenceEngine::setActive(const std::string& geofence_id, bool active) {
  std::lock_guard lock(registry_mutex_);
  Geofence fence = loadOrThrow(geofence_id);
  if (fence.active == active) {
    throw TrackingError(ErrorCode::InvalidState,
                        "geofence " + geofence_id + " is already " +
                            (active ? "active" : "inactive"));
  }
  fence.active = active;
  repository_.save(fence);
  return fence;
}

Geofence GeofenceEngine::updateRadius(const std::string& geofence_id,
                                      double radius_m) {
  std::lock_guard lock(registry_mutex_);
  Geofence fence = loadOrThrow(geofence_id);
  if (fence.type != domain::GeofenceType::Circular) {
    throw TrackingError(ErrorCode::InvalidState,
                        "radius can only be updated on a circular geofence");
  }
  domain::validateRadius(radius_m);
  fence.radius_m = radius_m;
  repository_.save(fence);
  return fence;
}

void GeofenceEngine::remove(const std::string& geofence_id) {
  std::lock_guard lock(registry_mutex_);
  if (!repository_.remove(geofence_id)) {
    throw TrackingError(ErrorCode::NotFound, "geofence not found: " + geofence_id);
  }
}

std::optional<Geofence> GeofenceEngine::find(const std::string& geofence_id) const {
  return repository_.findById(geofence_id);
}

Geofence GeofenceEngine::loadOrThrow(const std::string& geofence_id) const {
  auto fence = repository_.findById(geofence_id);
  if (!fence.has_value()) {
    throw TrackingError(ErrorCode::NotFound, "geofence not found: " + geofence_id);
  }
  return *fence;
}

}  // namespace shiptrack
