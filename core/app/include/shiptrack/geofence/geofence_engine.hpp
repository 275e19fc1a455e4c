#pragma once

#include "shiptrack/common/id_generator.hpp"
#include "shiptrack/domain/geofence.hpp"
#include "shiptrack/domain/location.hpp"
#include "shiptrack/geo/geo_math.hpp"
#include "shiptrack/ports/i_geofence_repository.hpp"
#include "shiptrack/time/i_time_provider.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace shiptrack {

// One transition produced by GeofenceEngine::evaluate().
struct GeofenceSignal {
  domain::GeofenceTransition transition{domain::GeofenceTransition::Enter};
  std::string geofence_id;
  std::string geofence_name;
  std::chrono::milliseconds dwell{0};  // Exit and Dwell only
};

struct GeofenceEvaluation {
  std::optional<domain::GeofenceOccupancy> occupancy;  // state after the report
  std::vector<GeofenceSignal> signals;                 // in emission order
};

// -----------------------------------------------------------------------------
// GeofenceEngine — containment, transitions and the fence registry
// -----------------------------------------------------------------------------
//
// @brief  Answers "which fence is this point in" and turns the answer into
//         Enter / Exit / Dwell signals relative to the previous report.
//
// @details
// Containment:
//   circular  distanceKm(center, p) * 1000 <= radius_m (boundary inside)
//   polygon   ray casting over the edges; a point on an edge or vertex is
//             inside
//
// Overlap arbitration: of all active fences containing the point, the winner
// is the one with the highest priority, then the smallest approximate area,
// then the smallest id. The order is total, so the result does not depend on
// storage order.
//
// evaluate(prior, point, at):
//   winner == prior fence      → Dwell once the stay reaches the fence's
//                                dwell threshold, at most once per stay
//   winner != prior fence      → Exit(prior) if there was one, then
//                                Enter(winner) if there is one
// Each signal is subject to the fence's NotificationPolicy; the occupancy is
// updated whether or not a signal was emitted.
//
// Registry: name unique per owner, activate/deactivate, radius updates and
// removal. Mutations are serialised by registry_mutex_ so the name check and
// the save are atomic. Evaluation reads the repository without that lock.
//
// Ownership: borrows the repository, the clock and the id generator from
// TrackingEngine.
// -----------------------------------------------------------------------------
class GeofenceEngine {
 public:
  GeofenceEngine(IGeofenceRepository& repository, const ITimeProvider& time,
                 IdGenerator& ids);

  static bool containsCircular(const domain::Geofence& fence,
                               const geo::GeoPoint& point);
  static bool containsPolygon(const domain::Geofence& fence,
                              const geo::GeoPoint& point);
  static bool contains(const domain::Geofence& fence, const geo::GeoPoint& point);

  // True when `a` wins over `b` under the overlap arbitration order.
  static bool outranks(const domain::Geofence& a, const domain::Geofence& b);

  // -------------------------------------------------------------------------
  // evaluate()
  // -------------------------------------------------------------------------
  // @param  prior  occupancy recorded with the shipment's previous report
  // @param  point  the new position
  // @param  at     the new report's timestamp
  //
  // Pure with respect to the engine: reads active fences, writes nothing.
  // -------------------------------------------------------------------------
  GeofenceEvaluation evaluate(const std::optional<domain::GeofenceOccupancy>& prior,
                              const geo::GeoPoint& point, Timestamp at) const;

  // Active fences containing the point, best-ranked first.
  std::vector<domain::Geofence> findActiveContaining(const geo::GeoPoint& point) const;

  // -------------------------------------------------------------------------
  // Registry
  // -------------------------------------------------------------------------
  // registerGeofence assigns an id when the fence has none and stamps
  // created_at. Throws AlreadyExists on a duplicate (owner, name) or id.
  // The others throw NotFound for an unknown id.
  // -------------------------------------------------------------------------
  domain::Geofence registerGeofence(domain::Geofence fence);
  domain::Geofence activate(const std::string& geofence_id);
  domain::Geofence deactivate(const std::string& geofence_id);
  domain::Geofence updateRadius(const std::string& geofence_id, double radius_m);
  void remove(const std::string& geofence_id);

  std::optional<domain::Geofence> find(const std::string& geofence_id) const;

 private:
  domain::Geofence loadOrThrow(const std::string& geofence_id) const;
  domain::Geofence setActive(const std::string& geofence_id, bool active);

  IGeofenceRepository& repository_;
  const ITimeProvider& time_;
  IdGenerator& ids_;
  std::mutex registry_mutex_;
};

}  // namespace shiptrack
