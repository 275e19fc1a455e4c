#pragma once

#include "shiptrack/common/id_generator.hpp"
#include "shiptrack/config/tracking_config.hpp"
#include "shiptrack/domain/location.hpp"
#include "shiptrack/domain/location_history.hpp"
#include "shiptrack/domain/shipment.hpp"
#include "shiptrack/geofence/geofence_engine.hpp"
#include "shiptrack/ports/i_domain_event_publisher.hpp"
#include "shiptrack/ports/i_geocoder.hpp"
#include "shiptrack/ports/i_location_repository.hpp"
#include "shiptrack/ports/i_tracking_session_manager.hpp"
#include "shiptrack/time/i_time_provider.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace shiptrack {

enum class TrackingSessionState { None, Active, Stopped };

// Radius search over the report log. max_results must be positive.
struct NearbyQuery {
  geo::GeoPoint center;
  double radius_m{0.0};
  std::optional<Timestamp> min_timestamp;
  std::size_t max_results{100};
};

struct ArchiveSummary {
  std::size_t buckets_compressed{0};
  std::size_t reports_removed{0};
};

// -----------------------------------------------------------------------------
// LocationTracker — position ingestion for the location context
// -----------------------------------------------------------------------------
//
// @brief  Validates position reports, maintains the latest projection and the
//         daily history, and turns geofence transitions into events.
//
// @details
// update() pipeline, in this order:
//   1. validate coordinates and shipment id          → InvalidLocationData
//      reject reports for a stopped session         → InvalidState
//   2. reject a report older than the latest one    → StaleUpdate (DEBUG log)
//   3. derive quality, is_moving, nearest stop, geofence transition
//   4. conditional write of the latest projection   → ConcurrentModification
//      on a lost race; then append to the report log
//   5. append to the (shipment, UTC day) bucket
//   6. compress the bucket to cap / 2 once it exceeds the cap
//   7. publish LocationUpdated, then every geofence event, in order
// A failure in 1-4 leaves every store untouched.
//
// The tracker also owns tracking sessions (ITrackingSessionManager). A
// shipment without a session is accepted; an explicitly stopped one is not
// until resumeTracking().
//
// Thread model: update() may run concurrently for any shipments. Same-shipment
// races resolve at the latest projection's version check; history buckets
// serialise in the repository. sessions_mutex_ guards only the session map.
//
// Ownership: borrows every collaborator from TrackingEngine.
// -----------------------------------------------------------------------------
class LocationTracker final : public ITrackingSessionManager {
 public:
  // Returns the stops of a shipment; used for nearest-stop correlation.
  using StopLookup = std::function<std::vector<domain::Stop>(const std::string&)>;

  LocationTracker(ILocationRepository& repository, const GeofenceEngine& geofences,
                  IDomainEventPublisher& publisher, const ITimeProvider& time,
                  IdGenerator& location_ids, IdGenerator& event_ids,
                  TrackingConfig config);

  // Both are optional and must be attached before concurrent use starts.
  void attachStopLookup(StopLookup lookup);
  void attachGeocoder(IGeocoder* geocoder);

  domain::Location update(const std::string& shipment_id,
                          const std::string& device_id, double latitude,
                          double longitude, Timestamp timestamp,
                          const domain::LocationReadings& readings = {});

  // NotFound when the shipment has no report yet.
  domain::Location latest(const std::string& shipment_id) const;

  // Accepted reports with from <= timestamp <= to. InvalidArgument when
  // to < from.
  std::vector<domain::Location> history(const std::string& shipment_id,
                                        Timestamp from, Timestamp to) const;

  std::optional<domain::LocationHistory> historyBucket(
      const std::string& shipment_id, const std::string& date_key) const;

  // Buckets dated start_key..end_key inclusive, in day order. InvalidArgument
  // for a malformed key or end_key < start_key.
  std::vector<domain::LocationHistory> historyRange(const std::string& shipment_id,
                                                    const std::string& start_key,
                                                    const std::string& end_key) const;

  // Reports of any shipment near a point, nearest first.
  // InvalidLocationData for a bad center, InvalidArgument for a non-positive
  // radius or a zero max_results.
  std::vector<domain::Location> findNearby(const NearbyQuery& query) const;

  // Fills in the address of a stored report via the geocoder, only if it has
  // none. NotFound for an unknown id, PreconditionFailed without a geocoder.
  domain::Location enrichWithAddress(const std::string& location_id);

  // Compresses every bucket dated before date_key to archive_keep_points and
  // drops reports older than that day's UTC midnight from the report log.
  // InvalidArgument for a malformed key.
  ArchiveSummary archiveHistoryBefore(const std::string& date_key);

  // Drops reports older than now - threshold_hours. The latest projection
  // survives. Returns the number dropped; InvalidArgument unless
  // threshold_hours > 0.
  std::size_t cleanupStaleLocations(std::int64_t threshold_hours);

  // Forgets a shipment's reports, latest projection and history buckets.
  // Returns the number of reports dropped.
  std::size_t deleteHistory(const std::string& shipment_id);

  // Latest reports that are moving and not older than `since`.
  std::vector<domain::Location> movingShipments(Timestamp since) const;

  static bool isStale(const domain::Location& location, Timestamp now,
                      std::int64_t threshold_minutes);
  bool isStale(const domain::Location& location) const;

  domain::LocationQuality deriveQuality(std::optional<double> accuracy_m) const;

  // ITrackingSessionManager
  void initializeSession(const std::string& shipment_id) override;
  void stopTracking(const std::string& shipment_id) override;
  void resumeTracking(const std::string& shipment_id) override;

  TrackingSessionState sessionState(const std::string& shipment_id) const;

  const TrackingConfig& config() const { return config_; }

 private:
  void correlateNearestStop(domain::Location& location) const;
  events::DomainEvent makeEvent(const std::string& shipment_id,
                                events::EventPayload payload) const;

  ILocationRepository& repository_;
  const GeofenceEngine& geofences_;
  IDomainEventPublisher& publisher_;
  const ITimeProvider& time_;
  IdGenerator& location_ids_;
  IdGenerator& event_ids_;
  const TrackingConfig config_;

  StopLookup stop_lookup_;
  std::atomic<IGeocoder*> geocoder_{nullptr};

  mutable std::shared_mutex sessions_mutex_;
  std::unordered_map<std::string, TrackingSessionState> sessions_;
};

}  // namespace shiptrack
