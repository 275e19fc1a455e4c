#include "shiptrack/location/location_tracker.hpp"

#include "shiptrack/common/error.hpp"

#include <chrono>
#include <iostream>
#include <limits>
#include <utility>

namespace shiptrack {

using domain::Location;

LocationTracker::LocationTracker(ILocationRepository& repository,
                                 const GeofenceEngine& geofences,
                                 IDomainEventPublisher& publisher,
                                 const ITimeProvider& time,
                                 IdGenerator& location_ids, IdGenerator& event_ids,
                                 TrackingConfig config)
    : repository_(repository),
      geofences_(geofences),
      publisher_(publisher),
      time_(time),
      location_ids_(location_ids),
      event_ids_(event_ids),
      config_(std::move(config)) {}

void LocationTracker::attachStopLookup(StopLookup lookup) {
  stop_lookup_ = std::move(lookup);
}

void LocationTracker::attachGeocoder(IGeocoder* geocoder) { geocoder_.store(geocoder); }

// -----------------------------------------------------------------------------
// update(): the ingestion pipeline
// -----------------------------------------------------------------------------
Location LocationTracker::update(const std::string& shipment_id,
                                 const std::string& device_id, double latitude,
                                 double longitude, Timestamp timestamp,
                                 const domain::LocationReadings& readings) {
  // 1. Validate.
  if (shipment_id.empty()) {
    throw TrackingError(ErrorCode::InvalidLocationData, "shipment id is required");
  }
  if (!geo::isValidCoordinate(latitude, longitude)) {
    throw TrackingError(ErrorCode::InvalidLocationData,
                        "coordinates out of range: (" + std::to_string(latitude) +
                            ", " + std::to_string(longitude) + ")");
  }
  if (sessionState(shipment_id) == TrackingSessionState::Stopped) {
    throw TrackingError(ErrorCode::InvalidState,
                        "tracking is stopped for shipment " + shipment_id);
  }

  // 2. Stale check against the current latest.
  const auto prior = repository_.findLatest(shipment_id);
  if (prior.has_value() && timestamp < prior->location.timestamp) {
    std::cerr << "[LocationTracker] DEBUG: stale update for shipment " << shipment_id
              << " rejected (report " << formatIso8601(timestamp) << " < latest "
              << formatIso8601(prior->location.timestamp) << ")\n";
    throw TrackingError(ErrorCode::StaleUpdate,
                        "report at " + formatIso8601(timestamp) +
                            " is older than the latest report for shipment " +
                            shipment_id);
  }

  // 3. Build the record and its derived fields.
  Location location;
  location.id = location_ids_.next_id();
  location.shipment_id = shipment_id;
  location.device_id = device_id;
  location.point = geo::GeoPoint{latitude, longitude};
  location.altitude_m = readings.altitude_m;
  location.speed_kmh = readings.speed_kmh;
  location.heading_deg = readings.heading_deg;
  location.accuracy_m = readings.accuracy_m;
  location.battery_level = readings.battery_level;
  location.source = readings.source;
  location.timestamp = timestamp;
  location.received_at = ms_to_timestamp(time_.now_ms());
  location.quality = deriveQuality(readings.accuracy_m);
  location.is_moving =
      readings.speed_kmh.has_value() && *readings.speed_kmh > config_.moving_speed_threshold;
  correlateNearestStop(location);

  const auto prior_occupancy =
      prior.has_value() ? prior->occupancy : std::optional<domain::GeofenceOccupancy>{};
  const GeofenceEvaluation evaluation =
      geofences_.evaluate(prior_occupancy, location.point, timestamp);
  if (!evaluation.signals.empty()) {
    const GeofenceSignal& last = evaluation.signals.back();
    location.geofence_id = last.geofence_id;
    location.geofence_transition = last.transition;
  }

  // 4. Conditional write of the latest projection, then the report log.
  LatestLocation next{location, evaluation.occupancy, prior.has_value() ? prior->version : 0};
  auto saved = repository_.saveLatest(next);
  if (const auto* conflict = std::get_if<VersionConflict>(&saved)) {
    throw TrackingError(ErrorCode::ConcurrentModification,
                        "concurrent location update for shipment " +
                            conflict->aggregate_id + "; reload and retry");
  }
  repository_.append(location);

  // 5 + 6. History bucket, under its own lock.
  const std::size_t cap = config_.max_history_points_per_day;
  repository_.mutateHistoryBucket(
      shipment_id, utcDateKey(timestamp), [&](domain::LocationHistory& history) {
        history.addPoint(domain::LocationPoint{location.point, location.timestamp,
                                               location.speed_kmh, location.heading_deg});
        if (history.size() > cap) {
          history.compress(cap / 2);
        }
      });

  // 7. Events, after everything above is stored.
  publisher_.publish(makeEvent(
      shipment_id, events::LocationUpdated{location.id, device_id, location.point,
                                           location.speed_kmh, location.is_moving,
                                           timestamp}));

  for (const auto& signal : evaluation.signals) {
    switch (signal.transition) {
      case domain::GeofenceTransition::Enter:
        publisher_.publish(makeEvent(
            shipment_id, events::GeofenceEntered{signal.geofence_id,
                                                 signal.geofence_name, location.point,
                                                 timestamp}));
        break;
      case domain::GeofenceTransition::Exit:
        publisher_.publish(makeEvent(
            shipment_id, events::GeofenceExited{signal.geofence_id, signal.geofence_name,
                                                location.point, timestamp, signal.dwell}));
        break;
      case domain::GeofenceTransition::Dwell:
        publisher_.publish(makeEvent(
            shipment_id, events::GeofenceDwelled{signal.geofence_id,
                                                 signal.geofence_name, location.point,
                                                 timestamp, signal.dwell}));
        break;
    }
  }

  return location;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
Location LocationTracker::latest(const std::string& shipment_id) const {
  auto latest = repository_.findLatest(shipment_id);
  if (!latest.has_value()) {
    throw TrackingError(ErrorCode::NotFound,
                        "no location recorded for shipment " + shipment_id);
  }
  return latest->location;
}

std::vector<Location> LocationTracker::history(const std::string& shipment_id,
                                               Timestamp from, Timestamp to) const {
  if (to < from) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "history range end " + formatIso8601(to) + " precedes start " +
                            formatIso8601(from));
  }
  return repository_.findRange(shipment_id, from, to);
}

std::optional<domain::LocationHistory> LocationTracker::historyBucket(
    const std::string& shipment_id, const std::string& date_key) const {
  return repository_.findHistoryBucket(shipment_id, date_key);
}

std::vector<domain::LocationHistory> LocationTracker::historyRange(
    const std::string& shipment_id, const std::string& start_key,
    const std::string& end_key) const {
  if (!parseUtcDateKey(start_key).has_value() || !parseUtcDateKey(end_key).has_value()) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "date keys must be YYYY-MM-DD: " + start_key + ", " + end_key);
  }
  // Well-formed keys order like the days they name.
  if (end_key < start_key) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "history range end " + end_key + " precedes start " + start_key);
  }
  return repository_.findHistoryBuckets(shipment_id, start_key, end_key);
}

std::vector<Location> LocationTracker::findNearby(const NearbyQuery& query) const {
  if (!geo::isValidCoordinate(query.center.latitude, query.center.longitude)) {
    throw TrackingError(ErrorCode::InvalidLocationData,
                        "coordinates out of range: (" +
                            std::to_string(query.center.latitude) + ", " +
                            std::to_string(query.center.longitude) + ")");
  }
  if (!(query.radius_m > 0.0)) {
    throw TrackingError(ErrorCode::InvalidArgument, "radius must be positive");
  }
  if (query.max_results == 0) {
    throw TrackingError(ErrorCode::InvalidArgument, "max_results must be positive");
  }
  return repository_.findNear(query.center, query.radius_m, query.min_timestamp,
                              query.max_results);
}

Location LocationTracker::enrichWithAddress(const std::string& location_id) {
  auto location = repository_.findById(location_id);
  if (!location.has_value()) {
    throw TrackingError(ErrorCode::NotFound, "location not found: " + location_id);
  }
  if (location->address.has_value()) {
    return *location;
  }

  IGeocoder* geocoder = geocoder_.load();
  if (geocoder == nullptr) {
    throw TrackingError(ErrorCode::PreconditionFailed, "no geocoder attached");
  }
  location->address =
      geocoder->reverseGeocode(location->point.latitude, location->point.longitude);
  repository_.replace(*location);
  return *location;
}

ArchiveSummary LocationTracker::archiveHistoryBefore(const std::string& date_key) {
  const auto day_start = parseUtcDateKey(date_key);
  if (!day_start.has_value()) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "archive date key must be YYYY-MM-DD: " + date_key);
  }

  ArchiveSummary summary;
  const std::size_t keep = config_.archive_keep_points;
  const auto keys = repository_.bucketKeysBefore(date_key);
  for (const auto& [shipment_id, day] : keys) {
    repository_.mutateHistoryBucket(
        shipment_id, day, [keep](domain::LocationHistory& history) { history.compress(keep); });
  }
  summary.buckets_compressed = keys.size();
  summary.reports_removed = repository_.removeReportsBefore(*day_start);

  std::cerr << "[LocationTracker] INFO: archived before " << date_key << ": "
            << summary.buckets_compressed << " bucket(s) compressed, "
            << summary.reports_removed << " report(s) removed\n";
  return summary;
}

std::size_t LocationTracker::cleanupStaleLocations(std::int64_t threshold_hours) {
  if (threshold_hours <= 0) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "stale threshold must be positive, got " +
                            std::to_string(threshold_hours) + " h");
  }
  const Timestamp cutoff =
      ms_to_timestamp(time_.now_ms()) - std::chrono::hours{threshold_hours};
  const std::size_t removed = repository_.removeReportsBefore(cutoff);
  std::cerr << "[LocationTracker] INFO: removed " << removed
            << " report(s) older than " << formatIso8601(cutoff) << "\n";
  return removed;
}

std::size_t LocationTracker::deleteHistory(const std::string& shipment_id) {
  const std::size_t removed = repository_.removeShipment(shipment_id);
  std::cerr << "[LocationTracker] INFO: deleted location history of shipment "
            << shipment_id << " (" << removed << " report(s))\n";
  return removed;
}

std::vector<Location> LocationTracker::movingShipments(Timestamp since) const {
  std::vector<Location> result;
  for (const auto& latest : repository_.findAllLatest()) {
    if (latest.location.is_moving && latest.location.timestamp >= since) {
      result.push_back(latest.location);
    }
  }
  return result;
}

bool LocationTracker::isStale(const Location& location, Timestamp now,
                              std::int64_t threshold_minutes) {
  return now - location.timestamp > std::chrono::minutes{threshold_minutes};
}

bool LocationTracker::isStale(const Location& location) const {
  return isStale(location, ms_to_timestamp(time_.now_ms()),
                 config_.stale_threshold_minutes);
}

domain::LocationQuality LocationTracker::deriveQuality(
    std::optional<double> accuracy_m) const {
  if (!accuracy_m.has_value()) {
    return domain::LocationQuality::Unknown;
  }
  if (*accuracy_m < config_.high_quality_accuracy_m) {
    return domain::LocationQuality::High;
  }
  if (*accuracy_m < config_.standard_quality_accuracy_m) {
    return domain::LocationQuality::Standard;
  }
  return domain::LocationQuality::Low;
}

// -----------------------------------------------------------------------------
// Tracking sessions
// -----------------------------------------------------------------------------
void LocationTracker::initializeSession(const std::string& shipment_id) {
  std::unique_lock lock(sessions_mutex_);
  sessions_[shipment_id] = TrackingSessionState::Active;
}

void LocationTracker::stopTracking(const std::string& shipment_id) {
  std::unique_lock lock(sessions_mutex_);
  sessions_[shipment_id] = TrackingSessionState::Stopped;
}

void LocationTracker::resumeTracking(const std::string& shipment_id) {
  std::unique_lock lock(sessions_mutex_);
  sessions_[shipment_id] = TrackingSessionState::Active;
}

TrackingSessionState LocationTracker::sessionState(const std::string& shipment_id) const {
  std::shared_lock lock(sessions_mutex_);
  auto it = sessions_.find(shipment_id);
  return it != sessions_.end() ? it->second : TrackingSessionState::None;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
void LocationTracker::correlateNearestStop(Location& location) const {
  if (!stop_lookup_) {
    return;
  }

  double best = std::numeric_limits<double>::infinity();
  for (const auto& stop : stop_lookup_(location.shipment_id)) {
    if (!stop.location.coordinates.has_value()) {
      continue;
    }
    const double d = geo::distanceMeters(location.point, *stop.location.coordinates);
    if (d < best) {
      best = d;
      location.nearest_stop_sequence = stop.sequence;
      location.nearest_stop_distance_m = d;
    }
  }
}

events::DomainEvent LocationTracker::makeEvent(const std::string& shipment_id,
                                               events::EventPayload payload) const {
  events::DomainEvent event;
  event.event_id = event_ids_.next_id();
  event.timestamp = ms_to_timestamp(time_.now_ms());
  event.aggregate_id = shipment_id;
  event.version = 0;
  event.payload = std::move(payload);
  return event;
}

}  // namespace shiptrack
