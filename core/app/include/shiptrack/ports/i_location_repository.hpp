#pragma once

#include "shiptrack/domain/location.hpp"
#include "shiptrack/domain/location_history.hpp"
#include "shiptrack/ports/version_conflict.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shiptrack {

// -----------------------------------------------------------------------------
// LatestLocation
// -----------------------------------------------------------------------------
// "Current location" projection of one shipment together with its geofence
// occupancy. version guards the read-compute-write cycle in
// LocationTracker::update().
// -----------------------------------------------------------------------------
struct LatestLocation {
  domain::Location location;
  std::optional<domain::GeofenceOccupancy> occupancy;
  std::uint64_t version{0};
};

// -----------------------------------------------------------------------------
// ILocationRepository
// -----------------------------------------------------------------------------
//
// @brief  Storage for position reports, the per-shipment latest projection and
//         the daily history buckets.
//
// @details
// Three independent records with independent serialisation:
//   - the report log                      (append / findById / findRange /
//                                          findNear; pruned by
//                                          removeReportsBefore)
//   - the latest projection per shipment  (saveLatest, version-checked)
//   - history buckets per (shipment, day) (mutateHistoryBucket, per-bucket
//                                          lock held only for the mutation)
// None of them shares a lock with shipment status transitions.
// -----------------------------------------------------------------------------
class ILocationRepository {
 public:
  using BucketMutation = std::function<void(domain::LocationHistory&)>;
  using BucketKey = std::pair<std::string, std::string>;  // (shipment, day)

  virtual ~ILocationRepository() = default;

  virtual std::optional<LatestLocation> findLatest(
      const std::string& shipment_id) const = 0;

  // Stores `latest` if latest.version equals the stored version (0 when
  // absent); the stored copy gets version + 1.
  virtual SaveResult<LatestLocation> saveLatest(const LatestLocation& latest) = 0;

  virtual std::vector<LatestLocation> findAllLatest() const = 0;

  virtual void append(const domain::Location& location) = 0;

  // Replaces a previously appended report, matched by id. Returns false when
  // the id is unknown. The latest projection is refreshed if it holds the
  // same report.
  virtual bool replace(const domain::Location& location) = 0;

  virtual std::optional<domain::Location> findById(
      const std::string& location_id) const = 0;

  // Reports with from <= timestamp <= to, ordered by timestamp.
  virtual std::vector<domain::Location> findRange(const std::string& shipment_id,
                                                  Timestamp from,
                                                  Timestamp to) const = 0;

  // Reports within radius_m of center and not older than not_before (when
  // set), nearest first, at most `limit` of them.
  virtual std::vector<domain::Location> findNear(const geo::GeoPoint& center,
                                                 double radius_m,
                                                 std::optional<Timestamp> not_before,
                                                 std::size_t limit) const = 0;

  // Drops reports with timestamp < cutoff from the log and the id index.
  // The latest projection is kept: stale checks still need it. Returns how
  // many reports were dropped.
  virtual std::size_t removeReportsBefore(Timestamp cutoff) = 0;

  // Drops every report, the latest projection and every history bucket of
  // one shipment. Returns how many reports were dropped.
  virtual std::size_t removeShipment(const std::string& shipment_id) = 0;

  // Runs `mutate` on the bucket under that bucket's lock, creating an empty
  // bucket first if needed. Returns a copy of the bucket after the mutation.
  virtual domain::LocationHistory mutateHistoryBucket(
      const std::string& shipment_id, const std::string& date_key,
      const BucketMutation& mutate) = 0;

  virtual std::optional<domain::LocationHistory> findHistoryBucket(
      const std::string& shipment_id, const std::string& date_key) const = 0;

  // Buckets of one shipment with first_day <= day <= last_day, by day.
  virtual std::vector<domain::LocationHistory> findHistoryBuckets(
      const std::string& shipment_id, const std::string& first_day,
      const std::string& last_day) const = 0;

  // Keys of every bucket whose day sorts strictly before date_key.
  virtual std::vector<BucketKey> bucketKeysBefore(
      const std::string& date_key) const = 0;
};

}  // namespace shiptrack
