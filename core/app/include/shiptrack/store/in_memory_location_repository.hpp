#pragma once

#include "shiptrack/ports/i_location_repository.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace shiptrack {

// -----------------------------------------------------------------------------
// InMemoryLocationRepository
// -----------------------------------------------------------------------------
//
// @brief  Map-backed ILocationRepository.
//
// @details
// Locks:
//   latest_mutex_   latest projection per shipment
//   reports_mutex_  report log and id index
//   buckets_mutex_  bucket map structure only
//   Bucket::mutex   one bucket's contents
//
// mutateHistoryBucket() looks the bucket up (creating it if needed) under
// buckets_mutex_, releases it, and then runs the mutation under the bucket's
// own mutex. Two shipments, or two days of the same shipment, never contend.
// Buckets carry their own mutex and are held by shared_ptr, so a mutation in
// progress keeps its bucket alive even if removeShipment() erases it from
// the map meanwhile; that late mutation is then lost with the bucket.
//
// removeShipment() takes the three map locks one after another, never
// nested.
// -----------------------------------------------------------------------------
class InMemoryLocationRepository final : public ILocationRepository {
 public:
  std::optional<LatestLocation> findLatest(
      const std::string& shipment_id) const override;
  SaveResult<LatestLocation> saveLatest(const LatestLocation& latest) override;
  std::vector<LatestLocation> findAllLatest() const override;

  void append(const domain::Location& location) override;
  bool replace(const domain::Location& location) override;
  std::optional<domain::Location> findById(
      const std::string& location_id) const override;
  std::vector<domain::Location> findRange(const std::string& shipment_id,
                                          Timestamp from,
                                          Timestamp to) const override;
  std::vector<domain::Location> findNear(const geo::GeoPoint& center, double radius_m,
                                         std::optional<Timestamp> not_before,
                                         std::size_t limit) const override;
  std::size_t removeReportsBefore(Timestamp cutoff) override;
  std::size_t removeShipment(const std::string& shipment_id) override;

  domain::LocationHistory mutateHistoryBucket(
      const std::string& shipment_id, const std::string& date_key,
      const BucketMutation& mutate) override;
  std::optional<domain::LocationHistory> findHistoryBucket(
      const std::string& shipment_id,
      const std::string& date_key) const override;
  std::vector<domain::LocationHistory> findHistoryBuckets(
      const std::string& shipment_id, const std::string& first_day,
      const std::string& last_day) const override;
  std::vector<BucketKey> bucketKeysBefore(
      const std::string& date_key) const override;

 private:
  struct Bucket {
    mutable std::mutex mutex;
    domain::LocationHistory history;
  };

  mutable std::shared_mutex latest_mutex_;
  std::unordered_map<std::string, LatestLocation> latest_;

  mutable std::shared_mutex reports_mutex_;
  std::unordered_map<std::string, std::vector<domain::Location>> reports_;
  std::unordered_map<std::string, std::string> shipment_by_location_;

  mutable std::shared_mutex buckets_mutex_;
  std::map<BucketKey, std::shared_ptr<Bucket>> buckets_;
};

}  // namespace shiptrack
