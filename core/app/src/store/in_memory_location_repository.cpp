#include "shiptrack/store/in_memory_location_repository.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace shiptrack {

// -----------------------------------------------------------------------------
// Latest projection
// -----------------------------------------------------------------------------
std::optional<LatestLocation> InMemoryLocationRepository::findLatest(
    const std::string& shipment_id) const {
  std::shared_lock lock(latest_mutex_);
  auto it = latest_.find(shipment_id);
  if (it == latest_.end()) {
    return std::nullopt;
  }
  return it->second;
}

SaveResult<LatestLocation> InMemoryLocationRepository::saveLatest(
    const LatestLocation& latest) {
  const std::string& shipment_id = latest.location.shipment_id;

  std::unique_lock lock(latest_mutex_);
  auto it = latest_.find(shipment_id);
  const std::uint64_t stored_version = (it != latest_.end()) ? it->second.version : 0;

  if (stored_version != latest.version) {
    return VersionConflict{shipment_id, latest.version, stored_version};
  }

  LatestLocation stored = latest;
  stored.version = stored_version + 1;
  latest_[shipment_id] = stored;
  return stored;
}

std::vector<LatestLocation> InMemoryLocationRepository::findAllLatest() const {
  std::shared_lock lock(latest_mutex_);
  std::vector<LatestLocation> result;
  result.reserve(latest_.size());
  for (const auto& [shipment_id, latest] : latest_) {
    result.push_back(latest);
  }
  return result;
}

// -----------------------------------------------------------------------------
// Report log
// -----------------------------------------------------------------------------
void InMemoryLocationRepository::append(const domain::Location& location) {
  std::unique_lock lock(reports_mutex_);
  reports_[location.shipment_id].push_back(location);
  shipment_by_location_[location.id] = location.shipment_id;
}

bool InMemoryLocationRepository::replace(const domain::Location& location) {
  {
    std::unique_lock lock(reports_mutex_);
    auto owner = shipment_by_location_.find(location.id);
    if (owner == shipment_by_location_.end()) {
      return false;
    }
    auto& reports = reports_[owner->second];
    auto it = std::find_if(reports.begin(), reports.end(),
                           [&](const domain::Location& l) { return l.id == location.id; });
    if (it == reports.end()) {
      return false;
    }
    *it = location;
  }

  // Keep the projection in step when it shows the same report. The version
  // is left alone: the report's position and time did not change.
  std::unique_lock lock(latest_mutex_);
  auto latest = latest_.find(location.shipment_id);
  if (latest != latest_.end() && latest->second.location.id == location.id) {
    latest->second.location = location;
  }
  return true;
}

std::optional<domain::Location> InMemoryLocationRepository::findById(
    const std::string& location_id) const {
  std::shared_lock lock(reports_mutex_);
  auto owner = shipment_by_location_.find(location_id);
  if (owner == shipment_by_location_.end()) {
    return std::nullopt;
  }
  const auto& reports = reports_.at(owner->second);
  auto it = std::find_if(reports.begin(), reports.end(),
                         [&](const domain::Location& l) { return l.id == location_id; });
  if (it == reports.end()) {
    return std::nullopt;
  }
  return *it;
}

std::vector<domain::Location> InMemoryLocationRepository::findRange(
    const std::string& shipment_id, Timestamp from, Timestamp to) const {
  std::vector<domain::Location> result;
  {
    std::shared_lock lock(reports_mutex_);
    auto it = reports_.find(shipment_id);
    if (it == reports_.end()) {
      return result;
    }
    for (const auto& location : it->second) {
      if (location.timestamp >= from && location.timestamp <= to) {
        result.push_back(location);
      }
    }
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const domain::Location& a, const domain::Location& b) {
                     return a.timestamp < b.timestamp;
                   });
  return result;
}

std::vector<domain::Location> InMemoryLocationRepository::findNear(
    const geo::GeoPoint& center, double radius_m, std::optional<Timestamp> not_before,
    std::size_t limit) const {
  std::vector<std::pair<double, domain::Location>> hits;
  {
    std::shared_lock lock(reports_mutex_);
    for (const auto& [shipment_id, reports] : reports_) {
      for (const auto& location : reports) {
        if (not_before.has_value() && location.timestamp < *not_before) {
          continue;
        }
        const double d = geo::distanceMeters(center, location.point);
        if (d <= radius_m) {
          hits.emplace_back(d, location);
        }
      }
    }
  }

  // Nearest first; equal distances newest first, then by id.
  std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
    if (a.first != b.first) {
      return a.first < b.first;
    }
    if (a.second.timestamp != b.second.timestamp) {
      return a.second.timestamp > b.second.timestamp;
    }
    return a.second.id < b.second.id;
  });

  std::vector<domain::Location> result;
  for (std::size_t i = 0; i < hits.size() && i < limit; ++i) {
    result.push_back(std::move(hits[i].second));
  }
  return result;
}

std::size_t InMemoryLocationRepository::removeReportsBefore(Timestamp cutoff) {
  std::unique_lock lock(reports_mutex_);
  std::size_t removed = 0;
  for (auto it = reports_.begin(); it != reports_.end();) {
    auto& reports = it->second;
    auto keep = std::stable_partition(
        reports.begin(), reports.end(),
        [cutoff](const domain::Location& l) { return l.timestamp >= cutoff; });
    for (auto old = keep; old != reports.end(); ++old) {
      shipment_by_location_.erase(old->id);
    }
    removed += static_cast<std::size_t>(std::distance(keep, reports.end()));
    reports.erase(keep, reports.end());
    it = reports.empty() ? reports_.erase(it) : std::next(it);
  }
  return removed;
}

std::size_t InMemoryLocationRepository::removeShipment(const std::string& shipment_id) {
  std::size_t removed = 0;
  {
    std::unique_lock lock(reports_mutex_);
    auto it = reports_.find(shipment_id);
    if (it != reports_.end()) {
      for (const auto& location : it->second) {
        shipment_by_location_.erase(location.id);
      }
      removed = it->second.size();
      reports_.erase(it);
    }
  }
  {
    std::unique_lock lock(latest_mutex_);
    latest_.erase(shipment_id);
  }
  {
    std::unique_lock lock(buckets_mutex_);
    auto first = buckets_.lower_bound(BucketKey{shipment_id, ""});
    auto last = first;
    while (last != buckets_.end() && last->first.first == shipment_id) {
      ++last;
    }
    buckets_.erase(first, last);
  }
  return removed;
}

// -----------------------------------------------------------------------------
// History buckets
// -----------------------------------------------------------------------------
domain::LocationHistory InMemoryLocationRepository::mutateHistoryBucket(
    const std::string& shipment_id, const std::string& date_key,
    const BucketMutation& mutate) {
  std::shared_ptr<Bucket> bucket;
  {
    std::unique_lock lock(buckets_mutex_);
    auto& slot = buckets_[BucketKey{shipment_id, date_key}];
    if (!slot) {
      slot = std::make_shared<Bucket>();
      slot->history = domain::LocationHistory(shipment_id, date_key);
    }
    bucket = slot;
  }

  std::lock_guard lock(bucket->mutex);
  mutate(bucket->history);
  return bucket->history;
}

std::optional<domain::LocationHistory> InMemoryLocationRepository::findHistoryBucket(
    const std::string& shipment_id, const std::string& date_key) const {
  std::shared_ptr<const Bucket> bucket;
  {
    std::shared_lock lock(buckets_mutex_);
    auto it = buckets_.find(BucketKey{shipment_id, date_key});
    if (it == buckets_.end()) {
      return std::nullopt;
    }
    bucket = it->second;
  }
  std::lock_guard lock(bucket->mutex);
  return bucket->history;
}

std::vector<domain::LocationHistory> InMemoryLocationRepository::findHistoryBuckets(
    const std::string& shipment_id, const std::string& first_day,
    const std::string& last_day) const {
  std::vector<std::shared_ptr<const Bucket>> selected;
  {
    std::shared_lock lock(buckets_mutex_);
    // Keys order by (shipment, day), so the range is contiguous.
    for (auto it = buckets_.lower_bound(BucketKey{shipment_id, first_day});
         it != buckets_.end() && it->first.first == shipment_id &&
         it->first.second <= last_day;
         ++it) {
      selected.push_back(it->second);
    }
  }

  std::vector<domain::LocationHistory> result;
  result.reserve(selected.size());
  for (const auto& bucket : selected) {
    std::lock_guard lock(bucket->mutex);
    result.push_back(bucket->history);
  }
  return result;
}

std::vector<ILocationRepository::BucketKey> InMemoryLocationRepository::bucketKeysBefore(
    const std::string& date_key) const {
  std::shared_lock lock(buckets_mutex_);
  std::vector<BucketKey> keys;
  for (const auto& [key, bucket] : buckets_) {
    // "YYYY-MM-DD" sorts lexicographically in date order.
    if (key.second < date_key) {
      keys.push_back(key);
    }
  }
  return keys;
}

}  // namespace shiptrack
