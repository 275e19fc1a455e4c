#pragma once

#include "shiptrack/geo/geo_math.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace shiptrack {
namespace domain {

// Compact sample kept in a history bucket.
struct LocationPoint {
  geo::GeoPoint point;
  Timestamp timestamp{};
  std::optional<double> speed_kmh;
  std::optional<double> heading_deg;
};

// -----------------------------------------------------------------------------
// LocationStatistics
// -----------------------------------------------------------------------------
// Rolling aggregates over every point ever appended to the bucket, not only
// the points that survive compression. Updated in O(1) per append.
//
// average_speed_kmh is a running mean over points that reported a speed;
// speed_samples counts them.
// -----------------------------------------------------------------------------
struct LocationStatistics {
  double total_distance_km{0.0};
  double min_latitude{0.0};
  double max_latitude{0.0};
  double min_longitude{0.0};
  double max_longitude{0.0};
  double average_speed_kmh{0.0};
  double max_speed_kmh{0.0};
  std::size_t speed_samples{0};
  std::size_t points_recorded{0};
};

// -----------------------------------------------------------------------------
// LocationHistory — one (shipment, UTC day) bucket
// -----------------------------------------------------------------------------
//
// @brief  Ordered sequence of compact points plus rolling statistics.
//
// @details
// Points are kept in append order. LocationTracker only appends reports that
// passed the stale check, so append order is also timestamp order.
//
// Compression:
//   compress(target) keeps `target` evenly spaced points, always including
//   the oldest and the most recent one (only the most recent when target is
//   1). Statistics are left untouched: they describe the day, not
//   the retained sample.
//
// Thread model: Plain value. The location repository serialises access per
// bucket.
// -----------------------------------------------------------------------------
class LocationHistory {
 public:
  LocationHistory() = default;
  LocationHistory(std::string shipment_id, std::string date_key);

  const std::string& shipmentId() const { return shipment_id_; }
  const std::string& dateKey() const { return date_key_; }
  const std::vector<LocationPoint>& points() const { return points_; }
  const LocationStatistics& statistics() const { return stats_; }
  std::size_t size() const { return points_.size(); }

  // Appends one point and folds it into the statistics.
  void addPoint(const LocationPoint& point);

  // Reduces the bucket to at most `target` points, keeping the last one.
  // No-op when size() <= target. target must be >= 1.
  void compress(std::size_t target);

 private:
  std::string shipment_id_;
  std::string date_key_;
  std::vector<LocationPoint> points_;
  LocationStatistics stats_;
};

}  // namespace domain
}  // namespace shiptrack
