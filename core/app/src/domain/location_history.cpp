#include "shiptrack/domain/location_history.hpp"

#include <algorithm>
#include <utility>

namespace shiptrack {
namespace domain {

LocationHistory::LocationHistory(std::string shipment_id, std::string date_key)
    : shipment_id_(std::move(shipment_id)), date_key_(std::move(date_key)) {}

// -----------------------------------------------------------------------------
// addPoint(): O(1) statistics fold
// -----------------------------------------------------------------------------
void LocationHistory::addPoint(const LocationPoint& point) {
  const double lat = point.point.latitude;
  const double lon = point.point.longitude;

  if (stats_.points_recorded == 0) {
    stats_.min_latitude = stats_.max_latitude = lat;
    stats_.min_longitude = stats_.max_longitude = lon;
  } else {
    stats_.min_latitude = std::min(stats_.min_latitude, lat);
    stats_.max_latitude = std::max(stats_.max_latitude, lat);
    stats_.min_longitude = std::min(stats_.min_longitude, lon);
    stats_.max_longitude = std::max(stats_.max_longitude, lon);
  }

  // Pairwise from the previous retained point. After compression the last
  // point is always retained, so this is still the previous report.
  if (!points_.empty()) {
    stats_.total_distance_km += geo::distanceKm(points_.back().point, point.point);
  }

  if (point.speed_kmh.has_value()) {
    const double speed = *point.speed_kmh;
    ++stats_.speed_samples;
    stats_.average_speed_kmh +=
        (speed - stats_.average_speed_kmh) /
        static_cast<double>(stats_.speed_samples);
    stats_.max_speed_kmh = std::max(stats_.max_speed_kmh, speed);
  }

  ++stats_.points_recorded;
  points_.push_back(point);
}

// -----------------------------------------------------------------------------
// compress(): uniform sub-sampling that pins the newest point
// -----------------------------------------------------------------------------
// Picks index k * (n - 1) / (target - 1) for k in [0, target). Because
// n > target the stride exceeds 1, so the picked indices are distinct, the
// first pick is index 0 and the last pick is index n - 1.
// -----------------------------------------------------------------------------
void LocationHistory::compress(std::size_t target) {
  const std::size_t n = points_.size();
  if (target == 0 || n <= target) {
    return;
  }

  std::vector<LocationPoint> kept;
  kept.reserve(target);

  if (target == 1) {
    kept.push_back(points_.back());
  } else {
    for (std::size_t k = 0; k < target; ++k) {
      kept.push_back(points_[k * (n - 1) / (target - 1)]);
    }
  }

  points_ = std::move(kept);
}

}  // namespace domain
}  // namespace shiptrack
