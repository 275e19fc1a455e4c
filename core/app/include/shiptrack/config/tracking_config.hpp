#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace shiptrack {

// -----------------------------------------------------------------------------
// TrackingConfig — engine-wide tunables
// -----------------------------------------------------------------------------
//
// @brief  Plain data struct copied into components at construction.
//
// @details
// Defaults are the production values; a JSON file only needs the keys it
// overrides. Keys match the field names:
//
//   {
//     "max_history_points_per_day": 1000,
//     "archive_keep_points": 100,
//     "moving_speed_threshold": 0.5,
//     "high_quality_accuracy_m": 10,
//     "standard_quality_accuracy_m": 50,
//     "stale_threshold_minutes": 30,
//     "saga_step_timeout_ms": 5000,
//     "transport_endpoint": "tcp://127.0.0.1:5560"
//   }
//
// History buckets compress to max_history_points_per_day / 2 once they grow
// past the cap. An empty transport_endpoint keeps the ZeroMQ transport off.
//
// Thread model: value semantics, no shared mutable state.
// -----------------------------------------------------------------------------
struct TrackingConfig {
  std::size_t max_history_points_per_day{1000};
  std::size_t archive_keep_points{100};
  double moving_speed_threshold{0.5};     // km/h, strictly greater is moving
  double high_quality_accuracy_m{10.0};   // accuracy below this is High
  double standard_quality_accuracy_m{50.0};
  std::int64_t stale_threshold_minutes{30};
  std::int64_t saga_step_timeout_ms{5000};
  std::string transport_endpoint;
};

// -------------------------------------------------------------------------
// parseTrackingConfig(json)
// -------------------------------------------------------------------------
// Overlays the keys present in `j` on the defaults. Unknown keys are
// ignored. Throws TrackingError(InvalidArgument) when `j` is not an object,
// a value has the wrong type, a count or timeout is not positive, a history
// cap is below 2, or the quality thresholds are out of order.
// -------------------------------------------------------------------------
TrackingConfig parseTrackingConfig(const nlohmann::json& j);

// Reads and parses a JSON file. A missing file or malformed JSON is
// InvalidArgument too.
TrackingConfig loadTrackingConfig(const std::string& path);

}  // namespace shiptrack
