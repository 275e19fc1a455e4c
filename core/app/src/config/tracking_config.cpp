#include "shiptrack/config/tracking_config.hpp"

#include "shiptrack/common/error.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace shiptrack {

namespace {

// Copies j[key] into `out` when present. nlohmann's get<T>() throws
// type_error on a mismatch; that is reported as InvalidArgument with the key.
template <typename T>
void readKey(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        std::string("config key '") + key + "': " + e.what());
  }
}

void readCount(const nlohmann::json& j, const char* key, std::size_t& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        std::string("config key '") + key +
                            "' must be a non-negative integer");
  }
  out = it->get<std::size_t>();
}

void require(bool condition, const std::string& message) {
  if (!condition) {
    throw TrackingError(ErrorCode::InvalidArgument, message);
  }
}

}  // namespace

TrackingConfig parseTrackingConfig(const nlohmann::json& j) {
  require(j.is_object(), "tracking config must be a JSON object");

  TrackingConfig config;
  readCount(j, "max_history_points_per_day", config.max_history_points_per_day);
  readCount(j, "archive_keep_points", config.archive_keep_points);
  readKey(j, "moving_speed_threshold", config.moving_speed_threshold);
  readKey(j, "high_quality_accuracy_m", config.high_quality_accuracy_m);
  readKey(j, "standard_quality_accuracy_m", config.standard_quality_accuracy_m);
  readKey(j, "stale_threshold_minutes", config.stale_threshold_minutes);
  readKey(j, "saga_step_timeout_ms", config.saga_step_timeout_ms);
  readKey(j, "transport_endpoint", config.transport_endpoint);

  require(config.max_history_points_per_day >= 2,
          "max_history_points_per_day must be at least 2");
  require(config.archive_keep_points >= 2, "archive_keep_points must be at least 2");
  require(config.moving_speed_threshold >= 0.0,
          "moving_speed_threshold must not be negative");
  require(config.high_quality_accuracy_m > 0.0 &&
              config.high_quality_accuracy_m < config.standard_quality_accuracy_m,
          "quality thresholds must satisfy 0 < high < standard");
  require(config.stale_threshold_minutes > 0, "stale_threshold_minutes must be positive");
  require(config.saga_step_timeout_ms > 0, "saga_step_timeout_ms must be positive");
  return config;
}

TrackingConfig loadTrackingConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw TrackingError(ErrorCode::InvalidArgument, "cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "malformed config file " + path + ": " + e.what());
  }
  return parseTrackingConfig(j);
}

}  // namespace shiptrack
