// =============================================================================
// tracking_config_test.cpp
// =============================================================================
// Unit tests for parseTrackingConfig() / loadTrackingConfig().
//
// Validates:
//   - Defaults when the document is empty
//   - Partial overlays leave other keys at their defaults
//   - Type errors and out-of-range values → InvalidArgument naming the key
//   - Missing and malformed files → InvalidArgument
// =============================================================================

#include "shiptrack/common/error.hpp"
#include "shiptrack/config/tracking_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <string>

using nlohmann::json;
using shiptrack::ErrorCode;
using shiptrack::TrackingConfig;
using shiptrack::TrackingError;

namespace {

ErrorCode parseFailure(const json& j, std::string* message = nullptr) {
  try {
    shiptrack::parseTrackingConfig(j);
  } catch (const TrackingError& e) {
    if (message != nullptr) {
      *message = e.message();
    }
    return e.code();
  }
  ADD_FAILURE() << "expected parse failure for " << j.dump();
  return ErrorCode::SagaFailed;
}

std::string writeTempFile(const std::string& name, const std::string& contents) {
  const std::string path = ::testing::TempDir() + name;
  std::ofstream out(path);
  out << contents;
  return path;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. An empty object yields the production defaults.
// -----------------------------------------------------------------------------
TEST(TrackingConfigTest, Defaults) {
  const TrackingConfig config = shiptrack::parseTrackingConfig(json::object());

  EXPECT_EQ(config.max_history_points_per_day, 1000u);
  EXPECT_EQ(config.archive_keep_points, 100u);
  EXPECT_DOUBLE_EQ(config.moving_speed_threshold, 0.5);
  EXPECT_DOUBLE_EQ(config.high_quality_accuracy_m, 10.0);
  EXPECT_DOUBLE_EQ(config.standard_quality_accuracy_m, 50.0);
  EXPECT_EQ(config.stale_threshold_minutes, 30);
  EXPECT_EQ(config.saga_step_timeout_ms, 5000);
  EXPECT_TRUE(config.transport_endpoint.empty());
}

// -----------------------------------------------------------------------------
// 2. Present keys override, absent keys keep defaults, unknown keys are
//    ignored.
// -----------------------------------------------------------------------------
TEST(TrackingConfigTest, PartialOverlay) {
  const TrackingConfig config = shiptrack::parseTrackingConfig(json{
      {"max_history_points_per_day", 200},
      {"transport_endpoint", "tcp://127.0.0.1:6000"},
      {"dashboard_theme", "dark"},
  });

  EXPECT_EQ(config.max_history_points_per_day, 200u);
  EXPECT_EQ(config.transport_endpoint, "tcp://127.0.0.1:6000");
  EXPECT_EQ(config.archive_keep_points, 100u);
  EXPECT_EQ(config.saga_step_timeout_ms, 5000);
}

// -----------------------------------------------------------------------------
// 3. Wrong types and invalid values are rejected with the key in the message.
// -----------------------------------------------------------------------------
TEST(TrackingConfigTest, RejectsInvalidValues) {
  std::string message;
  EXPECT_EQ(parseFailure(json{{"moving_speed_threshold", "fast"}}, &message),
            ErrorCode::InvalidArgument);
  EXPECT_NE(message.find("moving_speed_threshold"), std::string::npos);

  EXPECT_EQ(parseFailure(json{{"max_history_points_per_day", -5}}),
            ErrorCode::InvalidArgument);
  EXPECT_EQ(parseFailure(json{{"max_history_points_per_day", 1}}),
            ErrorCode::InvalidArgument);
  EXPECT_EQ(parseFailure(json{{"saga_step_timeout_ms", 0}}), ErrorCode::InvalidArgument);
  EXPECT_EQ(parseFailure(json{{"stale_threshold_minutes", -1}}), ErrorCode::InvalidArgument);
  EXPECT_EQ(parseFailure(json::array({1, 2})), ErrorCode::InvalidArgument);
}

// -----------------------------------------------------------------------------
// 4. Quality thresholds must be ordered high < standard.
// -----------------------------------------------------------------------------
TEST(TrackingConfigTest, QualityThresholdOrder) {
  EXPECT_EQ(parseFailure(json{{"high_quality_accuracy_m", 60.0}}),
            ErrorCode::InvalidArgument);
  EXPECT_EQ(parseFailure(json{{"high_quality_accuracy_m", 0.0}}),
            ErrorCode::InvalidArgument);

  const TrackingConfig config = shiptrack::parseTrackingConfig(
      json{{"high_quality_accuracy_m", 60.0}, {"standard_quality_accuracy_m", 120.0}});
  EXPECT_DOUBLE_EQ(config.high_quality_accuracy_m, 60.0);
}

// -----------------------------------------------------------------------------
// 5. Files: good, missing, malformed.
// -----------------------------------------------------------------------------
TEST(TrackingConfigTest, LoadFromFile) {
  const std::string good =
      writeTempFile("shiptrack_config_good.json", R"({"archive_keep_points": 10})");
  EXPECT_EQ(shiptrack::loadTrackingConfig(good).archive_keep_points, 10u);

  try {
    shiptrack::loadTrackingConfig(::testing::TempDir() + "shiptrack_missing.json");
    FAIL() << "expected InvalidArgument";
  } catch (const TrackingError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
  }

  const std::string bad = writeTempFile("shiptrack_config_bad.json", "{ not json");
  EXPECT_THROW(shiptrack::loadTrackingConfig(bad), TrackingError);
}
