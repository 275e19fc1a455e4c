// =============================================================================
// time_utils_test.cpp
// =============================================================================
// Unit tests for the time helpers and the two ITimeProvider implementations.
//
// Validates:
//   - UTC date keys and ISO-8601 rendering, including pre-epoch times
//   - utcTimestamp() agrees with known epoch milliseconds
//   - parseUtcDateKey() inverts utcDateKey() and rejects impossible days
//   - SimulationTimeProvider only moves when told to
//   - LiveTimeProvider follows the system clock
// =============================================================================

#include "shiptrack/time/live_time_provider.hpp"
#include "shiptrack/time/simulation_time_provider.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>

using shiptrack::ms_to_timestamp;

// -----------------------------------------------------------------------------
// 1. 2025-01-01T12:00:00Z is 1735732800000 ms.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, KnownInstant) {
  const auto noon = shiptrack::utcTimestamp(2025, 1, 1, 12, 0, 0);
  EXPECT_EQ(shiptrack::timestamp_to_ms(noon), 1735732800000);
  EXPECT_EQ(shiptrack::utcDateKey(noon), "2025-01-01");
  EXPECT_EQ(shiptrack::formatIso8601(noon + std::chrono::milliseconds(7)),
            "2025-01-01T12:00:00.007Z");
}

// -----------------------------------------------------------------------------
// 2. The day bucket rolls over at UTC midnight, leap day included.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, DateKeyBoundaries) {
  const auto midnight = shiptrack::utcTimestamp(2024, 2, 29);
  EXPECT_EQ(shiptrack::utcDateKey(midnight), "2024-02-29");
  EXPECT_EQ(shiptrack::utcDateKey(midnight - std::chrono::milliseconds(1)),
            "2024-02-28");
  EXPECT_EQ(shiptrack::utcDateKey(midnight + std::chrono::hours(24)), "2024-03-01");
}

// -----------------------------------------------------------------------------
// 3. Times before the epoch floor towards the earlier day.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, PreEpoch) {
  EXPECT_EQ(shiptrack::utcDateKey(ms_to_timestamp(-1)), "1969-12-31");
  EXPECT_EQ(shiptrack::formatIso8601(ms_to_timestamp(-1)), "1969-12-31T23:59:59.999Z");
}

// -----------------------------------------------------------------------------
// 4. Simulation clock is set and advanced explicitly.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, SimulationClock) {
  shiptrack::SimulationTimeProvider clock;
  EXPECT_EQ(clock.now_ms(), 0);

  clock.advance_time(1735732800000);
  EXPECT_EQ(clock.now_ms(), 1735732800000);
  clock.advance_by(500);
  EXPECT_EQ(clock.now_ms(), 1735732800500);
}

// -----------------------------------------------------------------------------
// 5. Live clock tracks system_clock.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, LiveClockFollowsSystemClock) {
  shiptrack::LiveTimeProvider clock;
  const std::int64_t before = shiptrack::timestamp_to_ms(std::chrono::system_clock::now());
  const std::int64_t reading = clock.now_ms();
  const std::int64_t after = shiptrack::timestamp_to_ms(std::chrono::system_clock::now());

  EXPECT_GE(reading, before);
  EXPECT_LE(reading, after);
}

// -----------------------------------------------------------------------------
// 6. Date keys parse back to the midnight that opens the day.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, ParseDateKey) {
  const auto midnight = shiptrack::parseUtcDateKey("2024-02-29");
  ASSERT_TRUE(midnight.has_value());
  EXPECT_EQ(*midnight, shiptrack::utcTimestamp(2024, 2, 29));
  EXPECT_EQ(shiptrack::utcDateKey(*midnight), "2024-02-29");

  EXPECT_FALSE(shiptrack::parseUtcDateKey("2025-02-29").has_value());
  EXPECT_FALSE(shiptrack::parseUtcDateKey("2025-13-01").has_value());
  EXPECT_FALSE(shiptrack::parseUtcDateKey("2025-1-01").has_value());
  EXPECT_FALSE(shiptrack::parseUtcDateKey("2025/01/01").has_value());
}
