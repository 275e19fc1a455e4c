#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace shiptrack {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock instant carried by every domain record and event.
// std::chrono::system_clock::time_point is preferred over raw integers inside
// the domain because it is type-safe; ITimeProvider still speaks int64 ms, and
// the helpers below bridge the two.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// Epoch milliseconds → Timestamp.
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// Timestamp → epoch milliseconds (truncating).
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// utcDateKey
// -------------------------------------------------------------------------
// @brief  Returns the UTC calendar day of `tp` formatted as "YYYY-MM-DD".
//
// @details
// This is the key of a LocationHistory daily bucket. Implemented with the
// days-from-civil inverse on integer arithmetic, so it does not depend on
// std::gmtime (not thread-safe) or the process time zone. Negative epochs
// (before 1970) are handled.
// -------------------------------------------------------------------------
std::string utcDateKey(Timestamp tp);

// -------------------------------------------------------------------------
// parseUtcDateKey
// -------------------------------------------------------------------------
// @brief  Inverse of utcDateKey: UTC midnight opening the "YYYY-MM-DD" day,
//         or nullopt when the key is malformed or names no calendar day.
// -------------------------------------------------------------------------
std::optional<Timestamp> parseUtcDateKey(const std::string& key);

// -------------------------------------------------------------------------
// formatIso8601
// -------------------------------------------------------------------------
// @brief  "YYYY-MM-DDTHH:MM:SS.mmmZ" in UTC. Used by log lines and the demo.
// -------------------------------------------------------------------------
std::string formatIso8601(Timestamp tp);

// -------------------------------------------------------------------------
// utcTimestamp
// -------------------------------------------------------------------------
// @brief  Builds a Timestamp from UTC calendar fields. Used by tests and the
//         demo to express "2025-01-01T08:00" without parsing strings.
// -------------------------------------------------------------------------
Timestamp utcTimestamp(int year, unsigned month, unsigned day,
                       unsigned hour = 0, unsigned minute = 0,
                       unsigned second = 0);

}  // namespace shiptrack
