#include "shiptrack/time/time_utils.hpp"

#include <cstddef>
#include <cstdio>

namespace shiptrack {

namespace {

constexpr std::int64_t kMsPerDay = 86'400'000;

struct CivilDate {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

// Floor division for negative epochs.
std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

// Days since 1970-01-01 → proleptic Gregorian date.
CivilDate civilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{m <= 2 ? y + 1 : y, m, d};
}

// Proleptic Gregorian date → days since 1970-01-01.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

}  // namespace

std::string utcDateKey(Timestamp tp) {
  const std::int64_t days = floorDiv(timestamp_to_ms(tp), kMsPerDay);
  const CivilDate date = civilFromDays(days);

  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u",
                static_cast<long long>(date.year), date.month, date.day);
  return buffer;
}

std::optional<Timestamp> parseUtcDateKey(const std::string& key) {
  if (key.size() != 10 || key[4] != '-' || key[7] != '-') {
    return std::nullopt;
  }
  for (std::size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (key[i] < '0' || key[i] > '9') {
      return std::nullopt;
    }
  }

  const std::int64_t year = std::stoll(key.substr(0, 4));
  const auto month = static_cast<unsigned>(std::stoul(key.substr(5, 2)));
  const auto day = static_cast<unsigned>(std::stoul(key.substr(8, 2)));
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return std::nullopt;
  }

  const std::int64_t days = daysFromCivil(year, month, day);
  // Round-trip rejects days past the end of the month ("2025-02-30").
  const CivilDate check = civilFromDays(days);
  if (check.year != year || check.month != month || check.day != day) {
    return std::nullopt;
  }
  return ms_to_timestamp(days * kMsPerDay);
}

std::string formatIso8601(Timestamp tp) {
  const std::int64_t ms = timestamp_to_ms(tp);
  const std::int64_t days = floorDiv(ms, kMsPerDay);
  const std::int64_t ms_of_day = ms - days * kMsPerDay;
  const CivilDate date = civilFromDays(days);

  const auto hours = static_cast<unsigned>(ms_of_day / 3'600'000);
  const auto minutes = static_cast<unsigned>((ms_of_day / 60'000) % 60);
  const auto seconds = static_cast<unsigned>((ms_of_day / 1000) % 60);
  const auto millis = static_cast<unsigned>(ms_of_day % 1000);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02u:%02u:%02u.%03uZ",
                static_cast<long long>(date.year), date.month, date.day, hours,
                minutes, seconds, millis);
  return buffer;
}

Timestamp utcTimestamp(int year, unsigned month, unsigned day, unsigned hour,
                       unsigned minute, unsigned second) {
  const std::int64_t days = daysFromCivil(year, month, day);
  const std::int64_t ms = days * kMsPerDay +
                          static_cast<std::int64_t>(hour) * 3'600'000 +
                          static_cast<std::int64_t>(minute) * 60'000 +
                          static_cast<std::int64_t>(second) * 1000;
  return ms_to_timestamp(ms);
}

}  // namespace shiptrack
