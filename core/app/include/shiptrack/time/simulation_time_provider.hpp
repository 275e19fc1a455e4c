#pragma once

#include "shiptrack/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace shiptrack {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         rather than read from the system clock.
//
// @details
// When a recorded GPS trace is replayed, the engine must believe that "now"
// is whatever the trace says it is: ETA validation, stale-location checks and
// event timestamps all follow the trace. Tests use the same mechanism to pin
// time to a known instant.
//
// Internal storage is a std::atomic<int64_t>: readers on any thread see the
// most recent advance_time() without taking a lock.
//
// Thread model:
//   advance_time() is intended for a single writer (the replay driver or the
//   test body). now_ms() may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  // Returns the last time set by advance_time() (0 if never set).
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulation clock to the given timestamp.
  //
  // @details
  // Monotonicity is the caller's responsibility. Tests rely on being able to
  // set arbitrary times, e.g. to produce an out-of-order location report.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms. Convenience for tests.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace shiptrack
