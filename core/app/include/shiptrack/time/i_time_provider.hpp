#pragma once

#include <cstdint>

namespace shiptrack {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Shipment transitions stamp updatedAt, domain events carry a timestamp,
// stale checks and ETA validation compare against "now". If components call
// std::chrono::system_clock::now() directly, a replayed GPS trace or a unit
// test cannot control what "now" is and loses determinism.
//
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the caller (tests,
//                              trace replay, the demo binary).
//
// Components receive `const ITimeProvider&` and call now_ms() whenever they
// need a timestamp.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace shiptrack
