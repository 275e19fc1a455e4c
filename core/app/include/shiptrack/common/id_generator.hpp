#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace shiptrack {

// -----------------------------------------------------------------------------
// IdGenerator — thread-safe, monotonically increasing string id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique ids of the form "<prefix>-<n>" via an atomic
//         counter. Each call to next_id() returns a value different from
//         every other call on the same instance, regardless of thread.
//
// @details
// The counter starts at 1 (0 is reserved as an "unset" sentinel). The prefix
// makes ids self-describing in logs and event payloads: "evt-17", "loc-3",
// "shp-1", "saga-2". std::memory_order_relaxed is sufficient because the only
// requirement is uniqueness; no other memory depends on the increment order.
//
// Why not a singleton:
//   The engine owns one generator per id space as a value member and injects
//   it by reference. Tests construct their own generators and get
//   deterministic ids starting at 1.
//
// Thread model:
//   next_id() is safe to call concurrently from any number of threads.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

  // Non-copyable, non-movable: copying a generator would create two sources
  // producing duplicate ids.
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @brief  Returns the next unique id, e.g. "evt-1", "evt-2", ...
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  Atomically increments the internal counter.
  // -------------------------------------------------------------------------
  std::string next_id() {
    return prefix_ + "-" +
           std::to_string(next_.fetch_add(1, std::memory_order_relaxed));
  }

  const std::string& prefix() const { return prefix_; }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace shiptrack
