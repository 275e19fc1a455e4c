#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace shiptrack {

// -----------------------------------------------------------------------------
// VersionConflict / SaveResult<T>
// -----------------------------------------------------------------------------
// Conditional writes return either the stored value or a VersionConflict
// describing what the caller expected and what the store actually held.
// Services turn the conflict into TrackingError(ConcurrentModification); no
// layer retries on its own.
// -----------------------------------------------------------------------------
struct VersionConflict {
  std::string aggregate_id;
  std::uint64_t expected_version{0};
  std::uint64_t actual_version{0};
};

template <typename T>
using SaveResult = std::variant<T, VersionConflict>;

}  // namespace shiptrack
