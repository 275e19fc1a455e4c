#pragma once

#include "shiptrack/time/i_time_provider.hpp"

namespace shiptrack {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the engine when it is driven by live device traffic. Tests and the
// demo binary use SimulationTimeProvider instead.
//
// Thread model: system_clock::now() is safe from any thread; no state.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace shiptrack
