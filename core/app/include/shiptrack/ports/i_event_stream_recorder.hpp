#pragma once

#include "shiptrack/events/domain_event.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <string>

namespace shiptrack {

// Event context: the per-shipment timeline consumed by analytics and
// dashboards.
class IEventStreamRecorder {
 public:
  virtual ~IEventStreamRecorder() = default;

  virtual void initializeStream(const std::string& shipment_id) = 0;
  virtual void recordEvent(const events::DomainEvent& event) = 0;
  virtual void createMilestone(const std::string& shipment_id,
                               const std::string& milestone,
                               Timestamp reached_at) = 0;
};

}  // namespace shiptrack
