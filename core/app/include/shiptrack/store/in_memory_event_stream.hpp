#pragma once

#include "shiptrack/ports/i_event_stream_recorder.hpp"

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace shiptrack {

struct Milestone {
  std::string name;
  Timestamp reached_at{};
};

// -----------------------------------------------------------------------------
// InMemoryEventStream
// -----------------------------------------------------------------------------
// Event-context store: one timeline per shipment plus its milestones.
//
// recordEvent() is idempotent on event_id so a redelivered event is not
// recorded twice. Recording into a stream that was never initialized creates
// it; initializeStream() on an existing stream is a no-op.
// -----------------------------------------------------------------------------
class InMemoryEventStream final : public IEventStreamRecorder {
 public:
  void initializeStream(const std::string& shipment_id) override;
  void recordEvent(const events::DomainEvent& event) override;
  void createMilestone(const std::string& shipment_id,
                       const std::string& milestone,
                       Timestamp reached_at) override;

  bool hasStream(const std::string& shipment_id) const;
  std::vector<events::DomainEvent> streamFor(const std::string& shipment_id) const;
  std::vector<Milestone> milestonesFor(const std::string& shipment_id) const;

 private:
  struct Stream {
    std::vector<events::DomainEvent> events;
    std::vector<Milestone> milestones;
  };

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Stream> streams_;
  std::unordered_set<std::string> recorded_ids_;
};

}  // namespace shiptrack
