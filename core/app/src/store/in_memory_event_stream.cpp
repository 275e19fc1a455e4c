#include "shiptrack/store/in_memory_event_stream.hpp"

#include <mutex>

namespace shiptrack {

void InMemoryEventStream::initializeStream(const std::string& shipment_id) {
  std::unique_lock lock(mutex_);
  streams_.try_emplace(shipment_id);
}

void InMemoryEventStream::recordEvent(const events::DomainEvent& event) {
  std::unique_lock lock(mutex_);
  if (!recorded_ids_.insert(event.event_id).second) {
    return;
  }
  streams_[event.aggregate_id].events.push_back(event);
}

void InMemoryEventStream::createMilestone(const std::string& shipment_id,
                                          const std::string& milestone,
                                          Timestamp reached_at) {
  std::unique_lock lock(mutex_);
  streams_[shipment_id].milestones.push_back(Milestone{milestone, reached_at});
}

bool InMemoryEventStream::hasStream(const std::string& shipment_id) const {
  std::shared_lock lock(mutex_);
  return streams_.count(shipment_id) != 0;
}

std::vector<events::DomainEvent> InMemoryEventStream::streamFor(
    const std::string& shipment_id) const {
  std::shared_lock lock(mutex_);
  auto it = streams_.find(shipment_id);
  if (it == streams_.end()) {
    return {};
  }
  return it->second.events;
}

std::vector<Milestone> InMemoryEventStream::milestonesFor(
    const std::string& shipment_id) const {
  std::shared_lock lock(mutex_);
  auto it = streams_.find(shipment_id);
  if (it == streams_.end()) {
    return {};
  }
  return it->second.milestones;
}

}  // namespace shiptrack
