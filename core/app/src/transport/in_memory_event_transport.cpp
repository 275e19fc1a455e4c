#include "shiptrack/transport/in_memory_event_transport.hpp"

#include <stdexcept>

namespace shiptrack {

DeliveryAck InMemoryEventTransport::publish(const std::string& topic,
                                            const std::string& partition_key,
                                            const events::DomainEvent& event) {
  std::lock_guard lock(mutex_);
  if (throwing_) {
    throw std::runtime_error("broker unreachable");
  }
  if (refusing_) {
    return DeliveryAck{false, "refused"};
  }
  published_.push_back(PublishedMessage{topic, partition_key, event});
  return DeliveryAck{true, "stored"};
}

void InMemoryEventTransport::setRefusing(bool refusing) {
  std::lock_guard lock(mutex_);
  refusing_ = refusing;
}

void InMemoryEventTransport::setThrowing(bool throwing) {
  std::lock_guard lock(mutex_);
  throwing_ = throwing;
}

std::vector<PublishedMessage> InMemoryEventTransport::published() const {
  std::lock_guard lock(mutex_);
  return published_;
}

std::vector<PublishedMessage> InMemoryEventTransport::publishedOn(
    const std::string& topic) const {
  std::lock_guard lock(mutex_);
  std::vector<PublishedMessage> out;
  for (const auto& message : published_) {
    if (message.topic == topic) {
      out.push_back(message);
    }
  }
  return out;
}

std::size_t InMemoryEventTransport::size() const {
  std::lock_guard lock(mutex_);
  return published_.size();
}

}  // namespace shiptrack
