#pragma once

#include "shiptrack/events/domain_event.hpp"
#include "shiptrack/ports/i_event_transport.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace shiptrack {

// One message as it would have gone on the wire.
struct PublishedMessage {
  std::string topic;
  std::string partition_key;
  events::DomainEvent event;
};

// -----------------------------------------------------------------------------
// InMemoryEventTransport
// -----------------------------------------------------------------------------
// Keeps every accepted message in publish order. setRefusing(true) makes it
// refuse with an ack, setThrowing(true) makes publish() throw; both are used
// to exercise transport failure handling without a broker.
// -----------------------------------------------------------------------------
class InMemoryEventTransport final : public IEventTransport {
 public:
  DeliveryAck publish(const std::string& topic, const std::string& partition_key,
                      const events::DomainEvent& event) override;

  void setRefusing(bool refusing);
  void setThrowing(bool throwing);

  std::vector<PublishedMessage> published() const;
  std::vector<PublishedMessage> publishedOn(const std::string& topic) const;
  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<PublishedMessage> published_;
  bool refusing_{false};
  bool throwing_{false};
};

}  // namespace shiptrack
