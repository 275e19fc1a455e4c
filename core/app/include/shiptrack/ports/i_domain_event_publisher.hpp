#pragma once

#include "shiptrack/events/domain_event.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace shiptrack {

struct SubscriberFailure {
  std::string subscriber;
  std::string message;
};

// -----------------------------------------------------------------------------
// DeliveryReport
// -----------------------------------------------------------------------------
// Outcome of publishing one event: how many subscribers were attempted, and
// which of them failed. A failure never stops delivery to the rest.
// transport_accepted is false when the outbound transport refused or threw,
// or when no transport is attached.
// -----------------------------------------------------------------------------
struct DeliveryReport {
  std::string event_id;
  std::size_t attempted{0};
  std::vector<SubscriberFailure> failures;
  bool transport_accepted{false};

  std::size_t succeeded() const { return attempted - failures.size(); }
  bool ok() const { return failures.empty(); }
};

// Anything that mutates an aggregate hands its committed events here.
class IDomainEventPublisher {
 public:
  virtual ~IDomainEventPublisher() = default;

  virtual DeliveryReport publish(const events::DomainEvent& event) = 0;
};

}  // namespace shiptrack
