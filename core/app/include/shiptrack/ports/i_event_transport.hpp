#pragma once

#include "shiptrack/events/domain_event.hpp"

#include <string>

namespace shiptrack {

// Acknowledgement from the transport. accepted == false means the event was
// refused (for example the transport is stopped); detail says why.
struct DeliveryAck {
  bool accepted{false};
  std::string detail;
};

// -----------------------------------------------------------------------------
// IEventTransport
// -----------------------------------------------------------------------------
// Outbound broker for committed domain events. partition_key is the
// aggregate id; a transport must preserve order within one key.
// publish() may also throw; EventChoreographer logs either kind of failure and
// never rolls back the mutation that produced the event.
// -----------------------------------------------------------------------------
class IEventTransport {
 public:
  virtual ~IEventTransport() = default;

  virtual DeliveryAck publish(const std::string& topic,
                              const std::string& partition_key,
                              const events::DomainEvent& event) = 0;
};

}  // namespace shiptrack
