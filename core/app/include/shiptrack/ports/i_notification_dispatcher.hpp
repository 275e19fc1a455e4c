#pragma once

#include <string>

namespace shiptrack {

// Notification context. Fire-and-forget from the caller's side: a method
// either returns or throws, and nothing waits for actual delivery.
class INotificationDispatcher {
 public:
  virtual ~INotificationDispatcher() = default;

  virtual void sendConfirmation(const std::string& shipment_id,
                                const std::string& shipment_number) = 0;
  virtual void sendArrivalAlert(const std::string& shipment_id,
                                int stop_sequence) = 0;
  virtual void sendCancellationNotice(const std::string& shipment_id,
                                      const std::string& reason) = 0;
  virtual void sendCancellationReversal(const std::string& shipment_id) = 0;
};

}  // namespace shiptrack
