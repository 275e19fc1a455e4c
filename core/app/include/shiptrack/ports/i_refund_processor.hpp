#pragma once

#include <string>

namespace shiptrack {

// Billing collaborator used by the cancellation saga's conditional refund
// step. reverseRefund undoes a processRefund for the same shipment.
class IRefundProcessor {
 public:
  virtual ~IRefundProcessor() = default;

  virtual void processRefund(const std::string& shipment_id) = 0;
  virtual void reverseRefund(const std::string& shipment_id) = 0;
};

}  // namespace shiptrack
