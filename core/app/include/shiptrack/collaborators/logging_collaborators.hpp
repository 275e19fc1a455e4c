#pragma once

#include "shiptrack/ports/i_notification_dispatcher.hpp"
#include "shiptrack/ports/i_refund_processor.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace shiptrack {

// -----------------------------------------------------------------------------
// Logging collaborators
// -----------------------------------------------------------------------------
// Default notification and billing contexts for TrackingEngine when the host
// attaches none. Each call writes one line to stdout and bumps a counter;
// nothing is delivered anywhere.
// -----------------------------------------------------------------------------
class LoggingNotificationDispatcher final : public INotificationDispatcher {
 public:
  void sendConfirmation(const std::string& shipment_id,
                        const std::string& shipment_number) override;
  void sendArrivalAlert(const std::string& shipment_id, int stop_sequence) override;
  void sendCancellationNotice(const std::string& shipment_id,
                              const std::string& reason) override;
  void sendCancellationReversal(const std::string& shipment_id) override;

  std::uint64_t sentCount() const { return sent_.load(); }

 private:
  std::atomic<std::uint64_t> sent_{0};
};

class LoggingRefundProcessor final : public IRefundProcessor {
 public:
  void processRefund(const std::string& shipment_id) override;
  void reverseRefund(const std::string& shipment_id) override;

  std::uint64_t refundCount() const { return refunds_.load(); }

 private:
  std::atomic<std::uint64_t> refunds_{0};
};

}  // namespace shiptrack
