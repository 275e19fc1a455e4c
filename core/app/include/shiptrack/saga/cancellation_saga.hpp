#pragma once

#include "shiptrack/domain/saga_record.hpp"
#include "shiptrack/ports/i_notification_dispatcher.hpp"
#include "shiptrack/ports/i_refund_processor.hpp"
#include "shiptrack/ports/i_tracking_session_manager.hpp"
#include "shiptrack/saga/saga_interpreter.hpp"
#include "shiptrack/shipment/shipment_service.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace shiptrack {

// -----------------------------------------------------------------------------
// CancellationSaga — compensating shipment cancellation
// -----------------------------------------------------------------------------
//
// @brief  Cancels a shipment across the shipment, tracking, notification and
//         billing contexts, undoing completed steps if a later one fails.
//
// @details
// Steps, in order, with their compensations:
//
//   UpdateStatusCancelling  status → Cancelling   revert status to prior
//   StopTracking            stop tracking session resume tracking
//   NotifyStakeholders      cancellation notice   cancellation reversal
//   ProcessRefund           refund (only when     reverse refund
//                           refund_required)
//   UpdateStatusCancelled   Cancelling → Cancelled (last step, never undone)
//
// UpdateStatusCancelled is irreversible: if it overruns the step timeout but
// succeeds, the cancellation completes rather than being compensated.
//
// cancel() refuses a terminal shipment with InvalidState, and one that is
// already Cancelling, before any step runs. A failed run throws
// SagaFailedError after compensation; the ledger stays in the saga store.
//
// Without a refund processor a refund_required cancellation fails at
// ProcessRefund with PreconditionFailed and is compensated.
//
// Ownership: borrows every collaborator; owns its SagaDefinition.
// -----------------------------------------------------------------------------
class CancellationSaga {
 public:
  static constexpr const char* kWorkflow = "CancellationSaga";

  static constexpr const char* kUpdateStatusCancelling = "UpdateStatusCancelling";
  static constexpr const char* kStopTracking = "StopTracking";
  static constexpr const char* kNotifyStakeholders = "NotifyStakeholders";
  static constexpr const char* kProcessRefund = "ProcessRefund";
  static constexpr const char* kUpdateStatusCancelled = "UpdateStatusCancelled";

  CancellationSaga(SagaInterpreter& interpreter, ShipmentService& shipments,
                   ITrackingSessionManager& tracking,
                   INotificationDispatcher& notifications);

  CancellationSaga(const CancellationSaga&) = delete;
  CancellationSaga& operator=(const CancellationSaga&) = delete;

  void attachRefundProcessor(IRefundProcessor* refunds);

  // Returns the Completed record.
  domain::SagaRecord cancel(const std::string& shipment_id, const std::string& reason,
                            const std::string& actor, bool refund_required);

  // Compensates cancellations interrupted by a restart.
  std::vector<domain::SagaRecord> recoverIncomplete();

  const SagaDefinition& definition() const { return definition_; }

 private:
  SagaDefinition buildDefinition();
  IRefundProcessor& refunds();

  SagaInterpreter& interpreter_;
  ShipmentService& shipments_;
  ITrackingSessionManager& tracking_;
  INotificationDispatcher& notifications_;
  std::atomic<IRefundProcessor*> refunds_{nullptr};

  const SagaDefinition definition_;
};

}  // namespace shiptrack
