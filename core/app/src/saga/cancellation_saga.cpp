#include "shiptrack/saga/cancellation_saga.hpp"

#include "shiptrack/common/error.hpp"
#include "shiptrack/domain/shipment_status.hpp"

#include <iostream>

namespace shiptrack {

using domain::SagaOutcome;
using domain::SagaRecord;
using domain::SagaTrigger;
using domain::ShipmentStatus;

CancellationSaga::CancellationSaga(SagaInterpreter& interpreter,
                                   ShipmentService& shipments,
                                   ITrackingSessionManager& tracking,
                                   INotificationDispatcher& notifications)
    : interpreter_(interpreter),
      shipments_(shipments),
      tracking_(tracking),
      notifications_(notifications),
      definition_(buildDefinition()) {}

void CancellationSaga::attachRefundProcessor(IRefundProcessor* refunds) {
  refunds_.store(refunds);
}

IRefundProcessor& CancellationSaga::refunds() {
  IRefundProcessor* refunds = refunds_.load();
  if (refunds == nullptr) {
    throw TrackingError(ErrorCode::PreconditionFailed, "no refund processor attached");
  }
  return *refunds;
}

// -----------------------------------------------------------------------------
// buildDefinition(): the step list
// -----------------------------------------------------------------------------
SagaDefinition CancellationSaga::buildDefinition() {
  SagaDefinition def;
  def.workflow = kWorkflow;

  def.steps.push_back(SagaStep{
      kUpdateStatusCancelling,
      {},
      [this](const SagaTrigger& t) {
        shipments_.beginCancellation(t.shipment_id, t.reason, t.actor);
      },
      [this](const SagaTrigger& t) {
        shipments_.revertCancellation(t.shipment_id, t.prior_status, t.actor);
      }});

  def.steps.push_back(SagaStep{
      kStopTracking,
      {},
      [this](const SagaTrigger& t) { tracking_.stopTracking(t.shipment_id); },
      [this](const SagaTrigger& t) { tracking_.resumeTracking(t.shipment_id); }});

  def.steps.push_back(SagaStep{
      kNotifyStakeholders,
      {},
      [this](const SagaTrigger& t) {
        notifications_.sendCancellationNotice(t.shipment_id, t.reason);
      },
      [this](const SagaTrigger& t) {
        notifications_.sendCancellationReversal(t.shipment_id);
      }});

  def.steps.push_back(SagaStep{
      kProcessRefund,
      [](const SagaTrigger& t) { return t.refund_required; },
      [this](const SagaTrigger& t) { refunds().processRefund(t.shipment_id); },
      [this](const SagaTrigger& t) { refunds().reverseRefund(t.shipment_id); }});

  def.steps.push_back(SagaStep{
      kUpdateStatusCancelled,
      {},
      [this](const SagaTrigger& t) { shipments_.cancel(t.shipment_id, t.reason, t.actor); },
      {},
      true});

  return def;
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
SagaRecord CancellationSaga::cancel(const std::string& shipment_id,
                                    const std::string& reason,
                                    const std::string& actor, bool refund_required) {
  const domain::Shipment shipment = shipments_.get(shipment_id);
  if (domain::isTerminal(shipment.status)) {
    throw TrackingError(ErrorCode::InvalidState,
                        "cannot cancel shipment " + shipment.shipment_number + " in " +
                            domain::shipmentStatusToString(shipment.status));
  }
  if (shipment.status == ShipmentStatus::Cancelling) {
    throw TrackingError(ErrorCode::InvalidState, "cancellation already in progress for " +
                                                     shipment.shipment_number);
  }

  SagaTrigger trigger;
  trigger.shipment_id = shipment_id;
  trigger.reason = reason;
  trigger.actor = actor;
  trigger.refund_required = refund_required;
  trigger.prior_status = shipment.status;

  SagaRecord record = interpreter_.run(definition_, trigger);
  if (record.outcome != SagaOutcome::Completed) {
    throw SagaFailedError(std::move(record));
  }

  std::cout << "[" << kWorkflow << "] " << record.saga_id << " cancelled "
            << shipment.shipment_number << "\n";
  return record;
}

std::vector<SagaRecord> CancellationSaga::recoverIncomplete() {
  return interpreter_.recoverIncomplete(definition_);
}

}  // namespace shiptrack
