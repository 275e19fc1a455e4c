#pragma once

#include "shiptrack/common/id_generator.hpp"
#include "shiptrack/domain/shipment.hpp"
#include "shiptrack/domain/shipment_status.hpp"
#include "shiptrack/events/domain_event.hpp"
#include "shiptrack/time/i_time_provider.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shiptrack {

// Result of every state-machine operation: the new shipment value and the
// domain events the caller must publish once the value is persisted.
struct TransitionResult {
  domain::Shipment shipment;
  std::vector<events::DomainEvent> events;
};

// Input to ShipmentStateMachine::create().
struct ShipmentDraft {
  std::string shipment_number;
  std::string customer_id;
  std::string carrier_id;
  domain::ShipmentMode mode{domain::ShipmentMode::TruckFtl};
  domain::Address origin;
  domain::Address destination;
  Timestamp planned_pickup{};
  Timestamp planned_delivery{};
  std::vector<domain::Stop> stops;
  std::optional<double> weight_kg;
  std::optional<int> piece_count;
  bool hazmat{false};
  std::string reference_number;
  std::vector<std::string> tags;
};

// -----------------------------------------------------------------------------
// ShipmentStateMachine
// -----------------------------------------------------------------------------
//
// @brief  Owns shipment status and every rule that guards a mutation.
//
// @details
// Functional core: each operation takes a Shipment by const reference and
// returns a TransitionResult. The input is never modified, nothing is
// persisted and nothing is published here. On any rule violation the
// operation throws TrackingError and produces nothing.
//
// Every successful operation:
//   - sets updated_at to the clock's now
//   - appends exactly one ShipmentEvent (audit entry)
//   - returns exactly one DomainEvent whose version is shipment.version + 1,
//     the version the repository will assign on save
//
// Check order for status changes:
//   1. terminal source status          → InvalidState
//   2. (from, to) missing from table   → InvalidTransition
//   3. operation-specific precondition → PreconditionFailed / InvalidArgument
//
// Thread model: stateless apart from the injected clock and id generators.
// Safe to call from any thread.
// -----------------------------------------------------------------------------
class ShipmentStateMachine {
 public:
  ShipmentStateMachine(const ITimeProvider& time, IdGenerator& event_ids,
                       IdGenerator& shipment_ids);

  static bool isValidTransition(domain::ShipmentStatus from,
                                domain::ShipmentStatus to);
  static std::vector<domain::ShipmentStatus> allowedTransitions(
      domain::ShipmentStatus from);

  // -------------------------------------------------------------------------
  // create(draft)
  // -------------------------------------------------------------------------
  // Validates the draft and builds a Created shipment with a fresh id and
  // version 0. Rejects with InvalidArgument: empty shipment number,
  // planned_delivery not strictly after planned_pickup, origin equal to
  // destination, duplicate stop sequence numbers.
  // Shipment-number uniqueness is checked by the repository on insert.
  // -------------------------------------------------------------------------
  TransitionResult create(const ShipmentDraft& draft) const;

  // -------------------------------------------------------------------------
  // transition(shipment, target, actor, reason)
  // -------------------------------------------------------------------------
  // Generic status change. Targets with extra semantics behave exactly like
  // their named operation: Dispatched like dispatch(), Delivered like
  // deliver(now), Cancelled like cancel(). Event kind follows the target:
  //   Dispatched → ShipmentDispatched
  //   Delivered  → ShipmentDelivered
  //   Cancelled  → ShipmentCancelled
  //   otherwise  → ShipmentStatusChanged
  // -------------------------------------------------------------------------
  TransitionResult transition(const domain::Shipment& shipment,
                              domain::ShipmentStatus target,
                              const std::string& actor,
                              const std::string& reason = {}) const;

  TransitionResult confirm(const domain::Shipment& shipment,
                           const std::string& actor) const;

  // Requires at least one stop (PreconditionFailed). Records actual_pickup.
  TransitionResult dispatch(const domain::Shipment& shipment,
                            const std::string& actor) const;

  TransitionResult startTransit(const domain::Shipment& shipment,
                                const std::string& actor) const;

  // Requires delivery_time >= actual_pickup when a pickup was recorded
  // (InvalidArgument). Records actual_delivery.
  TransitionResult deliver(const domain::Shipment& shipment,
                           Timestamp delivery_time,
                           const std::string& actor) const;

  TransitionResult reportException(const domain::Shipment& shipment,
                                   const std::string& exception_type,
                                   const std::string& description,
                                   const std::string& actor) const;

  // Exception -> InTransit. Any other source fails with the code the generic
  // transition() gives for it (InvalidState when terminal, InvalidTransition
  // otherwise, Dispatched included).
  TransitionResult resumeTransit(const domain::Shipment& shipment,
                                 const std::string& actor) const;

  // Direct cancellation, without the saga.
  TransitionResult cancel(const domain::Shipment& shipment,
                          const std::string& reason,
                          const std::string& actor) const;

  // -------------------------------------------------------------------------
  // Saga-facing operations
  // -------------------------------------------------------------------------
  // beginCancellation moves a non-terminal shipment to Cancelling.
  // revertCancellation moves a Cancelling shipment back to `prior`, which
  // must be a non-terminal status other than Cancelling (InvalidState
  // otherwise). It is not part of the transition table.
  // Completing a cancellation is cancel() from Cancelling.
  // -------------------------------------------------------------------------
  TransitionResult beginCancellation(const domain::Shipment& shipment,
                                     const std::string& reason,
                                     const std::string& actor) const;
  TransitionResult revertCancellation(const domain::Shipment& shipment,
                                      domain::ShipmentStatus prior,
                                      const std::string& actor) const;

  // -------------------------------------------------------------------------
  // Stops and ETA
  // -------------------------------------------------------------------------
  // addStop:      InvalidState on a terminal shipment, InvalidArgument on a
  //               duplicate sequence. Stops are kept ordered by sequence.
  // arriveAtStop: InvalidState on a terminal shipment or when the stop is not
  //               Pending/Approaching, NotFound for an unknown sequence.
  // updateEstimatedDelivery: InvalidState on a terminal shipment,
  //               InvalidArgument when eta is before now.
  // -------------------------------------------------------------------------
  TransitionResult addStop(const domain::Shipment& shipment,
                           const domain::Stop& stop) const;
  TransitionResult arriveAtStop(const domain::Shipment& shipment, int sequence,
                                Timestamp arrived_at,
                                const std::string& geofence_id = {}) const;
  TransitionResult updateEstimatedDelivery(const domain::Shipment& shipment,
                                           Timestamp eta) const;

 private:
  Timestamp now() const;

  // Copy of `shipment` with updated_at = now and one audit entry appended.
  domain::Shipment touched(const domain::Shipment& shipment,
                           const std::string& event_type,
                           const std::string& description,
                           const std::string& actor) const;

  events::DomainEvent makeEvent(const domain::Shipment& shipment,
                                events::EventPayload payload) const;

  // Throws InvalidState / InvalidTransition as described above.
  static void checkTransition(const domain::Shipment& shipment,
                              domain::ShipmentStatus target);
  static void checkMutable(const domain::Shipment& shipment,
                           const char* operation);

  const ITimeProvider& time_;
  IdGenerator& event_ids_;
  IdGenerator& shipment_ids_;
};

}  // namespace shiptrack
