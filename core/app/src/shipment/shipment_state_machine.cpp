#include "shiptrack/shipment/shipment_state_machine.hpp"

#include "shiptrack/common/error.hpp"

#include <algorithm>
#include <set>

namespace shiptrack {

using domain::Shipment;
using domain::ShipmentStatus;

namespace {

constexpr ShipmentStatus kAllStatuses[] = {
    ShipmentStatus::Created,    ShipmentStatus::Confirmed,
    ShipmentStatus::Dispatched, ShipmentStatus::InTransit,
    ShipmentStatus::Exception,  ShipmentStatus::Cancelling,
    ShipmentStatus::Delivered,  ShipmentStatus::Cancelled,
};

// Audit entry type recorded when a shipment enters `status`.
const char* auditType(ShipmentStatus status) {
  using S = ShipmentStatus;
  switch (status) {
    case S::Created:    return "CREATED";
    case S::Confirmed:  return "CONFIRMED";
    case S::Dispatched: return "DISPATCHED";
    case S::InTransit:  return "IN_TRANSIT";
    case S::Exception:  return "EXCEPTION";
    case S::Cancelling: return "CANCELLING";
    case S::Delivered:  return "DELIVERED";
    case S::Cancelled:  return "CANCELLED";
  }
  return "STATUS_CHANGED";
}

std::string statusChangeText(ShipmentStatus from, ShipmentStatus to) {
  return std::string("Status changed from ") + domain::shipmentStatusToString(from) +
         " to " + domain::shipmentStatusToString(to);
}

}  // namespace

ShipmentStateMachine::ShipmentStateMachine(const ITimeProvider& time,
                                           IdGenerator& event_ids,
                                           IdGenerator& shipment_ids)
    : time_(time), event_ids_(event_ids), shipment_ids_(shipment_ids) {}

// -----------------------------------------------------------------------------
// Transition table
// -----------------------------------------------------------------------------
bool ShipmentStateMachine::isValidTransition(ShipmentStatus from,
                                             ShipmentStatus to) {
  using S = ShipmentStatus;
  switch (from) {
    case S::Created:
      return to == S::Confirmed || to == S::Cancelled || to == S::Cancelling;
    case S::Confirmed:
      return to == S::Dispatched || to == S::Cancelled || to == S::Cancelling;
    case S::Dispatched:
      return to == S::InTransit || to == S::Cancelled || to == S::Cancelling;
    case S::InTransit:
      return to == S::Delivered || to == S::Cancelled || to == S::Exception ||
             to == S::Cancelling;
    case S::Exception:
      return to == S::InTransit || to == S::Cancelled || to == S::Cancelling;
    case S::Cancelling:
      return to == S::Cancelled;
    case S::Delivered:
    case S::Cancelled:
      return false;
  }
  return false;
}

std::vector<ShipmentStatus> ShipmentStateMachine::allowedTransitions(
    ShipmentStatus from) {
  std::vector<ShipmentStatus> result;
  for (ShipmentStatus to : kAllStatuses) {
    if (isValidTransition(from, to)) {
      result.push_back(to);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// create()
// -----------------------------------------------------------------------------
TransitionResult ShipmentStateMachine::create(const ShipmentDraft& draft) const {
  if (draft.shipment_number.empty()) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "shipment number must not be empty");
  }
  if (!(draft.planned_delivery > draft.planned_pickup)) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "planned delivery " + formatIso8601(draft.planned_delivery) +
                            " must be after planned pickup " +
                            formatIso8601(draft.planned_pickup));
  }
  if (draft.origin == draft.destination) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "origin and destination must differ");
  }

  std::set<int> sequences;
  for (const auto& stop : draft.stops) {
    if (!sequences.insert(stop.sequence).second) {
      throw TrackingError(ErrorCode::InvalidArgument,
                          "duplicate stop sequence " + std::to_string(stop.sequence));
    }
  }

  const Timestamp created = now();

  Shipment shipment;
  shipment.id = shipment_ids_.next_id();
  shipment.shipment_number = draft.shipment_number;
  shipment.customer_id = draft.customer_id;
  shipment.carrier_id = draft.carrier_id;
  shipment.status = ShipmentStatus::Created;
  shipment.mode = draft.mode;
  shipment.origin = draft.origin;
  shipment.destination = draft.destination;
  shipment.planned_pickup = draft.planned_pickup;
  shipment.planned_delivery = draft.planned_delivery;
  shipment.weight_kg = draft.weight_kg;
  shipment.piece_count = draft.piece_count;
  shipment.hazmat = draft.hazmat;
  shipment.reference_number = draft.reference_number;
  shipment.tags = draft.tags;
  shipment.stops = draft.stops;
  std::sort(shipment.stops.begin(), shipment.stops.end(),
            [](const domain::Stop& a, const domain::Stop& b) {
              return a.sequence < b.sequence;
            });
  shipment.created_at = created;
  shipment.updated_at = created;
  shipment.version = 0;
  shipment.events.push_back(domain::ShipmentEvent{
      auditType(ShipmentStatus::Created), created,
      "Shipment " + draft.shipment_number + " created", "system"});

  TransitionResult result;
  result.events.push_back(makeEvent(
      shipment, events::ShipmentCreated{shipment.shipment_number,
                                        shipment.customer_id, shipment.mode,
                                        shipment.origin.city,
                                        shipment.destination.city,
                                        shipment.planned_pickup,
                                        shipment.planned_delivery}));
  result.shipment = std::move(shipment);
  return result;
}

// -----------------------------------------------------------------------------
// transition(): generic entry point
// -----------------------------------------------------------------------------
TransitionResult ShipmentStateMachine::transition(const Shipment& shipment,
                                                  ShipmentStatus target,
                                                  const std::string& actor,
                                                  const std::string& reason) const {
  using S = ShipmentStatus;
  switch (target) {
    case S::Dispatched:
      return dispatch(shipment, actor);
    case S::Delivered:
      return deliver(shipment, now(), actor);
    case S::Cancelled:
      return cancel(shipment, reason, actor);
    case S::Created:
    case S::Confirmed:
    case S::InTransit:
    case S::Exception:
    case S::Cancelling:
      break;
  }

  checkTransition(shipment, target);

  std::string description = statusChangeText(shipment.status, target);
  if (!reason.empty()) {
    description += ": " + reason;
  }

  Shipment next = touched(shipment, auditType(target), description, actor);
  next.status = target;

  TransitionResult result;
  result.events.push_back(makeEvent(
      shipment, events::ShipmentStatusChanged{shipment.status, target, actor, reason}));
  result.shipment = std::move(next);
  return result;
}

TransitionResult ShipmentStateMachine::confirm(const Shipment& shipment,
                                               const std::string& actor) const {
  return transition(shipment, ShipmentStatus::Confirmed, actor);
}

TransitionResult ShipmentStateMachine::dispatch(const Shipment& shipment,
                                                const std::string& actor) const {
  checkTransition(shipment, ShipmentStatus::Dispatched);
  if (shipment.stops.empty()) {
    throw TrackingError(ErrorCode::PreconditionFailed,
                        "shipment " + shipment.id + " cannot be dispatched without stops");
  }

  const Timestamp pickup = now();
  Shipment next = touched(shipment, auditType(ShipmentStatus::Dispatched),
                          statusChangeText(shipment.status, ShipmentStatus::Dispatched),
                          actor);
  next.status = ShipmentStatus::Dispatched;
  next.actual_pickup = pickup;

  TransitionResult result;
  result.events.push_back(makeEvent(
      shipment, events::ShipmentDispatched{shipment.shipment_number, pickup,
                                           shipment.stops.size()}));
  result.shipment = std::move(next);
  return result;
}

TransitionResult ShipmentStateMachine::startTransit(const Shipment& shipment,
                                                    const std::string& actor) const {
  return transition(shipment, ShipmentStatus::InTransit, actor);
}

TransitionResult ShipmentStateMachine::deliver(const Shipment& shipment,
                                               Timestamp delivery_time,
                                               const std::string& actor) const {
  checkTransition(shipment, ShipmentStatus::Delivered);
  if (shipment.actual_pickup.has_value() && delivery_time < *shipment.actual_pickup) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "delivery time " + formatIso8601(delivery_time) +
                            " precedes actual pickup " +
                            formatIso8601(*shipment.actual_pickup));
  }

  Shipment next = touched(shipment, auditType(ShipmentStatus::Delivered),
                          "Shipment delivered", actor);
  next.status = ShipmentStatus::Delivered;
  next.actual_delivery = delivery_time;

  TransitionResult result;
  result.events.push_back(makeEvent(
      shipment, events::ShipmentDelivered{shipment.shipment_number, delivery_time}));
  result.shipment = std::move(next);
  return result;
}

TransitionResult ShipmentStateMachine::reportException(
    const Shipment& shipment, const std::string& exception_type,
    const std::string& description, const std::string& actor) const {
  return transition(shipment, ShipmentStatus::Exception, actor,
                    exception_type + ": " + description);
}

TransitionResult ShipmentStateMachine::resumeTransit(const Shipment& shipment,
                                                     const std::string& actor) const {
  // Terminal sources and every pair the table rejects fail inside
  // transition() exactly as the generic entry point does. Dispatched ->
  // InTransit is a valid pair but it is startTransit(), not a resume.
  if (shipment.status == ShipmentStatus::Dispatched) {
    throw TrackingError(ErrorCode::InvalidTransition,
                        "only a shipment in Exception can resume transit, shipment " +
                            shipment.id + " is Dispatched");
  }
  return transition(shipment, ShipmentStatus::InTransit, actor, "resumed");
}

TransitionResult ShipmentStateMachine::cancel(const Shipment& shipment,
                                              const std::string& reason,
                                              const std::string& actor) const {
  checkTransition(shipment, ShipmentStatus::Cancelled);

  std::string description = "Shipment cancelled";
  if (!reason.empty()) {
    description += ": " + reason;
  }
  Shipment next = touched(shipment, auditType(ShipmentStatus::Cancelled),
                          description, actor);
  next.status = ShipmentStatus::Cancelled;

  TransitionResult result;
  result.events.push_back(makeEvent(
      shipment, events::ShipmentCancelled{shipment.status, reason, actor}));
  result.shipment = std::move(next);
  return result;
}

TransitionResult ShipmentStateMachine::beginCancellation(
    const Shipment& shipment, const std::string& reason,
    const std::string& actor) const {
  return transition(shipment, ShipmentStatus::Cancelling, actor, reason);
}

TransitionResult ShipmentStateMachine::revertCancellation(
    const Shipment& shipment, ShipmentStatus prior, const std::string& actor) const {
  checkMutable(shipment, "revert cancellation");
  if (shipment.status != ShipmentStatus::Cancelling) {
    throw TrackingError(ErrorCode::InvalidState,
                        "shipment " + shipment.id + " is not being cancelled");
  }
  if (domain::isTerminal(prior) || prior == ShipmentStatus::Cancelling) {
    throw TrackingError(ErrorCode::InvalidState,
                        std::string("cannot revert cancellation to ") +
                            domain::shipmentStatusToString(prior));
  }

  Shipment next = touched(shipment, "CANCELLATION_REVERTED",
                          statusChangeText(shipment.status, prior), actor);
  next.status = prior;

  TransitionResult result;
  result.events.push_back(makeEvent(
      shipment, events::ShipmentStatusChanged{shipment.status, prior, actor,
                                              "cancellation reverted"}));
  result.shipment = std::move(next);
  return result;
}

// -----------------------------------------------------------------------------
// Stops and ETA
// -----------------------------------------------------------------------------
TransitionResult ShipmentStateMachine::addStop(const Shipment& shipment,
                                               const domain::Stop& stop) const {
  checkMutable(shipment, "add a stop to");
  if (shipment.findStop(stop.sequence) != nullptr) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "stop sequence " + std::to_string(stop.sequence) +
                            " already exists on shipment " + shipment.id);
  }

  Shipment next = touched(shipment, "STOP_ADDED",
                          "Stop " + std::to_string(stop.sequence) + " added", "system");
  auto pos = std::upper_bound(next.stops.begin(), next.stops.end(), stop,
                              [](const domain::Stop& a, const domain::Stop& b) {
                                return a.sequence < b.sequence;
                              });
  next.stops.insert(pos, stop);

  TransitionResult result;
  result.events.push_back(
      makeEvent(shipment, events::StopAdded{stop.sequence, stop.type}));
  result.shipment = std::move(next);
  return result;
}

TransitionResult ShipmentStateMachine::arriveAtStop(const Shipment& shipment,
                                                    int sequence,
                                                    Timestamp arrived_at,
                                                    const std::string& geofence_id) const {
  checkMutable(shipment, "record a stop arrival on");
  const domain::Stop* stop = shipment.findStop(sequence);
  if (stop == nullptr) {
    throw TrackingError(ErrorCode::NotFound,
                        "stop " + std::to_string(sequence) + " not found on shipment " +
                            shipment.id);
  }
  if (stop->status != domain::StopStatus::Pending &&
      stop->status != domain::StopStatus::Approaching) {
    throw TrackingError(ErrorCode::InvalidState,
                        "stop " + std::to_string(sequence) + " is already " +
                            domain::stopStatusToString(stop->status));
  }

  Shipment next = touched(shipment, "STOP_ARRIVED",
                          "Arrived at stop " + std::to_string(sequence), "system");
  domain::Stop* arrived = next.findStop(sequence);
  arrived->status = domain::StopStatus::Arrived;
  arrived->actual_arrival = arrived_at;

  TransitionResult result;
  result.events.push_back(
      makeEvent(shipment, events::StopArrived{sequence, arrived_at, geofence_id}));
  result.shipment = std::move(next);
  return result;
}

TransitionResult ShipmentStateMachine::updateEstimatedDelivery(
    const Shipment& shipment, Timestamp eta) const {
  checkMutable(shipment, "update the ETA of");
  if (eta < now()) {
    throw TrackingError(ErrorCode::InvalidArgument,
                        "estimated delivery " + formatIso8601(eta) + " is in the past");
  }

  Shipment next = touched(shipment, "ETA_UPDATED",
                          "Estimated delivery set to " + formatIso8601(eta), "system");
  next.estimated_delivery = eta;

  TransitionResult result;
  result.events.push_back(makeEvent(
      shipment, events::ShipmentEtaUpdated{shipment.estimated_delivery, eta}));
  result.shipment = std::move(next);
  return result;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
Timestamp ShipmentStateMachine::now() const {
  return ms_to_timestamp(time_.now_ms());
}

Shipment ShipmentStateMachine::touched(const Shipment& shipment,
                                       const std::string& event_type,
                                       const std::string& description,
                                       const std::string& actor) const {
  Shipment next = shipment;
  const Timestamp at = now();
  next.updated_at = at;
  next.events.push_back(domain::ShipmentEvent{event_type, at, description, actor});
  return next;
}

events::DomainEvent ShipmentStateMachine::makeEvent(const Shipment& shipment,
                                                    events::EventPayload payload) const {
  events::DomainEvent event;
  event.event_id = event_ids_.next_id();
  event.timestamp = now();
  event.aggregate_id = shipment.id;
  event.version = shipment.version + 1;
  event.payload = std::move(payload);
  return event;
}

void ShipmentStateMachine::checkTransition(const Shipment& shipment,
                                           ShipmentStatus target) {
  if (domain::isTerminal(shipment.status)) {
    throw TrackingError(ErrorCode::InvalidState,
                        "shipment " + shipment.id + " is " +
                            domain::shipmentStatusToString(shipment.status) +
                            " and cannot change status");
  }
  if (!isValidTransition(shipment.status, target)) {
    throw TrackingError(ErrorCode::InvalidTransition,
                        std::string("cannot transition from ") +
                            domain::shipmentStatusToString(shipment.status) + " to " +
                            domain::shipmentStatusToString(target));
  }
}

void ShipmentStateMachine::checkMutable(const Shipment& shipment,
                                        const char* operation) {
  if (domain::isTerminal(shipment.status)) {
    throw TrackingError(ErrorCode::InvalidState,
                        std::string("cannot ") + operation + " a " +
                            domain::shipmentStatusToString(shipment.status) +
                            " shipment");
  }
}

}  // namespace shiptrack
