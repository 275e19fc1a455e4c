#include "shiptrack/shipment/shipment_service.hpp"

#include "shiptrack/common/error.hpp"
#include "shiptrack/geofence/geofence_engine.hpp"

namespace shiptrack {

using domain::Shipment;

ShipmentService::ShipmentService(IShipmentRepository& repository,
                                 const ShipmentStateMachine& machine,
                                 IDomainEventPublisher& publisher)
    : repository_(repository), machine_(machine), publisher_(publisher) {}

void ShipmentService::attachRoutePlanner(IRoutePlanner* planner) {
  planner_.store(planner);
}

// -----------------------------------------------------------------------------
// commit(): save with the loaded version, then publish
// -----------------------------------------------------------------------------
Shipment ShipmentService::commit(const TransitionResult& result) {
  auto saved = repository_.save(result.shipment);
  if (const auto* conflict = std::get_if<VersionConflict>(&saved)) {
    throw TrackingError(ErrorCode::ConcurrentModification,
                        "shipment " + conflict->aggregate_id + " was modified: expected version " +
                            std::to_string(conflict->expected_version) + ", found " +
                            std::to_string(conflict->actual_version) +
                            "; reload and retry");
  }

  for (const auto& event : result.events) {
    publisher_.publish(event);
  }
  return std::get<Shipment>(std::move(saved));
}

template <typename Decide>
Shipment ShipmentService::mutate(const std::string& shipment_id, Decide decide) {
  const Shipment current = get(shipment_id);
  return commit(decide(current));
}

Shipment ShipmentService::createShipment(const ShipmentDraft& draft) {
  if (repository_.findByShipmentNumber(draft.shipment_number).has_value()) {
    throw TrackingError(ErrorCode::AlreadyExists,
                        "shipment number already exists: " + draft.shipment_number);
  }
  return commit(machine_.create(draft));
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
Shipment ShipmentService::get(const std::string& shipment_id) const {
  auto shipment = repository_.findById(shipment_id);
  if (!shipment.has_value()) {
    throw TrackingError(ErrorCode::NotFound, "shipment not found: " + shipment_id);
  }
  return *std::move(shipment);
}

std::optional<Shipment> ShipmentService::find(const std::string& shipment_id) const {
  return repository_.findById(shipment_id);
}

std::optional<Shipment> ShipmentService::findByShipmentNumber(
    const std::string& shipment_number) const {
  return repository_.findByShipmentNumber(shipment_number);
}

// -----------------------------------------------------------------------------
// Status changes
// -----------------------------------------------------------------------------
Shipment ShipmentService::transition(const std::string& shipment_id,
                                     domain::ShipmentStatus target,
                                     const std::string& actor,
                                     const std::string& reason) {
  return mutate(shipment_id, [&](const Shipment& s) {
    return machine_.transition(s, target, actor, reason);
  });
}

Shipment ShipmentService::confirm(const std::string& shipment_id,
                                  const std::string& actor) {
  return mutate(shipment_id, [&](const Shipment& s) { return machine_.confirm(s, actor); });
}

Shipment ShipmentService::dispatch(const std::string& shipment_id,
                                   const std::string& actor) {
  return mutate(shipment_id, [&](const Shipment& s) { return machine_.dispatch(s, actor); });
}

Shipment ShipmentService::startTransit(const std::string& shipment_id,
                                       const std::string& actor) {
  return mutate(shipment_id,
                [&](const Shipment& s) { return machine_.startTransit(s, actor); });
}

Shipment ShipmentService::deliver(const std::string& shipment_id,
                                  Timestamp delivery_time, const std::string& actor) {
  return mutate(shipment_id, [&](const Shipment& s) {
    return machine_.deliver(s, delivery_time, actor);
  });
}

Shipment ShipmentService::reportException(const std::string& shipment_id,
                                          const std::string& exception_type,
                                          const std::string& description,
                                          const std::string& actor) {
  return mutate(shipment_id, [&](const Shipment& s) {
    return machine_.reportException(s, exception_type, description, actor);
  });
}

Shipment ShipmentService::resumeTransit(const std::string& shipment_id,
                                        const std::string& actor) {
  return mutate(shipment_id,
                [&](const Shipment& s) { return machine_.resumeTransit(s, actor); });
}

Shipment ShipmentService::cancel(const std::string& shipment_id,
                                 const std::string& reason, const std::string& actor) {
  return mutate(shipment_id,
                [&](const Shipment& s) { return machine_.cancel(s, reason, actor); });
}

Shipment ShipmentService::beginCancellation(const std::string& shipment_id,
                                            const std::string& reason,
                                            const std::string& actor) {
  return mutate(shipment_id, [&](const Shipment& s) {
    return machine_.beginCancellation(s, reason, actor);
  });
}

Shipment ShipmentService::revertCancellation(const std::string& shipment_id,
                                             domain::ShipmentStatus prior,
                                             const std::string& actor) {
  return mutate(shipment_id, [&](const Shipment& s) {
    return machine_.revertCancellation(s, prior, actor);
  });
}

// -----------------------------------------------------------------------------
// Stops, ETA, delete
// -----------------------------------------------------------------------------
Shipment ShipmentService::addStop(const std::string& shipment_id,
                                  const domain::Stop& stop) {
  return mutate(shipment_id, [&](const Shipment& s) { return machine_.addStop(s, stop); });
}

Shipment ShipmentService::arriveAtStop(const std::string& shipment_id, int sequence,
                                       Timestamp arrived_at) {
  return mutate(shipment_id, [&](const Shipment& s) {
    return machine_.arriveAtStop(s, sequence, arrived_at);
  });
}

Shipment ShipmentService::updateEstimatedDelivery(const std::string& shipment_id,
                                                  Timestamp eta) {
  return mutate(shipment_id, [&](const Shipment& s) {
    return machine_.updateEstimatedDelivery(s, eta);
  });
}

void ShipmentService::deleteShipment(const std::string& shipment_id) {
  if (!repository_.remove(shipment_id)) {
    throw TrackingError(ErrorCode::NotFound, "shipment not found: " + shipment_id);
  }
}

// -----------------------------------------------------------------------------
// IShipmentContext
// -----------------------------------------------------------------------------
void ShipmentService::refreshEstimatedDelivery(const std::string& shipment_id,
                                               const geo::GeoPoint& position,
                                               Timestamp reported_at) {
  IRoutePlanner* planner = planner_.load();
  if (planner == nullptr) {
    return;
  }

  const Shipment current = get(shipment_id);
  if (domain::isTerminal(current.status)) {
    return;
  }

  const auto eta = planner->estimateArrival(current, position, reported_at);
  if (!eta.has_value() || current.estimated_delivery == eta) {
    return;
  }
  commit(machine_.updateEstimatedDelivery(current, *eta));
}

std::optional<int> ShipmentService::markStopArrivedWithin(
    const std::string& shipment_id, const domain::Geofence& fence,
    Timestamp arrived_at) {
  const Shipment current = get(shipment_id);
  if (domain::isTerminal(current.status)) {
    return std::nullopt;
  }

  // Stops are kept ordered by sequence, so the first match is the lowest.
  for (const auto& stop : current.stops) {
    const bool open = stop.status == domain::StopStatus::Pending ||
                      stop.status == domain::StopStatus::Approaching;
    if (open && stop.location.coordinates.has_value() &&
        GeofenceEngine::contains(fence, *stop.location.coordinates)) {
      commit(machine_.arriveAtStop(current, stop.sequence, arrived_at, fence.id));
      return stop.sequence;
    }
  }
  return std::nullopt;
}

}  // namespace shiptrack
