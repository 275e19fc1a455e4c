#pragma once

#include "shiptrack/domain/shipment.hpp"
#include "shiptrack/ports/i_domain_event_publisher.hpp"
#include "shiptrack/ports/i_route_planner.hpp"
#include "shiptrack/ports/i_shipment_context.hpp"
#include "shiptrack/ports/i_shipment_repository.hpp"
#include "shiptrack/shipment/shipment_state_machine.hpp"

#include <atomic>
#include <optional>
#include <string>

namespace shiptrack {

// -----------------------------------------------------------------------------
// ShipmentService — imperative shell around ShipmentStateMachine
// -----------------------------------------------------------------------------
//
// @brief  Load → decide → save → publish for every shipment mutation.
//
// @details
// Each mutating method:
//   1. loads the shipment (NotFound if absent)
//   2. asks ShipmentStateMachine for (new shipment, events)
//   3. saves with the loaded version as the expectation; a VersionConflict
//      becomes TrackingError(ConcurrentModification) and nothing is published
//   4. publishes the events, in order, through IDomainEventPublisher
// and returns the saved shipment (version already incremented).
//
// Publication happens strictly after the save. A crash between the two
// loses the events; the stored state stays authoritative.
//
// commit() is public for callers that ran the state machine themselves on a
// snapshot: a stale snapshot fails the same way.
//
// Thread model: no locks of its own. Per-shipment serialisation is the
// repository's version check.
// -----------------------------------------------------------------------------
class ShipmentService final : public IShipmentContext {
 public:
  ShipmentService(IShipmentRepository& repository,
                  const ShipmentStateMachine& machine,
                  IDomainEventPublisher& publisher);

  // Optional. Without a planner refreshEstimatedDelivery() does nothing.
  void attachRoutePlanner(IRoutePlanner* planner);

  domain::Shipment createShipment(const ShipmentDraft& draft);

  domain::Shipment get(const std::string& shipment_id) const;
  std::optional<domain::Shipment> find(const std::string& shipment_id) const;
  std::optional<domain::Shipment> findByShipmentNumber(
      const std::string& shipment_number) const;

  domain::Shipment transition(const std::string& shipment_id,
                              domain::ShipmentStatus target,
                              const std::string& actor,
                              const std::string& reason = {});
  domain::Shipment confirm(const std::string& shipment_id, const std::string& actor);
  domain::Shipment dispatch(const std::string& shipment_id, const std::string& actor);
  domain::Shipment startTransit(const std::string& shipment_id,
                                const std::string& actor);
  domain::Shipment deliver(const std::string& shipment_id, Timestamp delivery_time,
                           const std::string& actor);
  domain::Shipment reportException(const std::string& shipment_id,
                                   const std::string& exception_type,
                                   const std::string& description,
                                   const std::string& actor);
  domain::Shipment resumeTransit(const std::string& shipment_id,
                                 const std::string& actor);
  domain::Shipment cancel(const std::string& shipment_id, const std::string& reason,
                          const std::string& actor);

  domain::Shipment beginCancellation(const std::string& shipment_id,
                                     const std::string& reason,
                                     const std::string& actor);
  domain::Shipment revertCancellation(const std::string& shipment_id,
                                      domain::ShipmentStatus prior,
                                      const std::string& actor);

  domain::Shipment addStop(const std::string& shipment_id, const domain::Stop& stop);
  domain::Shipment arriveAtStop(const std::string& shipment_id, int sequence,
                                Timestamp arrived_at);
  domain::Shipment updateEstimatedDelivery(const std::string& shipment_id,
                                           Timestamp eta);

  // Administrative hard delete. No event is published. NotFound if absent.
  void deleteShipment(const std::string& shipment_id);

  domain::Shipment commit(const TransitionResult& result);

  // IShipmentContext
  void refreshEstimatedDelivery(const std::string& shipment_id,
                                const geo::GeoPoint& position,
                                Timestamp reported_at) override;
  std::optional<int> markStopArrivedWithin(const std::string& shipment_id,
                                           const domain::Geofence& fence,
                                           Timestamp arrived_at) override;

 private:
  template <typename Decide>
  domain::Shipment mutate(const std::string& shipment_id, Decide decide);

  IShipmentRepository& repository_;
  const ShipmentStateMachine& machine_;
  IDomainEventPublisher& publisher_;
  std::atomic<IRoutePlanner*> planner_{nullptr};
};

}  // namespace shiptrack
