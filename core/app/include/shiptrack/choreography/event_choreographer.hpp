#pragma once

#include "shiptrack/eventbus/event_bus.hpp"
#include "shiptrack/events/domain_event.hpp"
#include "shiptrack/ports/i_domain_event_publisher.hpp"
#include "shiptrack/ports/i_event_stream_recorder.hpp"
#include "shiptrack/ports/i_event_transport.hpp"
#include "shiptrack/ports/i_geofence_repository.hpp"
#include "shiptrack/ports/i_notification_dispatcher.hpp"
#include "shiptrack/ports/i_shipment_context.hpp"
#include "shiptrack/ports/i_tracking_session_manager.hpp"

#include <functional>
#include <string>

namespace shiptrack {

// -----------------------------------------------------------------------------
// EventChoreographer — fixed cross-context routing
// -----------------------------------------------------------------------------
//
// @brief  Delivers each committed domain event to the contexts that react to
//         it, then to in-process observers and the outbound transport.
//
// @details
// Subscription table (fixed at compile time, one std::visit arm per kind):
//
//   ShipmentCreated     tracking.initialize, event-stream.initialize,
//                       event-stream.record, notification.confirmation
//   LocationUpdated     shipment.update-eta, event-stream.record
//   GeofenceEntered     event-stream.record, shipment.stop-arrival
//                       and, when a stop inside the fence arrived:
//                       event-stream.milestone, notification.arrival-alert
//   ShipmentCancelled   tracking.stop, event-stream.record,
//                       notification.cancellation-notice
//                       (record only when cancelled from Cancelling: the
//                       cancellation saga has already stopped tracking and
//                       notified)
//   ShipmentDelivered   tracking.stop, event-stream.record
//   every other kind    event-stream.record
//
// Each delivery runs in its own try/catch. A failing subscriber is logged
// (WARNING) and listed in the DeliveryReport; it never prevents delivery to
// the next one and is never retried here.
//
// After the table the event goes to EventBus observers and to the transport
// (topic from EventCodec::topicFor, key = aggregate id). Transport refusals
// and exceptions are logged and reported; the mutation that produced the
// event stays committed.
//
// publish() holds no lock, so a subscriber may publish further events (a stop
// arrival published while a GeofenceEntered is being routed).
//
// Ownership: borrows every collaborator. connect() must be called once before
// the first publish, because the shipment context and the tracker both
// publish through this object.
// -----------------------------------------------------------------------------
class EventChoreographer final : public IDomainEventPublisher {
 public:
  EventChoreographer(const IGeofenceRepository& geofences,
                     IEventStreamRecorder& stream,
                     INotificationDispatcher& notifications, EventBus& bus,
                     IEventTransport* transport = nullptr);

  void connect(IShipmentContext& shipments, ITrackingSessionManager& tracking);

  DeliveryReport publish(const events::DomainEvent& event) override;

 private:
  using Action = std::function<void()>;

  // Runs one subscriber with failure isolation. Returns true on success.
  bool deliver(DeliveryReport& report, const events::DomainEvent& event,
               const char* subscriber, const Action& action);

  IShipmentContext& shipments();
  ITrackingSessionManager& tracking();

  void forwardToObservers(DeliveryReport& report, const events::DomainEvent& event);
  void forwardToTransport(DeliveryReport& report, const events::DomainEvent& event);

  const IGeofenceRepository& geofences_;
  IEventStreamRecorder& stream_;
  INotificationDispatcher& notifications_;
  EventBus& bus_;
  IEventTransport* transport_;

  IShipmentContext* shipments_{nullptr};
  ITrackingSessionManager* tracking_{nullptr};
};

}  // namespace shiptrack
