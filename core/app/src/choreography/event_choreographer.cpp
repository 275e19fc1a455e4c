#include "shiptrack/choreography/event_choreographer.hpp"

#include "shiptrack/common/error.hpp"
#include "shiptrack/serialization/event_codec.hpp"

#include <iostream>

namespace shiptrack {

using events::DomainEvent;

EventChoreographer::EventChoreographer(const IGeofenceRepository& geofences,
                                       IEventStreamRecorder& stream,
                                       INotificationDispatcher& notifications,
                                       EventBus& bus, IEventTransport* transport)
    : geofences_(geofences),
      stream_(stream),
      notifications_(notifications),
      bus_(bus),
      transport_(transport) {}

void EventChoreographer::connect(IShipmentContext& shipments,
                                 ITrackingSessionManager& tracking) {
  shipments_ = &shipments;
  tracking_ = &tracking;
}

IShipmentContext& EventChoreographer::shipments() {
  if (shipments_ == nullptr) {
    throw TrackingError(ErrorCode::PreconditionFailed, "shipment context not connected");
  }
  return *shipments_;
}

ITrackingSessionManager& EventChoreographer::tracking() {
  if (tracking_ == nullptr) {
    throw TrackingError(ErrorCode::PreconditionFailed, "tracking context not connected");
  }
  return *tracking_;
}

// -----------------------------------------------------------------------------
// deliver(): one subscriber, isolated
// -----------------------------------------------------------------------------
bool EventChoreographer::deliver(DeliveryReport& report, const DomainEvent& event,
                                 const char* subscriber, const Action& action) {
  ++report.attempted;
  try {
    action();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[EventChoreographer] WARNING: subscriber " << subscriber
              << " failed for " << events::eventKindName(event.payload) << " "
              << event.event_id << ": " << e.what() << "\n";
    report.failures.push_back(SubscriberFailure{subscriber, e.what()});
    return false;
  }
}

// -----------------------------------------------------------------------------
// publish(): the subscription table
// -----------------------------------------------------------------------------
DeliveryReport EventChoreographer::publish(const DomainEvent& event) {
  DeliveryReport report;
  report.event_id = event.event_id;

  const std::string& shipment_id = event.aggregate_id;
  auto record = [&] {
    deliver(report, event, "event-stream.record", [&] { stream_.recordEvent(event); });
  };

  std::visit(
      events::Overloaded{
          [&](const events::ShipmentCreated& e) {
            deliver(report, event, "tracking.initialize",
                    [&] { tracking().initializeSession(shipment_id); });
            deliver(report, event, "event-stream.initialize",
                    [&] { stream_.initializeStream(shipment_id); });
            record();
            deliver(report, event, "notification.confirmation", [&] {
              notifications_.sendConfirmation(shipment_id, e.shipment_number);
            });
          },
          [&](const events::LocationUpdated& e) {
            deliver(report, event, "shipment.update-eta", [&] {
              shipments().refreshEstimatedDelivery(shipment_id, e.point, e.reported_at);
            });
            record();
          },
          [&](const events::GeofenceEntered& e) {
            record();
            std::optional<int> arrived;
            deliver(report, event, "shipment.stop-arrival", [&] {
              const auto fence = geofences_.findById(e.geofence_id);
              if (!fence.has_value()) {
                throw TrackingError(ErrorCode::NotFound,
                                    "geofence not found: " + e.geofence_id);
              }
              arrived = shipments().markStopArrivedWithin(shipment_id, *fence,
                                                          e.reported_at);
            });
            if (!arrived.has_value()) {
              return;
            }
            const int sequence = *arrived;
            deliver(report, event, "event-stream.milestone", [&] {
              stream_.createMilestone(shipment_id,
                                      "Arrived at stop " + std::to_string(sequence),
                                      e.reported_at);
            });
            deliver(report, event, "notification.arrival-alert",
                    [&] { notifications_.sendArrivalAlert(shipment_id, sequence); });
          },
          [&](const events::ShipmentCancelled& e) {
            if (e.previous == domain::ShipmentStatus::Cancelling) {
              record();
              return;
            }
            deliver(report, event, "tracking.stop",
                    [&] { tracking().stopTracking(shipment_id); });
            record();
            deliver(report, event, "notification.cancellation-notice", [&] {
              notifications_.sendCancellationNotice(shipment_id, e.reason);
            });
          },
          [&](const events::ShipmentDelivered&) {
            deliver(report, event, "tracking.stop",
                    [&] { tracking().stopTracking(shipment_id); });
            record();
          },
          [&](const events::ShipmentDispatched&) { record(); },
          [&](const events::ShipmentStatusChanged&) { record(); },
          [&](const events::StopAdded&) { record(); },
          [&](const events::StopArrived&) { record(); },
          [&](const events::ShipmentEtaUpdated&) { record(); },
          [&](const events::GeofenceExited&) { record(); },
          [&](const events::GeofenceDwelled&) { record(); },
      },
      event.payload);

  forwardToObservers(report, event);
  forwardToTransport(report, event);
  return report;
}

void EventChoreographer::forwardToObservers(DeliveryReport& report,
                                            const DomainEvent& event) {
  if (bus_.subscriberCount() == 0) {
    return;
  }
  deliver(report, event, "event-bus", [&] { bus_.publish(event); });
}

void EventChoreographer::forwardToTransport(DeliveryReport& report,
                                            const DomainEvent& event) {
  if (transport_ == nullptr) {
    return;
  }

  const char* topic = EventCodec::topicFor(event.payload);
  try {
    const DeliveryAck ack = transport_->publish(topic, event.aggregate_id, event);
    report.transport_accepted = ack.accepted;
    if (!ack.accepted) {
      std::cerr << "[EventChoreographer] WARNING: transport refused " << event.event_id
                << " on " << topic << ": " << ack.detail << "\n";
    }
  } catch (const std::exception& e) {
    report.transport_accepted = false;
    std::cerr << "[EventChoreographer] WARNING: transport publish of " << event.event_id
              << " on " << topic << " failed: " << e.what() << "\n";
  }
}

}  // namespace shiptrack
