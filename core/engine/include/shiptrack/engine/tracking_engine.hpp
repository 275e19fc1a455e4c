#pragma once

#include "shiptrack/choreography/event_choreographer.hpp"
#include "shiptrack/collaborators/logging_collaborators.hpp"
#include "shiptrack/common/id_generator.hpp"
#include "shiptrack/config/tracking_config.hpp"
#include "shiptrack/domain/geofence.hpp"
#include "shiptrack/domain/location.hpp"
#include "shiptrack/domain/saga_record.hpp"
#include "shiptrack/domain/shipment.hpp"
#include "shiptrack/eventbus/event_bus.hpp"
#include "shiptrack/geofence/geofence_engine.hpp"
#include "shiptrack/location/location_tracker.hpp"
#include "shiptrack/ports/i_event_transport.hpp"
#include "shiptrack/ports/i_geocoder.hpp"
#include "shiptrack/ports/i_notification_dispatcher.hpp"
#include "shiptrack/ports/i_refund_processor.hpp"
#include "shiptrack/ports/i_route_planner.hpp"
#include "shiptrack/saga/cancellation_saga.hpp"
#include "shiptrack/saga/saga_interpreter.hpp"
#include "shiptrack/shipment/shipment_service.hpp"
#include "shiptrack/shipment/shipment_state_machine.hpp"
#include "shiptrack/store/in_memory_event_stream.hpp"
#include "shiptrack/store/in_memory_geofence_repository.hpp"
#include "shiptrack/store/in_memory_location_repository.hpp"
#include "shiptrack/store/in_memory_saga_store.hpp"
#include "shiptrack/store/in_memory_shipment_repository.hpp"
#include "shiptrack/time/i_time_provider.hpp"
#include "shiptrack/transport/zmq_event_transport.hpp"

#include <memory>
#include <string>
#include <vector>

namespace shiptrack {

// External contexts a host may plug in. Every pointer is optional and
// non-owning. Null notifications/refunds fall back to the logging defaults;
// a null transport means the ZeroMQ transport when transport_endpoint is
// configured, and no transport otherwise.
struct EngineCollaborators {
  INotificationDispatcher* notifications{nullptr};
  IRefundProcessor* refunds{nullptr};
  IRoutePlanner* route_planner{nullptr};
  IGeocoder* geocoder{nullptr};
  IEventTransport* transport{nullptr};
};

// -----------------------------------------------------------------------------
// TrackingEngine
// -----------------------------------------------------------------------------
//
// @brief  Composition root: owns the stores, id spaces and every context
//         service, and wires them together.
//
// @details
// Wiring (constructor):
//
//   ShipmentService ──┐                   ┌── LocationTracker (sessions)
//   LocationTracker ──┼─► EventChoreographer ─┼── ShipmentService (ETA, stops)
//                     │                   ├── InMemoryEventStream
//                     │                   ├── notifications
//                     │                   ├── EventBus observers
//                     │                   └── transport
//   CancellationSaga ─► SagaInterpreter ─► InMemorySagaStore
//
// The engine is usable straight after construction. start() brings the
// ZeroMQ transport online and replays compensation for cancellations left
// in flight; stop() takes the transport down. Both are idempotent.
//
// Thread model:
//   Constructed, started and stopped on the caller's thread. Between
//   construction and destruction every facade method may be called from any
//   thread; concurrency control lives in the repositories.
//
// Ownership:
//   TrackingEngine
//    ├── id generators          (value members: evt, loc, shp, saga, geo)
//    ├── in-memory stores       (value members)
//    ├── event bus              (value member)
//    ├── logging collaborators  (value members, used when none attached)
//    ├── zmq transport          (unique_ptr, only when configured)
//    └── context services       (value members, declared after what they
//                                borrow so they are destroyed first)
// The time provider is borrowed and must outlive the engine.
// -----------------------------------------------------------------------------
class TrackingEngine {
 public:
  explicit TrackingEngine(const ITimeProvider& time, TrackingConfig config = {},
                          EngineCollaborators collaborators = {});

  ~TrackingEngine();

  TrackingEngine(const TrackingEngine&) = delete;
  TrackingEngine& operator=(const TrackingEngine&) = delete;
  TrackingEngine(TrackingEngine&&) = delete;
  TrackingEngine& operator=(TrackingEngine&&) = delete;

  void start();
  void stop();
  bool running() const { return running_; }

  // ---  Shipments -----------------------------------------------------------
  domain::Shipment createShipment(const ShipmentDraft& draft);
  domain::Shipment shipment(const std::string& shipment_id) const;
  domain::Shipment transition(const std::string& shipment_id,
                              domain::ShipmentStatus target, const std::string& actor,
                              const std::string& reason = {});

  // Runs the cancellation saga. Throws SagaFailedError when a step failed.
  domain::SagaRecord cancelShipment(const std::string& shipment_id,
                                    const std::string& reason, const std::string& actor,
                                    bool refund_required);

  // ---  Locations -----------------------------------------------------------
  domain::Location reportLocation(const std::string& shipment_id,
                                  const std::string& device_id, double latitude,
                                  double longitude, Timestamp timestamp,
                                  const domain::LocationReadings& readings = {});

  // ---  Geofences -----------------------------------------------------------
  domain::Geofence registerGeofence(domain::Geofence fence);

  // ---  Context services ----------------------------------------------------
  ShipmentService& shipments() { return shipment_service_; }
  LocationTracker& tracker() { return tracker_; }
  GeofenceEngine& geofences() { return geofence_engine_; }
  CancellationSaga& cancellations() { return cancellation_saga_; }
  EventBus& eventBus() { return bus_; }
  const InMemoryEventStream& eventStream() const { return event_stream_; }
  const InMemorySagaStore& sagaStore() const { return saga_store_; }
  const TrackingConfig& config() const { return config_; }

 private:
  const ITimeProvider& time_;
  const TrackingConfig config_;

  IdGenerator event_ids_{"evt"};
  IdGenerator location_ids_{"loc"};
  IdGenerator shipment_ids_{"shp"};
  IdGenerator saga_ids_{"saga"};
  IdGenerator geofence_ids_{"geo"};

  InMemoryShipmentRepository shipment_repository_;
  InMemoryLocationRepository location_repository_;
  InMemoryGeofenceRepository geofence_repository_;
  InMemorySagaStore saga_store_;
  InMemoryEventStream event_stream_;

  EventBus bus_;

  LoggingNotificationDispatcher logging_notifications_;
  LoggingRefundProcessor logging_refunds_;
  INotificationDispatcher& notifications_;

  std::unique_ptr<ZmqEventTransport> zmq_transport_;
  IEventTransport* transport_;

  ShipmentStateMachine machine_;
  GeofenceEngine geofence_engine_;
  EventChoreographer choreographer_;
  ShipmentService shipment_service_;
  LocationTracker tracker_;
  SagaInterpreter saga_interpreter_;
  CancellationSaga cancellation_saga_;

  bool running_{false};
};

}  // namespace shiptrack
