#include "shiptrack/engine/tracking_engine.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace shiptrack {

namespace {

std::unique_ptr<ZmqEventTransport> makeZmqTransport(const TrackingConfig& config,
                                                    const EngineCollaborators& c) {
  if (c.transport != nullptr || config.transport_endpoint.empty()) {
    return nullptr;
  }
  return std::make_unique<ZmqEventTransport>(config.transport_endpoint);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build and wire every context
// -----------------------------------------------------------------------------
TrackingEngine::TrackingEngine(const ITimeProvider& time, TrackingConfig config,
                               EngineCollaborators collaborators)
    : time_(time),
      config_(std::move(config)),
      notifications_(collaborators.notifications != nullptr
                         ? *collaborators.notifications
                         : logging_notifications_),
      zmq_transport_(makeZmqTransport(config_, collaborators)),
      transport_(collaborators.transport != nullptr ? collaborators.transport
                                                    : zmq_transport_.get()),
      machine_(time_, event_ids_, shipment_ids_),
      geofence_engine_(geofence_repository_, time_, geofence_ids_),
      choreographer_(geofence_repository_, event_stream_, notifications_, bus_,
                     transport_),
      shipment_service_(shipment_repository_, machine_, choreographer_),
      tracker_(location_repository_, geofence_engine_, choreographer_, time_,
               location_ids_, event_ids_, config_),
      saga_interpreter_(saga_store_, time_, saga_ids_,
                        std::chrono::milliseconds(config_.saga_step_timeout_ms)),
      cancellation_saga_(saga_interpreter_, shipment_service_, tracker_,
                         notifications_) {
  // ---  1) Close the publish cycle -----------------------------------------
  choreographer_.connect(shipment_service_, tracker_);

  // ---  2) Nearest-stop correlation reads the shipment context --------------
  tracker_.attachStopLookup([this](const std::string& shipment_id) {
    auto found = shipment_service_.find(shipment_id);
    return found.has_value() ? found->stops : std::vector<domain::Stop>{};
  });

  // ---  3) Optional collaborators -------------------------------------------
  shipment_service_.attachRoutePlanner(collaborators.route_planner);
  tracker_.attachGeocoder(collaborators.geocoder);
  cancellation_saga_.attachRefundProcessor(collaborators.refunds != nullptr
                                               ? collaborators.refunds
                                               : &logging_refunds_);
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TrackingEngine::~TrackingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TrackingEngine::start() {
  if (running_) {
    return;
  }

  if (zmq_transport_) {
    zmq_transport_->start();
  }

  const auto recovered = cancellation_saga_.recoverIncomplete();
  if (!recovered.empty()) {
    std::cout << "[TrackingEngine] compensated " << recovered.size()
              << " interrupted cancellation(s).\n";
  }

  running_ = true;
  std::cout << "[TrackingEngine] started. Transport: "
            << (zmq_transport_ ? config_.transport_endpoint
                               : (transport_ != nullptr ? "attached" : "none"))
            << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TrackingEngine::stop() {
  if (!running_) {
    return;
  }

  if (zmq_transport_) {
    zmq_transport_->stop();
  }

  running_ = false;
  std::cout << "[TrackingEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// Facade
// -----------------------------------------------------------------------------
domain::Shipment TrackingEngine::createShipment(const ShipmentDraft& draft) {
  return shipment_service_.createShipment(draft);
}

domain::Shipment TrackingEngine::shipment(const std::string& shipment_id) const {
  return shipment_service_.get(shipment_id);
}

domain::Shipment TrackingEngine::transition(const std::string& shipment_id,
                                            domain::ShipmentStatus target,
                                            const std::string& actor,
                                            const std::string& reason) {
  return shipment_service_.transition(shipment_id, target, actor, reason);
}

domain::SagaRecord TrackingEngine::cancelShipment(const std::string& shipment_id,
                                                  const std::string& reason,
                                                  const std::string& actor,
                                                  bool refund_required) {
  return cancellation_saga_.cancel(shipment_id, reason, actor, refund_required);
}

domain::Location TrackingEngine::reportLocation(const std::string& shipment_id,
                                                const std::string& device_id,
                                                double latitude, double longitude,
                                                Timestamp timestamp,
                                                const domain::LocationReadings& readings) {
  return tracker_.update(shipment_id, device_id, latitude, longitude, timestamp,
                         readings);
}

domain::Geofence TrackingEngine::registerGeofence(domain::Geofence fence) {
  return geofence_engine_.registerGeofence(std::move(fence));
}

}  // namespace shiptrack
