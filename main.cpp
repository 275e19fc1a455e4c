// -----------------------------------------------------------------------------
// shiptrack_engine — demo entry point.
//
// Runs two shipments through the engine on a simulated clock:
//   1) SHP-1001 is dispatched to a distribution centre guarded by a 500 m
//      geofence. Position reports drive it into the fence (stop arrival,
//      milestone, arrival alert), keep it there past the dwell threshold and
//      then take it out again.
//   2) SHP-1002 is cancelled through the cancellation saga with a refund.
//
// Every published domain event is printed as its wire JSON via an EventBus
// observer.
//
// Usage: shiptrack_engine [config.json]
//   The optional JSON file overrides TrackingConfig defaults. Setting
//   "transport_endpoint" also publishes every event on a ZeroMQ PUB socket.
// -----------------------------------------------------------------------------

#include "shiptrack/common/error.hpp"
#include "shiptrack/config/tracking_config.hpp"
#include "shiptrack/domain/geofence.hpp"
#include "shiptrack/engine/tracking_engine.hpp"
#include "shiptrack/serialization/event_codec.hpp"
#include "shiptrack/time/live_time_provider.hpp"
#include "shiptrack/time/simulation_time_provider.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

constexpr std::int64_t kMinute = 60 * 1000;

shiptrack::domain::Address makeAddress(const std::string& city,
                                       const std::string& state, double lat,
                                       double lon) {
  shiptrack::domain::Address a;
  a.line1 = "1 Dock Road";
  a.city = city;
  a.state = state;
  a.zip_code = "00000";
  a.country = "US";
  a.coordinates = shiptrack::geo::GeoPoint{lat, lon};
  return a;
}

shiptrack::ShipmentDraft makeDraft(const std::string& number,
                                   shiptrack::Timestamp now) {
  shiptrack::ShipmentDraft draft;
  draft.shipment_number = number;
  draft.customer_id = "CUST-7";
  draft.carrier_id = "CARR-3";
  draft.origin = makeAddress("Philadelphia", "PA", 39.95, -75.16);
  draft.destination = makeAddress("Newark", "NJ", 40.0, -74.0);
  draft.planned_pickup = now + std::chrono::hours(1);
  draft.planned_delivery = now + std::chrono::hours(6);

  shiptrack::domain::Stop pickup;
  pickup.sequence = 1;
  pickup.type = shiptrack::domain::StopType::Pickup;
  pickup.location = draft.origin;
  draft.stops.push_back(pickup);

  shiptrack::domain::Stop delivery;
  delivery.sequence = 2;
  delivery.type = shiptrack::domain::StopType::Delivery;
  delivery.location = draft.destination;
  draft.stops.push_back(delivery);
  return draft;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace shiptrack;

  // -------------------------------------------------------------------------
  // 1) Configuration and clock.
  // -------------------------------------------------------------------------
  TrackingConfig config;
  if (argc > 1) {
    try {
      config = loadTrackingConfig(argv[1]);
    } catch (const TrackingError& e) {
      std::cerr << "[main] ERROR: " << e.what() << "\n";
      return 1;
    }
  }

  LiveTimeProvider wall_clock;
  std::cout << "[main] demo run at "
            << formatIso8601(ms_to_timestamp(wall_clock.now_ms()))
            << ", simulated clock starts 2025-01-01T08:00Z\n";

  SimulationTimeProvider clock(
      timestamp_to_ms(utcTimestamp(2025, 1, 1, 8, 0, 0)));
  auto now = [&clock] { return ms_to_timestamp(clock.now_ms()); };

  // -------------------------------------------------------------------------
  // 2) Engine and event printer.
  // -------------------------------------------------------------------------
  TrackingEngine engine(clock, config);
  engine.eventBus().subscribe([](const events::DomainEvent& e) {
    std::cout << "[Event] " << EventCodec::topicFor(e.payload) << " "
              << EventCodec::toString(e) << "\n";
  });
  engine.start();

  try {
    // -----------------------------------------------------------------------
    // 3) Geofence arrival scenario.
    // -----------------------------------------------------------------------
    auto fence = domain::Geofence::createCircular(
        "", "Newark DC", "CARR-3", geo::GeoPoint{40.0, -74.0}, 500.0);
    fence = engine.registerGeofence(fence);

    auto shipment = engine.createShipment(makeDraft("SHP-1001", now()));
    const std::string id = shipment.id;
    engine.shipments().confirm(id, "dispatcher");
    engine.shipments().dispatch(id, "dispatcher");
    engine.shipments().startTransit(id, "driver");

    domain::LocationReadings moving;
    moving.speed_kmh = 72.0;
    moving.accuracy_m = 8.0;

    clock.advance_by(30 * kMinute);
    engine.reportLocation(id, "dev-1", 40.05, -74.0, now(), moving);

    domain::LocationReadings parked;
    parked.speed_kmh = 0.0;
    parked.accuracy_m = 5.0;

    clock.advance_by(10 * kMinute);
    engine.reportLocation(id, "dev-1", 40.0, -74.0, now(), parked);

    clock.advance_by(20 * kMinute);
    engine.reportLocation(id, "dev-1", 40.0005, -74.0, now(), parked);

    clock.advance_by(5 * kMinute);
    engine.reportLocation(id, "dev-1", 40.01, -74.0, now(), moving);

    const auto after = engine.shipment(id);
    std::cout << "[main] " << after.shipment_number << " status="
              << domain::shipmentStatusToString(after.status) << " version="
              << after.version << "\n";
    for (const auto& stop : after.stops) {
      std::cout << "[main]   stop " << stop.sequence << " "
                << domain::stopStatusToString(stop.status) << "\n";
    }
    for (const auto& m : engine.eventStream().milestonesFor(id)) {
      std::cout << "[main]   milestone \"" << m.name << "\" at "
                << formatIso8601(m.reached_at) << "\n";
    }

    // -----------------------------------------------------------------------
    // 4) Cancellation saga scenario.
    // -----------------------------------------------------------------------
    auto second = engine.createShipment(makeDraft("SHP-1002", now()));
    engine.shipments().confirm(second.id, "dispatcher");
    const auto record = engine.cancelShipment(second.id, "customer request",
                                              "support", true);
    std::cout << "[main] " << record.saga_id << " "
              << domain::sagaOutcomeToString(record.outcome) << " steps:";
    for (const auto& step : record.completed_steps) {
      std::cout << " " << step;
    }
    std::cout << "\n";
  } catch (const TrackingError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    engine.stop();
    return 1;
  }

  engine.stop();
  return 0;
}
