// =============================================================================
// tracking_engine_test.cpp
// =============================================================================
// End-to-end tests through shiptrack::TrackingEngine with recording
// collaborators and the in-memory transport.
//
// Validates:
//   - Creating a shipment opens its tracking session and event stream
//   - A report inside a stop's geofence arrives the stop, records the
//     milestone and alerts, all through the choreographer
//   - ETA refresh via the attached route planner
//   - Saga cancellation notifies once and stops tracking
//   - Direct delivery stops tracking
//   - start() / stop() are idempotent
// =============================================================================

#include "shiptrack/common/error.hpp"
#include "shiptrack/domain/geofence.hpp"
#include "shiptrack/engine/tracking_engine.hpp"
#include "shiptrack/location/location_tracker.hpp"
#include "shiptrack/saga/saga_interpreter.hpp"
#include "shiptrack/time/simulation_time_provider.hpp"
#include "shiptrack/time/time_utils.hpp"
#include "shiptrack/transport/in_memory_event_transport.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>

using shiptrack::ErrorCode;
using shiptrack::TrackingEngine;
using shiptrack::TrackingError;
using shiptrack::TrackingSessionState;
using shiptrack::domain::ShipmentStatus;
using shiptrack::domain::StopStatus;
using shiptrack::domain::StopType;
using shiptrack::geo::GeoPoint;
namespace support = shiptrack::testing_support;

constexpr std::int64_t kMinuteMs = 60 * 1000;

// =============================================================================
// Test fixture: engine on a simulated clock at 2025-01-01T08:00Z with a
// 500 m fence around the Newark delivery stop.
// =============================================================================
class TrackingEngineTest : public ::testing::Test {
 protected:
  shiptrack::SimulationTimeProvider clock{1735718400000};
  support::CallLog log;
  support::FakeNotifications notifications{log};
  support::FakeRefunds refunds{log};
  support::FixedRoutePlanner planner{shiptrack::ms_to_timestamp(1735718400000) +
                                     std::chrono::hours(5)};
  shiptrack::InMemoryEventTransport transport;

  std::unique_ptr<TrackingEngine> engine;
  std::string fence_id;

  void SetUp() override {
    shiptrack::EngineCollaborators c;
    c.notifications = &notifications;
    c.refunds = &refunds;
    c.route_planner = &planner;
    c.transport = &transport;
    engine = std::make_unique<TrackingEngine>(clock, shiptrack::TrackingConfig{}, c);
    engine->start();

    fence_id = engine
                   ->registerGeofence(shiptrack::domain::Geofence::createCircular(
                       "", "Newark DC", "CARR-3", GeoPoint{40.0, -74.0}, 500.0))
                   .id;
  }

  void TearDown() override { engine->stop(); }

  shiptrack::Timestamp now() const { return shiptrack::ms_to_timestamp(clock.now_ms()); }

  std::string createShipment(const std::string& number) {
    shiptrack::ShipmentDraft d;
    d.shipment_number = number;
    d.customer_id = "CUST-7";
    d.carrier_id = "CARR-3";
    d.origin = support::address("Philadelphia", 39.95, -75.16);
    d.destination = support::address("Newark", 40.0, -74.0);
    d.planned_pickup = now() + std::chrono::hours(1);
    d.planned_delivery = now() + std::chrono::hours(6);
    d.stops.push_back(support::stop(1, StopType::Pickup, d.origin));
    d.stops.push_back(support::stop(2, StopType::Delivery, d.destination));
    return engine->createShipment(d).id;
  }

  std::string shipmentInTransit(const std::string& number) {
    const std::string id = createShipment(number);
    engine->shipments().confirm(id, "dispatcher");
    engine->shipments().dispatch(id, "dispatcher");
    engine->shipments().startTransit(id, "driver");
    return id;
  }

  void advanceMinutes(int minutes) { clock.advance_by(minutes * kMinuteMs); }
};

// -----------------------------------------------------------------------------
// 1. Creation fans out to the tracking and event contexts and notifies.
// -----------------------------------------------------------------------------
TEST_F(TrackingEngineTest, CreateOpensSessionAndStream) {
  const std::string id = createShipment("SHP-1001");

  EXPECT_EQ(engine->tracker().sessionState(id), TrackingSessionState::Active);
  EXPECT_TRUE(engine->eventStream().hasStream(id));
  EXPECT_TRUE(log.contains("notify.confirmation:" + id + ":SHP-1001"));
  EXPECT_EQ(transport.publishedOn("shipment.created").size(), 1u);
  EXPECT_TRUE(engine->running());
}

// -----------------------------------------------------------------------------
// 2. Geofence arrival end to end.
// -----------------------------------------------------------------------------
TEST_F(TrackingEngineTest, GeofenceArrivalMarksStopAndMilestone) {
  const std::string id = shipmentInTransit("SHP-1001");

  advanceMinutes(30);
  engine->reportLocation(id, "dev-1", 40.05, -74.0, now());
  EXPECT_EQ(engine->shipment(id).findStop(2)->status, StopStatus::Pending);

  advanceMinutes(10);
  const auto inside = engine->reportLocation(id, "dev-1", 40.0, -74.0, now());
  ASSERT_TRUE(inside.geofence_id.has_value());
  EXPECT_EQ(*inside.geofence_id, fence_id);
  EXPECT_EQ(*inside.nearest_stop_sequence, 2);

  const auto shipment = engine->shipment(id);
  EXPECT_EQ(shipment.findStop(2)->status, StopStatus::Arrived);
  EXPECT_EQ(*shipment.findStop(2)->actual_arrival, now());
  EXPECT_EQ(shipment.findStop(1)->status, StopStatus::Pending);

  const auto milestones = engine->eventStream().milestonesFor(id);
  ASSERT_EQ(milestones.size(), 1u);
  EXPECT_EQ(milestones[0].name, "Arrived at stop 2");
  EXPECT_TRUE(log.contains("notify.arrival:" + id + ":2"));
  EXPECT_EQ(transport.publishedOn("location.geofence.events").size(), 1u);

  // Leaving the fence 25 minutes later reports the dwell.
  advanceMinutes(25);
  engine->reportLocation(id, "dev-1", 40.01, -74.0, now());
  const auto geofence_events = transport.publishedOn("location.geofence.events");
  ASSERT_EQ(geofence_events.size(), 2u);
  const auto* exited =
      std::get_if<shiptrack::events::GeofenceExited>(&geofence_events[1].event.payload);
  ASSERT_NE(exited, nullptr);
  EXPECT_EQ(exited->dwell, std::chrono::minutes(25));
}

// -----------------------------------------------------------------------------
// 3. Location reports refresh the ETA through the planner.
// -----------------------------------------------------------------------------
TEST_F(TrackingEngineTest, LocationRefreshesEta) {
  const std::string id = shipmentInTransit("SHP-1001");

  advanceMinutes(5);
  engine->reportLocation(id, "dev-1", 40.05, -74.0, now());

  const auto shipment = engine->shipment(id);
  ASSERT_TRUE(shipment.estimated_delivery.has_value());
  EXPECT_EQ(*shipment.estimated_delivery,
            shiptrack::ms_to_timestamp(1735718400000) + std::chrono::hours(5));
  EXPECT_EQ(planner.calls, 1);
  EXPECT_EQ(transport.publishedOn("shipment.updated").size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. Saga cancellation: one notice, tracking stopped, one cancelled event.
// -----------------------------------------------------------------------------
TEST_F(TrackingEngineTest, SagaCancellation) {
  const std::string id = createShipment("SHP-1002");
  engine->shipments().confirm(id, "dispatcher");

  const auto record = engine->cancelShipment(id, "customer request", "support", true);

  EXPECT_EQ(record.outcome, shiptrack::domain::SagaOutcome::Completed);
  EXPECT_EQ(engine->shipment(id).status, ShipmentStatus::Cancelled);
  EXPECT_EQ(engine->tracker().sessionState(id), TrackingSessionState::Stopped);
  EXPECT_TRUE(log.contains("refund.process:" + id));

  int notices = 0;
  for (const auto& entry : log.entries()) {
    if (entry.rfind("notify.cancellation:" + id, 0) == 0) {
      ++notices;
    }
  }
  EXPECT_EQ(notices, 1);
  EXPECT_EQ(transport.publishedOn("shipment.cancelled").size(), 1u);
  EXPECT_EQ(engine->sagaStore().find(record.saga_id)->outcome,
            shiptrack::domain::SagaOutcome::Completed);

  try {
    engine->reportLocation(id, "dev-1", 40.0, -74.0, now());
    FAIL() << "expected InvalidState";
  } catch (const TrackingError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidState);
  }
}

// -----------------------------------------------------------------------------
// 5. A failed refund leaves the shipment where it was, tracking resumed.
// -----------------------------------------------------------------------------
TEST_F(TrackingEngineTest, FailedSagaRestoresShipment) {
  const std::string id = shipmentInTransit("SHP-1003");
  refunds.failOn("processRefund");

  EXPECT_THROW(engine->cancelShipment(id, "customer request", "support", true),
               shiptrack::SagaFailedError);

  EXPECT_EQ(engine->shipment(id).status, ShipmentStatus::InTransit);
  EXPECT_EQ(engine->tracker().sessionState(id), TrackingSessionState::Active);
  EXPECT_TRUE(log.contains("notify.reversal:" + id));
  EXPECT_NO_THROW(engine->reportLocation(id, "dev-1", 40.2, -74.3, now()));
}

// -----------------------------------------------------------------------------
// 6. Delivery through the generic transition stops tracking.
// -----------------------------------------------------------------------------
TEST_F(TrackingEngineTest, DeliveryStopsTracking) {
  const std::string id = shipmentInTransit("SHP-1004");

  advanceMinutes(60);
  const auto delivered = engine->transition(id, ShipmentStatus::Delivered, "driver");

  EXPECT_EQ(delivered.status, ShipmentStatus::Delivered);
  EXPECT_EQ(engine->tracker().sessionState(id), TrackingSessionState::Stopped);
  EXPECT_EQ(transport.publishedOn("shipment.delivered").size(), 1u);
  const auto stream = engine->eventStream().streamFor(id);
  ASSERT_FALSE(stream.empty());
  EXPECT_TRUE(
      std::holds_alternative<shiptrack::events::ShipmentDelivered>(stream.back().payload));
}

// -----------------------------------------------------------------------------
// 7. start() and stop() can be repeated.
// -----------------------------------------------------------------------------
TEST_F(TrackingEngineTest, StartStopIdempotent) {
  engine->start();
  EXPECT_TRUE(engine->running());
  engine->stop();
  engine->stop();
  EXPECT_FALSE(engine->running());
  engine->start();
  EXPECT_TRUE(engine->running());
}
