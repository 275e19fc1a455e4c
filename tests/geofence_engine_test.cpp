// =============================================================================
// geofence_engine_test.cpp
// =============================================================================
// Unit tests for shiptrack::GeofenceEngine.
//
// Validates:
//   - Circular containment with the boundary counted as inside
//   - Polygon ray casting, edge and vertex points, concave shapes
//   - Deterministic arbitration between overlapping fences
//   - Enter / Exit / Dwell signals relative to the previous occupancy
//   - NotificationPolicy suppression
//   - Registry rules: per-owner name uniqueness, activation, radius updates
// =============================================================================

#include "shiptrack/common/error.hpp"
#include "shiptrack/common/id_generator.hpp"
#include "shiptrack/domain/geofence.hpp"
#include "shiptrack/geo/geo_math.hpp"
#include "shiptrack/geofence/geofence_engine.hpp"
#include "shiptrack/store/in_memory_geofence_repository.hpp"
#include "shiptrack/time/simulation_time_provider.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using shiptrack::ErrorCode;
using shiptrack::GeofenceEngine;
using shiptrack::TrackingError;
using shiptrack::domain::Geofence;
using shiptrack::domain::GeofenceOccupancy;
using shiptrack::domain::GeofenceTransition;
using shiptrack::geo::GeoPoint;

// =============================================================================
// Test fixture: empty registry on a fixed clock.
// =============================================================================
class GeofenceEngineTest : public ::testing::Test {
 protected:
  shiptrack::SimulationTimeProvider clock{1735718400000};  // 2025-01-01T08:00Z
  shiptrack::InMemoryGeofenceRepository repository;
  shiptrack::IdGenerator ids{"geo"};
  GeofenceEngine engine{repository, clock, ids};

  shiptrack::Timestamp at(int minutes) const {
    return shiptrack::ms_to_timestamp(clock.now_ms()) + std::chrono::minutes(minutes);
  }

  static Geofence circle(const std::string& id, const std::string& name,
                         GeoPoint center, double radius_m) {
    return Geofence::createCircular(id, name, "carrier-1", center, radius_m);
  }

  static Geofence unitSquare(const std::string& id) {
    return Geofence::createPolygon(
        id, "square-" + id, "carrier-1",
        {GeoPoint{0.0, 0.0}, GeoPoint{0.0, 1.0}, GeoPoint{1.0, 1.0}, GeoPoint{1.0, 0.0}});
  }
};

// -----------------------------------------------------------------------------
// 1. A point exactly radius meters away is inside; one meter less radius and
//    it is outside.
// Why: The boundary rule is "distance <= radius".
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, CircularBoundaryIsInside) {
  const GeoPoint center{40.0, -74.0};
  const GeoPoint edge{40.0045, -74.0};
  const double r = shiptrack::geo::distanceMeters(center, edge);

  EXPECT_TRUE(GeofenceEngine::containsCircular(circle("a", "A", center, r), edge));
  EXPECT_FALSE(GeofenceEngine::containsCircular(circle("a", "A", center, r - 1.0), edge));
  EXPECT_TRUE(GeofenceEngine::containsCircular(circle("a", "A", center, r + 1.0), edge));
}

// -----------------------------------------------------------------------------
// 2. Polygon containment: interior, exterior, edge and vertex.
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, PolygonInteriorEdgeAndVertex) {
  const Geofence square = unitSquare("sq");

  EXPECT_TRUE(GeofenceEngine::containsPolygon(square, GeoPoint{0.5, 0.5}));
  EXPECT_FALSE(GeofenceEngine::containsPolygon(square, GeoPoint{1.5, 0.5}));
  EXPECT_FALSE(GeofenceEngine::containsPolygon(square, GeoPoint{0.5, -0.0001}));
  EXPECT_TRUE(GeofenceEngine::containsPolygon(square, GeoPoint{0.0, 0.5}));
  EXPECT_TRUE(GeofenceEngine::containsPolygon(square, GeoPoint{1.0, 1.0}));
}

// -----------------------------------------------------------------------------
// 3. An L-shaped polygon does not contain the point in its notch.
// Why: A bounding-box or convex-hull shortcut would wrongly say inside.
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, ConcavePolygonNotchIsOutside) {
  const Geofence ell = Geofence::createPolygon(
      "ell", "L", "carrier-1",
      {GeoPoint{0.0, 0.0}, GeoPoint{0.0, 2.0}, GeoPoint{1.0, 2.0}, GeoPoint{1.0, 1.0},
       GeoPoint{2.0, 1.0}, GeoPoint{2.0, 0.0}});

  EXPECT_TRUE(GeofenceEngine::containsPolygon(ell, GeoPoint{0.5, 1.5}));
  EXPECT_TRUE(GeofenceEngine::containsPolygon(ell, GeoPoint{1.5, 0.5}));
  EXPECT_FALSE(GeofenceEngine::containsPolygon(ell, GeoPoint{1.5, 1.5}));
}

// -----------------------------------------------------------------------------
// 4. Overlap: the smaller fence wins at equal priority, priority beats size,
//    and equal fences fall back to id order.
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, OverlapArbitrationIsDeterministic) {
  const GeoPoint p{40.0, -74.0};
  Geofence yard = circle("geo-yard", "Yard", p, 5000.0);
  Geofence dock = circle("geo-dock", "Dock", p, 500.0);
  engine.registerGeofence(yard);
  engine.registerGeofence(dock);

  auto hits = engine.findActiveContaining(p);
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits.front().id, "geo-dock");

  yard.priority = 1;
  repository.save(yard);
  hits = engine.findActiveContaining(p);
  EXPECT_EQ(hits.front().id, "geo-yard");

  const Geofence a = circle("a", "Twin A", p, 300.0);
  const Geofence b = circle("b", "Twin B", p, 300.0);
  EXPECT_TRUE(GeofenceEngine::outranks(a, b));
  EXPECT_FALSE(GeofenceEngine::outranks(b, a));
}

// -----------------------------------------------------------------------------
// 5. First report inside a fence: one Enter and a fresh occupancy.
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, EnterFromOutside) {
  engine.registerGeofence(circle("dc", "Newark DC", GeoPoint{40.0, -74.0}, 500.0));

  const auto result = engine.evaluate(std::nullopt, GeoPoint{40.0, -74.0}, at(0));

  ASSERT_EQ(result.signals.size(), 1u);
  EXPECT_EQ(result.signals[0].transition, GeofenceTransition::Enter);
  EXPECT_EQ(result.signals[0].geofence_id, "dc");
  ASSERT_TRUE(result.occupancy.has_value());
  EXPECT_EQ(result.occupancy->geofence_name, "Newark DC");
  EXPECT_EQ(result.occupancy->entered_at, at(0));
  EXPECT_FALSE(result.occupancy->dwell_emitted);
}

// -----------------------------------------------------------------------------
// 6. Moving straight from one fence into another: Exit of the old fence is
//    emitted before Enter of the new one, and Exit carries the stay length.
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, ExitPrecedesEnterWhenSwitchingFences) {
  engine.registerGeofence(circle("west", "West", GeoPoint{40.0, -74.0}, 500.0));
  engine.registerGeofence(circle("east", "East", GeoPoint{40.0, -73.99}, 500.0));

  const GeofenceOccupancy prior{"west", "West", at(0), false};
  const auto result = engine.evaluate(prior, GeoPoint{40.0, -73.99}, at(7));

  ASSERT_EQ(result.signals.size(), 2u);
  EXPECT_EQ(result.signals[0].transition, GeofenceTransition::Exit);
  EXPECT_EQ(result.signals[0].geofence_id, "west");
  EXPECT_EQ(result.signals[0].dwell, std::chrono::minutes(7));
  EXPECT_EQ(result.signals[1].transition, GeofenceTransition::Enter);
  EXPECT_EQ(result.signals[1].geofence_id, "east");
  EXPECT_EQ(result.occupancy->geofence_id, "east");
}

// -----------------------------------------------------------------------------
// 7. Dwell fires once the stay reaches the threshold, and only once.
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, DwellFiresOncePerStay) {
  engine.registerGeofence(circle("dc", "DC", GeoPoint{40.0, -74.0}, 500.0));
  const GeofenceOccupancy entered{"dc", "DC", at(0), false};

  auto early = engine.evaluate(entered, GeoPoint{40.0, -74.0}, at(14));
  EXPECT_TRUE(early.signals.empty());
  EXPECT_FALSE(early.occupancy->dwell_emitted);

  auto dwell = engine.evaluate(early.occupancy, GeoPoint{40.0, -74.0}, at(15));
  ASSERT_EQ(dwell.signals.size(), 1u);
  EXPECT_EQ(dwell.signals[0].transition, GeofenceTransition::Dwell);
  EXPECT_EQ(dwell.signals[0].dwell, std::chrono::minutes(15));
  EXPECT_TRUE(dwell.occupancy->dwell_emitted);

  auto later = engine.evaluate(dwell.occupancy, GeoPoint{40.0, -74.0}, at(40));
  EXPECT_TRUE(later.signals.empty());
  EXPECT_EQ(later.occupancy->entered_at, at(0));
}

// -----------------------------------------------------------------------------
// 8. Policy flags suppress signals but never the occupancy bookkeeping.
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, PolicySuppressesSignalsOnly) {
  Geofence quiet = circle("quiet", "Quiet", GeoPoint{40.0, -74.0}, 500.0);
  quiet.policy.notify_on_entry = false;
  quiet.policy.notify_on_exit = false;
  engine.registerGeofence(quiet);

  const auto in = engine.evaluate(std::nullopt, GeoPoint{40.0, -74.0}, at(0));
  EXPECT_TRUE(in.signals.empty());
  ASSERT_TRUE(in.occupancy.has_value());

  const auto out = engine.evaluate(in.occupancy, GeoPoint{41.0, -74.0}, at(5));
  EXPECT_TRUE(out.signals.empty());
  EXPECT_FALSE(out.occupancy.has_value());
}

// -----------------------------------------------------------------------------
// 9. A fence deleted while occupied still produces an Exit.
// Why: Otherwise the occupancy would never close and downstream stays would
//      remain open forever.
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, ExitFromRemovedFence) {
  engine.registerGeofence(circle("gone", "Gone", GeoPoint{40.0, -74.0}, 500.0));
  const GeofenceOccupancy prior{"gone", "Gone", at(0), false};
  engine.remove("gone");

  const auto result = engine.evaluate(prior, GeoPoint{40.0, -74.0}, at(3));
  ASSERT_EQ(result.signals.size(), 1u);
  EXPECT_EQ(result.signals[0].transition, GeofenceTransition::Exit);
  EXPECT_EQ(result.signals[0].geofence_id, "gone");
}

// -----------------------------------------------------------------------------
// 10. Registry rules.
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, RegistryRules) {
  const auto dc = engine.registerGeofence(
      Geofence::createCircular("", "DC", "carrier-1", GeoPoint{40.0, -74.0}, 500.0));
  EXPECT_EQ(dc.id, "geo-1");
  EXPECT_EQ(dc.created_at, at(0));

  try {
    engine.registerGeofence(
        Geofence::createCircular("", "DC", "carrier-1", GeoPoint{41.0, -74.0}, 100.0));
    FAIL() << "duplicate name for the same owner must be rejected";
  } catch (const TrackingError& e) {
    EXPECT_EQ(e.code(), ErrorCode::AlreadyExists);
  }
  EXPECT_NO_THROW(engine.registerGeofence(
      Geofence::createCircular("", "DC", "carrier-2", GeoPoint{41.0, -74.0}, 100.0)));

  try {
    engine.activate(dc.id);
    FAIL() << "activating an active fence must be rejected";
  } catch (const TrackingError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidState);
  }

  engine.deactivate(dc.id);
  EXPECT_TRUE(engine.findActiveContaining(GeoPoint{40.0, -74.0}).empty());
  engine.activate(dc.id);
  EXPECT_EQ(engine.findActiveContaining(GeoPoint{40.0, -74.0}).size(), 1u);

  EXPECT_DOUBLE_EQ(engine.updateRadius(dc.id, 750.0).radius_m, 750.0);
  try {
    engine.updateRadius(dc.id, 60000.0);
    FAIL() << "radius above the maximum must be rejected";
  } catch (const TrackingError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
  }

  engine.registerGeofence(unitSquare("sq"));
  try {
    engine.updateRadius("sq", 100.0);
    FAIL() << "polygons have no radius";
  } catch (const TrackingError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidState);
  }

  try {
    engine.remove("nope");
    FAIL() << "removing an unknown fence must be rejected";
  } catch (const TrackingError& e) {
    EXPECT_EQ(e.code(), ErrorCode::NotFound);
  }
}

// -----------------------------------------------------------------------------
// 11. Factory validation.
// -----------------------------------------------------------------------------
TEST_F(GeofenceEngineTest, FactoriesValidateShape) {
  EXPECT_THROW(circle("a", "A", GeoPoint{40.0, -74.0}, 0.0), TrackingError);
  EXPECT_THROW(circle("a", "", GeoPoint{40.0, -74.0}, 10.0), TrackingError);
  EXPECT_THROW(circle("a", "A", GeoPoint{95.0, -74.0}, 10.0), TrackingError);
  EXPECT_THROW(Geofence::createPolygon("p", "P", "o",
                                       {GeoPoint{0.0, 0.0}, GeoPoint{1.0, 1.0}}),
               TrackingError);
}
