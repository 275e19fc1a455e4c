// =============================================================================
// geo_math_test.cpp
// =============================================================================
// Unit tests for the great-circle helpers in shiptrack::geo.
//
// Validates:
//   - Haversine distance against a known city pair
//   - Symmetry and the zero-distance identity
//   - Coordinate range validation
//   - Initial bearing on the cardinal directions
// =============================================================================

#include "shiptrack/geo/geo_math.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using shiptrack::geo::GeoPoint;

namespace {
const GeoPoint kNewYork{40.7128, -74.0060};
const GeoPoint kLosAngeles{34.0522, -118.2437};
}  // namespace

// -----------------------------------------------------------------------------
// 1. New York to Los Angeles is about 3936 km on a 6371 km sphere.
// -----------------------------------------------------------------------------
TEST(GeoMathTest, NewYorkToLosAngeles) {
  EXPECT_NEAR(shiptrack::geo::distanceKm(kNewYork, kLosAngeles), 3936.0, 5.0);
}

// -----------------------------------------------------------------------------
// 2. distance(a, b) == distance(b, a) and distance(a, a) == 0.
// -----------------------------------------------------------------------------
TEST(GeoMathTest, SymmetricAndZeroOnSamePoint) {
  EXPECT_DOUBLE_EQ(shiptrack::geo::distanceKm(kNewYork, kLosAngeles),
                   shiptrack::geo::distanceKm(kLosAngeles, kNewYork));
  EXPECT_DOUBLE_EQ(shiptrack::geo::distanceKm(kNewYork, kNewYork), 0.0);
}

// -----------------------------------------------------------------------------
// 3. One hundredth of a degree of latitude is about 1.11 km.
// Why: The geofence exit scenario relies on this step leaving a 500 m fence.
// -----------------------------------------------------------------------------
TEST(GeoMathTest, HundredthDegreeOfLatitude) {
  const double m = shiptrack::geo::distanceMeters(GeoPoint{40.0, -74.0},
                                                  GeoPoint{40.01, -74.0});
  EXPECT_NEAR(m, 1112.0, 2.0);
}

// -----------------------------------------------------------------------------
// 4. Latitude must lie in [-90, 90], longitude in [-180, 180]; NaN is invalid.
// -----------------------------------------------------------------------------
TEST(GeoMathTest, CoordinateValidation) {
  EXPECT_TRUE(shiptrack::geo::isValidCoordinate(90.0, 180.0));
  EXPECT_TRUE(shiptrack::geo::isValidCoordinate(-90.0, -180.0));
  EXPECT_FALSE(shiptrack::geo::isValidCoordinate(90.0001, 0.0));
  EXPECT_FALSE(shiptrack::geo::isValidCoordinate(0.0, -180.5));
  EXPECT_FALSE(shiptrack::geo::isValidCoordinate(
      std::numeric_limits<double>::quiet_NaN(), 0.0));
}

// -----------------------------------------------------------------------------
// 5. Due north is 0 degrees, due east 90 degrees.
// -----------------------------------------------------------------------------
TEST(GeoMathTest, InitialBearing) {
  EXPECT_NEAR(shiptrack::geo::initialBearingDeg(GeoPoint{0.0, 0.0}, GeoPoint{1.0, 0.0}),
              0.0, 1e-9);
  EXPECT_NEAR(shiptrack::geo::initialBearingDeg(GeoPoint{0.0, 0.0}, GeoPoint{0.0, 1.0}),
              90.0, 1e-9);
}
