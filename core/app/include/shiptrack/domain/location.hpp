#pragma once

#include "shiptrack/domain/shipment.hpp"
#include "shiptrack/geo/geo_math.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <optional>
#include <string>

namespace shiptrack {
namespace domain {

// Derived from reported accuracy; Unknown when the device sent none.
enum class LocationQuality { High, Standard, Low, Unknown };

enum class LocationSource { Gps, CellTower, Wifi, Manual, Calculated, Mixed };

enum class GeofenceTransition { Enter, Exit, Dwell };

const char* locationQualityToString(LocationQuality quality);
const char* locationSourceToString(LocationSource source);
const char* geofenceTransitionToString(GeofenceTransition transition);

// -----------------------------------------------------------------------------
// Location — one accepted position report
// -----------------------------------------------------------------------------
//
// @brief  Append-only record produced by LocationTracker::update().
//
// @details
// "Current location" of a shipment is simply the newest Location by timestamp;
// the repository keeps it as a read projection next to the daily history.
//
// Derived fields (filled by the tracker, never by the caller):
//   quality            from accuracy_m
//   is_moving          speed_kmh > moving threshold
//   geofence_id / geofence_transition
//                      the last transition produced by this report, if any
//   nearest_stop_*     only when a stop lookup is attached
// -----------------------------------------------------------------------------
struct Location {
  std::string id;
  std::string shipment_id;
  std::string device_id;
  geo::GeoPoint point;
  std::optional<double> altitude_m;
  std::optional<double> speed_kmh;
  std::optional<double> heading_deg;
  std::optional<double> accuracy_m;
  std::optional<int> battery_level;
  LocationSource source{LocationSource::Gps};
  Timestamp timestamp{};
  Timestamp received_at{};

  LocationQuality quality{LocationQuality::Unknown};
  bool is_moving{false};

  std::optional<std::string> geofence_id;
  std::optional<GeofenceTransition> geofence_transition;

  std::optional<int> nearest_stop_sequence;
  std::optional<double> nearest_stop_distance_m;

  std::optional<Address> address;
};

// Optional fields accepted by LocationTracker::update().
struct LocationReadings {
  std::optional<double> altitude_m;
  std::optional<double> speed_kmh;
  std::optional<double> heading_deg;
  std::optional<double> accuracy_m;
  std::optional<int> battery_level;
  LocationSource source{LocationSource::Gps};
};

// -----------------------------------------------------------------------------
// GeofenceOccupancy
// -----------------------------------------------------------------------------
// Per-shipment memory of the fence the shipment is currently inside. Stored
// beside the latest location and handed back to GeofenceEngine::evaluate() on
// the next report. dwell_emitted makes Dwell fire at most once per continuous
// stay.
// -----------------------------------------------------------------------------
struct GeofenceOccupancy {
  std::string geofence_id;
  std::string geofence_name;
  Timestamp entered_at{};
  bool dwell_emitted{false};
};

}  // namespace domain
}  // namespace shiptrack
