#pragma once

#include "shiptrack/domain/shipment.hpp"
#include "shiptrack/domain/shipment_status.hpp"
#include "shiptrack/geo/geo_math.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace shiptrack {
namespace events {

// -----------------------------------------------------------------------------
// Event payloads
// -----------------------------------------------------------------------------
// One plain struct per event kind. Shipment-context payloads are produced by
// ShipmentStateMachine, location-context payloads by LocationTracker and
// GeofenceEngine. Payloads carry only the kind-specific fields; identity,
// time and aggregate id live on the DomainEvent envelope.
// -----------------------------------------------------------------------------

struct ShipmentCreated {
  std::string shipment_number;
  std::string customer_id;
  domain::ShipmentMode mode{domain::ShipmentMode::TruckFtl};
  std::string origin_city;
  std::string destination_city;
  Timestamp planned_pickup{};
  Timestamp planned_delivery{};
};

struct ShipmentDispatched {
  std::string shipment_number;
  Timestamp actual_pickup{};
  std::size_t stop_count{0};
};

struct ShipmentStatusChanged {
  domain::ShipmentStatus previous{domain::ShipmentStatus::Created};
  domain::ShipmentStatus current{domain::ShipmentStatus::Created};
  std::string actor;
  std::string reason;
};

struct ShipmentCancelled {
  domain::ShipmentStatus previous{domain::ShipmentStatus::Created};
  std::string reason;
  std::string actor;
};

struct ShipmentDelivered {
  std::string shipment_number;
  Timestamp actual_delivery{};
};

struct StopAdded {
  int sequence{0};
  domain::StopType stop_type{domain::StopType::Waypoint};
};

struct StopArrived {
  int sequence{0};
  Timestamp arrived_at{};
  std::string geofence_id;  // empty when arrival was recorded manually
};

struct ShipmentEtaUpdated {
  std::optional<Timestamp> previous_eta;
  Timestamp estimated_delivery{};
};

struct LocationUpdated {
  std::string location_id;
  std::string device_id;
  geo::GeoPoint point;
  std::optional<double> speed_kmh;
  bool is_moving{false};
  Timestamp reported_at{};
};

struct GeofenceEntered {
  std::string geofence_id;
  std::string geofence_name;
  geo::GeoPoint point;
  Timestamp reported_at{};
};

struct GeofenceExited {
  std::string geofence_id;
  std::string geofence_name;
  geo::GeoPoint point;
  Timestamp reported_at{};
  std::chrono::milliseconds dwell{0};  // time since the matching Enter
};

struct GeofenceDwelled {
  std::string geofence_id;
  std::string geofence_name;
  geo::GeoPoint point;
  Timestamp reported_at{};
  std::chrono::milliseconds dwell{0};
};

// -----------------------------------------------------------------------------
// EventPayload — closed set of event kinds
// -----------------------------------------------------------------------------
// Routing sites std::visit over this variant with an overload per
// alternative, so adding a kind is a compile error everywhere it is not yet
// handled.
// -----------------------------------------------------------------------------
using EventPayload = std::variant<ShipmentCreated,
                                  ShipmentDispatched,
                                  ShipmentStatusChanged,
                                  ShipmentCancelled,
                                  ShipmentDelivered,
                                  StopAdded,
                                  StopArrived,
                                  ShipmentEtaUpdated,
                                  LocationUpdated,
                                  GeofenceEntered,
                                  GeofenceExited,
                                  GeofenceDwelled>;

// -----------------------------------------------------------------------------
// DomainEvent — immutable envelope
// -----------------------------------------------------------------------------
//
// @brief  Event id, time, the shipment it concerns and the kind-specific
//         payload.
//
// @details
// aggregate_id is always a shipment id, geofence events included: the
// transport partitions on it, which keeps one shipment's stream ordered.
//
// version is the shipment version the event belongs to (the version the
// save will produce). Location-context events carry 0; they are not tied to
// a shipment version.
//
// Produced exactly once per accepted mutation. Consumers must tolerate
// duplicates downstream; event_id is the deduplication key.
// -----------------------------------------------------------------------------
struct DomainEvent {
  std::string event_id;
  Timestamp timestamp{};
  std::string aggregate_id;
  std::uint64_t version{0};
  EventPayload payload;
};

// "ShipmentCreated", "GeofenceEntered", ...
const char* eventKindName(const EventPayload& payload);

// Helper for std::visit with a set of lambdas.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace events
}  // namespace shiptrack
