#pragma once

#include "shiptrack/domain/shipment_status.hpp"
#include "shiptrack/geo/geo_math.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shiptrack {
namespace domain {

enum class ShipmentMode {
  TruckFtl,
  TruckLtl,
  Rail,
  Ocean,
  Air,
  Parcel,
  Intermodal,
  Drayage,
  Courier,
};

enum class StopType {
  Pickup,
  Delivery,
  CrossDock,
  Waypoint,
  Customs,
  Inspection,
  Fuel,
  Rest,
};

// -----------------------------------------------------------------------------
// StopStatus
// -----------------------------------------------------------------------------
// Pending → Approaching → Arrived → InProgress → Completed on the happy path.
// Skipped and Failed are terminal alternates.
// -----------------------------------------------------------------------------
enum class StopStatus {
  Pending,
  Approaching,
  Arrived,
  InProgress,
  Completed,
  Skipped,
  Failed,
};

const char* shipmentModeToString(ShipmentMode mode);
const char* stopTypeToString(StopType type);
const char* stopStatusToString(StopStatus status);

// -----------------------------------------------------------------------------
// Address
// -----------------------------------------------------------------------------
// Postal address with optional coordinates. Two addresses are equal when every
// field, coordinates included, is equal; Shipment creation uses this to reject
// identical origin and destination.
// -----------------------------------------------------------------------------
struct Address {
  std::string line1;
  std::string line2;
  std::string city;
  std::string state;
  std::string zip_code;
  std::string country;
  std::optional<geo::GeoPoint> coordinates;
};

bool operator==(const Address& a, const Address& b);
bool operator!=(const Address& a, const Address& b);

// -----------------------------------------------------------------------------
// Stop
// -----------------------------------------------------------------------------
// A planned visit on the shipment's route. Owned by exactly one Shipment and
// stored inside it; a Stop has no lifecycle of its own. Sequence numbers are
// unique within the parent shipment.
// -----------------------------------------------------------------------------
struct Stop {
  int sequence{0};
  StopType type{StopType::Waypoint};
  Address location;
  std::optional<Timestamp> planned_arrival;
  std::optional<Timestamp> actual_arrival;
  std::optional<Timestamp> planned_departure;
  std::optional<Timestamp> actual_departure;
  std::string reference_number;
  std::string contact_name;
  std::string notes;
  StopStatus status{StopStatus::Pending};
};

// -----------------------------------------------------------------------------
// ShipmentEvent
// -----------------------------------------------------------------------------
// Append-only audit entry stored on the shipment itself ("DISPATCHED",
// "CANCELLED", "STOP_ARRIVED", ...). Distinct from DomainEvent, which is the
// cross-context notification; every successful state-machine operation
// produces one of each.
// -----------------------------------------------------------------------------
struct ShipmentEvent {
  std::string event_type;
  Timestamp timestamp{};
  std::string description;
  std::string reported_by;
};

// -----------------------------------------------------------------------------
// Shipment — aggregate root
// -----------------------------------------------------------------------------
//
// @brief  One consignment tracked from origin to destination.
//
// @details
// Value type. Instances are created by ShipmentStateMachine::create() and
// changed only by returning a modified copy from a state-machine operation.
// The repository holds the authoritative copy; readers receive snapshots.
//
// Invariants (enforced by ShipmentStateMachine):
//   - shipment_number is unique and never changes after creation.
//   - planned_delivery is strictly after planned_pickup.
//   - stop sequence numbers are pairwise unique.
//   - a shipment in a terminal status is never mutated.
//
// version is the optimistic concurrency token. The state machine leaves it
// untouched; the repository compares it on save and increments it on
// success.
// -----------------------------------------------------------------------------
struct Shipment {
  std::string id;
  std::string shipment_number;
  std::string customer_id;
  std::string carrier_id;
  ShipmentStatus status{ShipmentStatus::Created};
  ShipmentMode mode{ShipmentMode::TruckFtl};
  Address origin;
  Address destination;

  Timestamp planned_pickup{};
  std::optional<Timestamp> actual_pickup;
  Timestamp planned_delivery{};
  std::optional<Timestamp> actual_delivery;
  std::optional<Timestamp> estimated_delivery;

  std::optional<double> weight_kg;
  std::optional<int> piece_count;
  bool hazmat{false};
  std::string reference_number;
  std::vector<std::string> tags;

  std::vector<Stop> stops;
  std::vector<ShipmentEvent> events;

  Timestamp created_at{};
  Timestamp updated_at{};
  std::uint64_t version{0};

  // Returns the stop with the given sequence number, or nullptr.
  const Stop* findStop(int sequence) const;
  Stop* findStop(int sequence);
};

}  // namespace domain
}  // namespace shiptrack
