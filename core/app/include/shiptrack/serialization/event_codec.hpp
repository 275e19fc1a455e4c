#pragma once

#include "shiptrack/events/domain_event.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace shiptrack {

// -----------------------------------------------------------------------------
// EventCodec — stable wire shape of domain events
// -----------------------------------------------------------------------------
//
// @brief  Renders a DomainEvent as JSON and names its transport topic.
//
// @details
// Envelope fields, present on every event:
//   event_id, timestamp_ms, aggregate_id, version, type
// followed by the kind-specific fields in snake_case. Timestamps are epoch
// milliseconds, durations are milliseconds, enums are their names, absent
// optionals are omitted.
//
// Topics:
//   shipment.created         ShipmentCreated
//   shipment.status-changed  ShipmentDispatched, ShipmentStatusChanged
//   shipment.cancelled       ShipmentCancelled
//   shipment.delivered       ShipmentDelivered
//   shipment.updated         StopAdded, StopArrived, ShipmentEtaUpdated
//   location.updates         LocationUpdated
//   location.geofence.events GeofenceEntered, GeofenceExited, GeofenceDwelled
//
// Stateless; all members are static.
// -----------------------------------------------------------------------------
class EventCodec {
 public:
  static nlohmann::json toJson(const events::DomainEvent& event);
  static std::string toString(const events::DomainEvent& event);
  static const char* topicFor(const events::EventPayload& payload);
};

}  // namespace shiptrack
