#include "shiptrack/events/domain_event.hpp"

namespace shiptrack {
namespace events {

const char* eventKindName(const EventPayload& payload) {
  return std::visit(
      Overloaded{
          [](const ShipmentCreated&) { return "ShipmentCreated"; },
          [](const ShipmentDispatched&) { return "ShipmentDispatched"; },
          [](const ShipmentStatusChanged&) { return "ShipmentStatusChanged"; },
          [](const ShipmentCancelled&) { return "ShipmentCancelled"; },
          [](const ShipmentDelivered&) { return "ShipmentDelivered"; },
          [](const StopAdded&) { return "StopAdded"; },
          [](const StopArrived&) { return "StopArrived"; },
          [](const ShipmentEtaUpdated&) { return "ShipmentEtaUpdated"; },
          [](const LocationUpdated&) { return "LocationUpdated"; },
          [](const GeofenceEntered&) { return "GeofenceEntered"; },
          [](const GeofenceExited&) { return "GeofenceExited"; },
          [](const GeofenceDwelled&) { return "GeofenceDwelled"; },
      },
      payload);
}

}  // namespace events
}  // namespace shiptrack
