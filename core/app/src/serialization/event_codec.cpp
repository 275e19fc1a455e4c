#include "shiptrack/serialization/event_codec.hpp"

#include "shiptrack/domain/shipment.hpp"

namespace shiptrack {

namespace {

using nlohmann::json;

json pointJson(const geo::GeoPoint& p) {
  return json{{"latitude", p.latitude}, {"longitude", p.longitude}};
}

// Kind-specific fields, merged into the envelope by toJson().
struct PayloadWriter {
  json& j;

  void operator()(const events::ShipmentCreated& e) const {
    j["shipment_number"] = e.shipment_number;
    j["customer_id"] = e.customer_id;
    j["mode"] = domain::shipmentModeToString(e.mode);
    j["origin_city"] = e.origin_city;
    j["destination_city"] = e.destination_city;
    j["planned_pickup_ms"] = timestamp_to_ms(e.planned_pickup);
    j["planned_delivery_ms"] = timestamp_to_ms(e.planned_delivery);
  }

  void operator()(const events::ShipmentDispatched& e) const {
    j["shipment_number"] = e.shipment_number;
    j["actual_pickup_ms"] = timestamp_to_ms(e.actual_pickup);
    j["stop_count"] = e.stop_count;
  }

  void operator()(const events::ShipmentStatusChanged& e) const {
    j["previous_status"] = domain::shipmentStatusToString(e.previous);
    j["status"] = domain::shipmentStatusToString(e.current);
    j["actor"] = e.actor;
    if (!e.reason.empty()) {
      j["reason"] = e.reason;
    }
  }

  void operator()(const events::ShipmentCancelled& e) const {
    j["previous_status"] = domain::shipmentStatusToString(e.previous);
    j["reason"] = e.reason;
    j["actor"] = e.actor;
  }

  void operator()(const events::ShipmentDelivered& e) const {
    j["shipment_number"] = e.shipment_number;
    j["actual_delivery_ms"] = timestamp_to_ms(e.actual_delivery);
  }

  void operator()(const events::StopAdded& e) const {
    j["sequence"] = e.sequence;
    j["stop_type"] = domain::stopTypeToString(e.stop_type);
  }

  void operator()(const events::StopArrived& e) const {
    j["sequence"] = e.sequence;
    j["arrived_at_ms"] = timestamp_to_ms(e.arrived_at);
    if (!e.geofence_id.empty()) {
      j["geofence_id"] = e.geofence_id;
    }
  }

  void operator()(const events::ShipmentEtaUpdated& e) const {
    if (e.previous_eta.has_value()) {
      j["previous_eta_ms"] = timestamp_to_ms(*e.previous_eta);
    }
    j["estimated_delivery_ms"] = timestamp_to_ms(e.estimated_delivery);
  }

  void operator()(const events::LocationUpdated& e) const {
    j["location_id"] = e.location_id;
    j["device_id"] = e.device_id;
    j["position"] = pointJson(e.point);
    if (e.speed_kmh.has_value()) {
      j["speed_kmh"] = *e.speed_kmh;
    }
    j["is_moving"] = e.is_moving;
    j["reported_at_ms"] = timestamp_to_ms(e.reported_at);
  }

  void operator()(const events::GeofenceEntered& e) const {
    j["geofence_id"] = e.geofence_id;
    j["geofence_name"] = e.geofence_name;
    j["transition"] = "Enter";
    j["position"] = pointJson(e.point);
    j["reported_at_ms"] = timestamp_to_ms(e.reported_at);
  }

  void operator()(const events::GeofenceExited& e) const {
    j["geofence_id"] = e.geofence_id;
    j["geofence_name"] = e.geofence_name;
    j["transition"] = "Exit";
    j["position"] = pointJson(e.point);
    j["reported_at_ms"] = timestamp_to_ms(e.reported_at);
    j["dwell_ms"] = e.dwell.count();
  }

  void operator()(const events::GeofenceDwelled& e) const {
    j["geofence_id"] = e.geofence_id;
    j["geofence_name"] = e.geofence_name;
    j["transition"] = "Dwell";
    j["position"] = pointJson(e.point);
    j["reported_at_ms"] = timestamp_to_ms(e.reported_at);
    j["dwell_ms"] = e.dwell.count();
  }
};

}  // namespace

json EventCodec::toJson(const events::DomainEvent& event) {
  json j;
  j["event_id"] = event.event_id;
  j["timestamp_ms"] = timestamp_to_ms(event.timestamp);
  j["aggregate_id"] = event.aggregate_id;
  j["version"] = event.version;
  j["type"] = events::eventKindName(event.payload);
  std::visit(PayloadWriter{j}, event.payload);
  return j;
}

std::string EventCodec::toString(const events::DomainEvent& event) {
  return toJson(event).dump();
}

const char* EventCodec::topicFor(const events::EventPayload& payload) {
  using namespace events;
  return std::visit(
      Overloaded{
          [](const ShipmentCreated&) { return "shipment.created"; },
          [](const ShipmentDispatched&) { return "shipment.status-changed"; },
          [](const ShipmentStatusChanged&) { return "shipment.status-changed"; },
          [](const ShipmentCancelled&) { return "shipment.cancelled"; },
          [](const ShipmentDelivered&) { return "shipment.delivered"; },
          [](const StopAdded&) { return "shipment.updated"; },
          [](const StopArrived&) { return "shipment.updated"; },
          [](const ShipmentEtaUpdated&) { return "shipment.updated"; },
          [](const LocationUpdated&) { return "location.updates"; },
          [](const GeofenceEntered&) { return "location.geofence.events"; },
          [](const GeofenceExited&) { return "location.geofence.events"; },
          [](const GeofenceDwelled&) { return "location.geofence.events"; },
      },
      payload);
}

}  // namespace shiptrack
