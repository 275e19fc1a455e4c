#include "shiptrack/domain/shipment.hpp"

#include <algorithm>

namespace shiptrack {
namespace domain {

const char* shipmentStatusToString(ShipmentStatus status) {
  using S = ShipmentStatus;
  switch (status) {
    case S::Created:    return "Created";
    case S::Confirmed:  return "Confirmed";
    case S::Dispatched: return "Dispatched";
    case S::InTransit:  return "InTransit";
    case S::Exception:  return "Exception";
    case S::Cancelling: return "Cancelling";
    case S::Delivered:  return "Delivered";
    case S::Cancelled:  return "Cancelled";
  }
  return "Unknown";
}

const char* describeShipmentStatus(ShipmentStatus status) {
  using S = ShipmentStatus;
  switch (status) {
    case S::Created:    return "Shipment created and awaiting confirmation";
    case S::Confirmed:  return "Shipment confirmed and ready for dispatch";
    case S::Dispatched: return "Shipment picked up and dispatched";
    case S::InTransit:  return "Shipment in transit";
    case S::Exception:  return "Shipment delayed by an exception";
    case S::Cancelling: return "Shipment cancellation in progress";
    case S::Delivered:  return "Shipment delivered";
    case S::Cancelled:  return "Shipment cancelled";
  }
  return "Unknown";
}

const char* shipmentModeToString(ShipmentMode mode) {
  using M = ShipmentMode;
  switch (mode) {
    case M::TruckFtl:   return "TruckFtl";
    case M::TruckLtl:   return "TruckLtl";
    case M::Rail:       return "Rail";
    case M::Ocean:      return "Ocean";
    case M::Air:        return "Air";
    case M::Parcel:     return "Parcel";
    case M::Intermodal: return "Intermodal";
    case M::Drayage:    return "Drayage";
    case M::Courier:    return "Courier";
  }
  return "Unknown";
}

const char* stopTypeToString(StopType type) {
  using T = StopType;
  switch (type) {
    case T::Pickup:     return "Pickup";
    case T::Delivery:   return "Delivery";
    case T::CrossDock:  return "CrossDock";
    case T::Waypoint:   return "Waypoint";
    case T::Customs:    return "Customs";
    case T::Inspection: return "Inspection";
    case T::Fuel:       return "Fuel";
    case T::Rest:       return "Rest";
  }
  return "Unknown";
}

const char* stopStatusToString(StopStatus status) {
  using S = StopStatus;
  switch (status) {
    case S::Pending:     return "Pending";
    case S::Approaching: return "Approaching";
    case S::Arrived:     return "Arrived";
    case S::InProgress:  return "InProgress";
    case S::Completed:   return "Completed";
    case S::Skipped:     return "Skipped";
    case S::Failed:      return "Failed";
  }
  return "Unknown";
}

bool operator==(const Address& a, const Address& b) {
  return a.line1 == b.line1 && a.line2 == b.line2 && a.city == b.city &&
         a.state == b.state && a.zip_code == b.zip_code &&
         a.country == b.country && a.coordinates == b.coordinates;
}

bool operator!=(const Address& a, const Address& b) { return !(a == b); }

const Stop* Shipment::findStop(int sequence) const {
  auto it = std::find_if(stops.begin(), stops.end(),
                         [sequence](const Stop& s) { return s.sequence == sequence; });
  return it != stops.end() ? &*it : nullptr;
}

Stop* Shipment::findStop(int sequence) {
  auto it = std::find_if(stops.begin(), stops.end(),
                         [sequence](const Stop& s) { return s.sequence == sequence; });
  return it != stops.end() ? &*it : nullptr;
}

}  // namespace domain
}  // namespace shiptrack
