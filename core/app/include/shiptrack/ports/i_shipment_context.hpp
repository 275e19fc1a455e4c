#pragma once

#include "shiptrack/domain/geofence.hpp"
#include "shiptrack/geo/geo_math.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <optional>
#include <string>

namespace shiptrack {

// -----------------------------------------------------------------------------
// IShipmentContext
// -----------------------------------------------------------------------------
// The shipment-context entry points the choreography table drives. Each call
// is a full load → mutate → save → publish cycle in the shipment context.
// -----------------------------------------------------------------------------
class IShipmentContext {
 public:
  virtual ~IShipmentContext() = default;

  // Re-estimates the ETA from a new position. A no-op when no route planner
  // is attached, when the planner has no estimate, or when the shipment is
  // terminal.
  virtual void refreshEstimatedDelivery(const std::string& shipment_id,
                                        const geo::GeoPoint& position,
                                        Timestamp reported_at) = 0;

  // Marks Arrived the lowest-sequence Pending or Approaching stop whose
  // coordinates lie inside `fence`. Returns its sequence, or nullopt when no
  // such stop exists.
  virtual std::optional<int> markStopArrivedWithin(const std::string& shipment_id,
                                                   const domain::Geofence& fence,
                                                   Timestamp arrived_at) = 0;
};

}  // namespace shiptrack
