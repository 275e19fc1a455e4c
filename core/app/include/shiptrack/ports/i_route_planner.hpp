#pragma once

#include "shiptrack/domain/shipment.hpp"
#include "shiptrack/geo/geo_math.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <optional>

namespace shiptrack {

// -----------------------------------------------------------------------------
// IRoutePlanner
// -----------------------------------------------------------------------------
// ETA estimation from the shipment's remaining stops and its latest position.
// No planner ships with the engine; the ETA route of the choreography only
// runs when one is attached. nullopt means "no estimate", which leaves the
// current ETA untouched.
// -----------------------------------------------------------------------------
class IRoutePlanner {
 public:
  virtual ~IRoutePlanner() = default;

  virtual std::optional<Timestamp> estimateArrival(
      const domain::Shipment& shipment, const geo::GeoPoint& position,
      Timestamp reported_at) = 0;
};

}  // namespace shiptrack
