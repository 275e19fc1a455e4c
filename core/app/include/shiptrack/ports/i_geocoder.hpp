#pragma once

#include "shiptrack/domain/shipment.hpp"

namespace shiptrack {

// Reverse geocoding provider. Used on demand only, never on the update path.
class IGeocoder {
 public:
  virtual ~IGeocoder() = default;

  virtual domain::Address reverseGeocode(double latitude, double longitude) = 0;
};

}  // namespace shiptrack
