#pragma once

#include <string>

namespace shiptrack {

// Location context: whether position reports for a shipment are accepted.
class ITrackingSessionManager {
 public:
  virtual ~ITrackingSessionManager() = default;

  virtual void initializeSession(const std::string& shipment_id) = 0;
  virtual void stopTracking(const std::string& shipment_id) = 0;
  virtual void resumeTracking(const std::string& shipment_id) = 0;
};

}  // namespace shiptrack
