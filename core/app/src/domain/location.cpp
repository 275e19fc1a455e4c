#include "shiptrack/domain/location.hpp"

namespace shiptrack {
namespace domain {

const char* locationQualityToString(LocationQuality quality) {
  switch (quality) {
    case LocationQuality::High:     return "High";
    case LocationQuality::Standard: return "Standard";
    case LocationQuality::Low:      return "Low";
    case LocationQuality::Unknown:  return "Unknown";
  }
  return "Unknown";
}

const char* locationSourceToString(LocationSource source) {
  switch (source) {
    case LocationSource::Gps:        return "Gps";
    case LocationSource::CellTower:  return "CellTower";
    case LocationSource::Wifi:       return "Wifi";
    case LocationSource::Manual:     return "Manual";
    case LocationSource::Calculated: return "Calculated";
    case LocationSource::Mixed:      return "Mixed";
  }
  return "Unknown";
}

const char* geofenceTransitionToString(GeofenceTransition transition) {
  switch (transition) {
    case GeofenceTransition::Enter: return "Enter";
    case GeofenceTransition::Exit:  return "Exit";
    case GeofenceTransition::Dwell: return "Dwell";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace shiptrack
