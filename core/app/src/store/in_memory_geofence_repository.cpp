#include "shiptrack/store/in_memory_geofence_repository.hpp"

#include <mutex>

namespace shiptrack {

void InMemoryGeofenceRepository::save(const domain::Geofence& fence) {
  std::unique_lock lock(mutex_);
  fences_[fence.id] = fence;
}

std::optional<domain::Geofence> InMemoryGeofenceRepository::findById(
    const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = fences_.find(id);
  if (it == fences_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Geofence> InMemoryGeofenceRepository::findByOwnerAndName(
    const std::string& owner_id, const std::string& name) const {
  std::shared_lock lock(mutex_);
  for (const auto& [id, fence] : fences_) {
    if (fence.owner_id == owner_id && fence.name == name) {
      return fence;
    }
  }
  return std::nullopt;
}

std::vector<domain::Geofence> InMemoryGeofenceRepository::findAllActive() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Geofence> result;
  for (const auto& [id, fence] : fences_) {
    if (fence.active) {
      result.push_back(fence);
    }
  }
  return result;
}

std::vector<domain::Geofence> InMemoryGeofenceRepository::findAll() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Geofence> result;
  result.reserve(fences_.size());
  for (const auto& [id, fence] : fences_) {
    result.push_back(fence);
  }
  return result;
}

bool InMemoryGeofenceRepository::remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  return fences_.erase(id) > 0;
}

}  // namespace shiptrack
