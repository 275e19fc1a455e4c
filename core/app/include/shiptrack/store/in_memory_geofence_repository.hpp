#pragma once

#include "shiptrack/ports/i_geofence_repository.hpp"

#include <map>
#include <shared_mutex>
#include <string>

namespace shiptrack {

// Map-backed IGeofenceRepository. Ordered by id so findAll() and
// findAllActive() return a stable order.
class InMemoryGeofenceRepository final : public IGeofenceRepository {
 public:
  void save(const domain::Geofence& fence) override;
  std::optional<domain::Geofence> findById(const std::string& id) const override;
  std::optional<domain::Geofence> findByOwnerAndName(
      const std::string& owner_id, const std::string& name) const override;
  std::vector<domain::Geofence> findAllActive() const override;
  std::vector<domain::Geofence> findAll() const override;
  bool remove(const std::string& id) override;

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::Geofence> fences_;
};

}  // namespace shiptrack
