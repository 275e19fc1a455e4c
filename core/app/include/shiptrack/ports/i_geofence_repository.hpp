#pragma once

#include "shiptrack/domain/geofence.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shiptrack {

// Geofence definitions. save() is an upsert keyed by id; name uniqueness is
// enforced by GeofenceEngine::registerGeofence.
class IGeofenceRepository {
 public:
  virtual ~IGeofenceRepository() = default;

  virtual void save(const domain::Geofence& fence) = 0;
  virtual std::optional<domain::Geofence> findById(const std::string& id) const = 0;
  virtual std::optional<domain::Geofence> findByOwnerAndName(
      const std::string& owner_id, const std::string& name) const = 0;
  virtual std::vector<domain::Geofence> findAllActive() const = 0;
  virtual std::vector<domain::Geofence> findAll() const = 0;
  virtual bool remove(const std::string& id) = 0;
};

}  // namespace shiptrack
