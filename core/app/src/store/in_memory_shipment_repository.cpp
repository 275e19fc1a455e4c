#include "shiptrack/store/in_memory_shipment_repository.hpp"

#include "shiptrack/common/error.hpp"

#include <mutex>

namespace shiptrack {

// -----------------------------------------------------------------------------
// save(): compare-and-swap on version
// -----------------------------------------------------------------------------
SaveResult<domain::Shipment> InMemoryShipmentRepository::save(
    const domain::Shipment& shipment) {
  std::unique_lock lock(mutex_);

  auto it = by_id_.find(shipment.id);
  const std::uint64_t stored_version = (it != by_id_.end()) ? it->second.version : 0;

  if (stored_version != shipment.version) {
    return VersionConflict{shipment.id, shipment.version, stored_version};
  }

  if (it == by_id_.end()) {
    if (id_by_number_.count(shipment.shipment_number) != 0) {
      throw TrackingError(ErrorCode::AlreadyExists,
                          "shipment number already exists: " +
                              shipment.shipment_number);
    }
    id_by_number_[shipment.shipment_number] = shipment.id;
  }

  domain::Shipment stored = shipment;
  stored.version = stored_version + 1;
  by_id_[stored.id] = stored;
  return stored;
}

std::optional<domain::Shipment> InMemoryShipmentRepository::findById(
    const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Shipment> InMemoryShipmentRepository::findByShipmentNumber(
    const std::string& shipment_number) const {
  std::shared_lock lock(mutex_);
  auto number_it = id_by_number_.find(shipment_number);
  if (number_it == id_by_number_.end()) {
    return std::nullopt;
  }
  return by_id_.at(number_it->second);
}

std::vector<domain::Shipment> InMemoryShipmentRepository::findAll() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Shipment> result;
  result.reserve(by_id_.size());
  for (const auto& [id, shipment] : by_id_) {
    result.push_back(shipment);
  }
  return result;
}

bool InMemoryShipmentRepository::remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return false;
  }
  id_by_number_.erase(it->second.shipment_number);
  by_id_.erase(it);
  return true;
}

}  // namespace shiptrack
