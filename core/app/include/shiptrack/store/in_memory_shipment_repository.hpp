#pragma once

#include "shiptrack/ports/i_shipment_repository.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace shiptrack {

// -----------------------------------------------------------------------------
// InMemoryShipmentRepository
// -----------------------------------------------------------------------------
// Map-backed IShipmentRepository used by the engine and the tests.
//
// Thread model: one std::shared_mutex over both maps. save() and remove()
// take it exclusively; the finders share it. The version check and the write
// happen under the same exclusive lock, which is what makes save() a
// compare-and-swap.
// -----------------------------------------------------------------------------
class InMemoryShipmentRepository final : public IShipmentRepository {
 public:
  SaveResult<domain::Shipment> save(const domain::Shipment& shipment) override;
  std::optional<domain::Shipment> findById(const std::string& id) const override;
  std::optional<domain::Shipment> findByShipmentNumber(
      const std::string& shipment_number) const override;
  std::vector<domain::Shipment> findAll() const override;
  bool remove(const std::string& id) override;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::Shipment> by_id_;
  std::unordered_map<std::string, std::string> id_by_number_;
};

}  // namespace shiptrack
