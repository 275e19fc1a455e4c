#pragma once

#include "shiptrack/domain/shipment.hpp"
#include "shiptrack/ports/version_conflict.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shiptrack {

// -----------------------------------------------------------------------------
// IShipmentRepository
// -----------------------------------------------------------------------------
//
// @brief  Version-checked persistence for the Shipment aggregate.
//
// @details
// save(shipment) compares shipment.version with the stored version (0 when
// the id is unknown). On a match the copy is stored with version + 1 and
// returned; otherwise a VersionConflict comes back and nothing changes.
// Inserting a shipment whose shipment_number is already taken throws
// TrackingError(AlreadyExists).
//
// Stops are part of the aggregate, so findById also serves "find with stops".
//
// Thread model: implementations must be safe for concurrent use.
// -----------------------------------------------------------------------------
class IShipmentRepository {
 public:
  virtual ~IShipmentRepository() = default;

  virtual SaveResult<domain::Shipment> save(const domain::Shipment& shipment) = 0;

  virtual std::optional<domain::Shipment> findById(const std::string& id) const = 0;

  virtual std::optional<domain::Shipment> findByShipmentNumber(
      const std::string& shipment_number) const = 0;

  virtual std::vector<domain::Shipment> findAll() const = 0;

  // Hard delete. Returns false when the id is unknown.
  virtual bool remove(const std::string& id) = 0;
};

}  // namespace shiptrack
