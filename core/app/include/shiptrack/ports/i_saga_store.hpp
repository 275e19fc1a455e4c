#pragma once

#include "shiptrack/domain/saga_record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shiptrack {

// Durable home of saga ledgers. save() overwrites by saga_id.
class ISagaStore {
 public:
  virtual ~ISagaStore() = default;

  virtual void save(const domain::SagaRecord& record) = 0;
  virtual std::optional<domain::SagaRecord> find(const std::string& saga_id) const = 0;

  // Records whose outcome is Running or Compensating.
  virtual std::vector<domain::SagaRecord> findInFlight() const = 0;
};

}  // namespace shiptrack
