#pragma once

#include "shiptrack/ports/i_saga_store.hpp"

#include <map>
#include <shared_mutex>
#include <string>

namespace shiptrack {

class InMemorySagaStore final : public ISagaStore {
 public:
  void save(const domain::SagaRecord& record) override;
  std::optional<domain::SagaRecord> find(const std::string& saga_id) const override;
  std::vector<domain::SagaRecord> findInFlight() const override;

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::SagaRecord> records_;
};

}  // namespace shiptrack
