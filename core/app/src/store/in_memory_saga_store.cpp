#include "shiptrack/store/in_memory_saga_store.hpp"

#include <mutex>

namespace shiptrack {

void InMemorySagaStore::save(const domain::SagaRecord& record) {
  std::unique_lock lock(mutex_);
  records_[record.saga_id] = record;
}

std::optional<domain::SagaRecord> InMemorySagaStore::find(
    const std::string& saga_id) const {
  std::shared_lock lock(mutex_);
  auto it = records_.find(saga_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::SagaRecord> InMemorySagaStore::findInFlight() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::SagaRecord> result;
  for (const auto& [id, record] : records_) {
    if (domain::isInFlight(record.outcome)) {
      result.push_back(record);
    }
  }
  return result;
}

}  // namespace shiptrack
