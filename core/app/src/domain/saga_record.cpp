#include "shiptrack/domain/saga_record.hpp"

namespace shiptrack {
namespace domain {

const char* sagaOutcomeToString(SagaOutcome outcome) {
  switch (outcome) {
    case SagaOutcome::Running:      return "Running";
    case SagaOutcome::Compensating: return "Compensating";
    case SagaOutcome::Completed:    return "Completed";
    case SagaOutcome::Failed:       return "Failed";
    case SagaOutcome::Compensated:  return "Compensated";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace shiptrack
