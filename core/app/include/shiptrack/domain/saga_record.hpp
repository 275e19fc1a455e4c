#pragma once

#include "shiptrack/common/error.hpp"
#include "shiptrack/domain/shipment_status.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shiptrack {
namespace domain {

// Running and Compensating are in-flight; the other three are terminal.
enum class SagaOutcome { Running, Compensating, Completed, Failed, Compensated };

const char* sagaOutcomeToString(SagaOutcome outcome);

inline bool isInFlight(SagaOutcome outcome) {
  return outcome == SagaOutcome::Running ||
         outcome == SagaOutcome::Compensating;
}

// What started the saga. prior_status is captured before the first step so
// the status compensation (and crash recovery) can restore it.
struct SagaTrigger {
  std::string shipment_id;
  std::string reason;
  std::string actor;
  bool refund_required{false};
  ShipmentStatus prior_status{ShipmentStatus::Created};
};

// -----------------------------------------------------------------------------
// SagaRecord — the saga's ledger
// -----------------------------------------------------------------------------
//
// @brief  Persisted state of one saga run.
//
// @details
// completed_steps only grows while Running, and is the input to
// compensation: it is walked back to front. compensated_steps records which
// compensations ran successfully so a partially compensated ledger can be
// inspected after the fact.
//
// The record is written to ISagaStore after every completed step and on every
// outcome change, so after a crash the store holds enough to replay
// compensation (SagaInterpreter::recoverIncomplete).
// -----------------------------------------------------------------------------
struct SagaRecord {
  std::string saga_id;
  std::string workflow;
  SagaTrigger trigger;
  std::vector<std::string> completed_steps;
  std::vector<std::string> compensated_steps;
  std::vector<std::string> compensation_failures;
  std::optional<std::string> current_step;
  SagaOutcome outcome{SagaOutcome::Running};
  std::optional<ErrorCode> failure_code;
  std::string failure_message;
  Timestamp started_at{};
  Timestamp finished_at{};
};

}  // namespace domain
}  // namespace shiptrack
