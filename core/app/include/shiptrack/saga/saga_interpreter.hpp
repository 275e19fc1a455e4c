#pragma once

#include "shiptrack/common/error.hpp"
#include "shiptrack/common/id_generator.hpp"
#include "shiptrack/domain/saga_record.hpp"
#include "shiptrack/ports/i_saga_store.hpp"
#include "shiptrack/time/i_time_provider.hpp"
#include "shiptrack/time/time_utils.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace shiptrack {

// -----------------------------------------------------------------------------
// SagaStep / SagaDefinition
// -----------------------------------------------------------------------------
// A step is skipped (not run, not recorded) when `condition` is set and
// returns false. `compensation` may be empty for a step with nothing to undo;
// it is then recorded as compensated without a call.
//
// `irreversible` marks the point of no return (a terminal status write).
// When such a step overruns its timeout but still succeeds, the run goes
// forward instead of compensating.
// -----------------------------------------------------------------------------
struct SagaStep {
  using Predicate = std::function<bool(const domain::SagaTrigger&)>;
  using Action = std::function<void(const domain::SagaTrigger&)>;

  std::string name;
  Predicate condition;
  Action action;
  Action compensation;
  bool irreversible{false};
};

// Thrown by workflows built on the interpreter when a run ends Failed. The
// code is always SagaFailed; cause() is the failing step's code when it was a
// TrackingError.
class SagaFailedError : public TrackingError {
 public:
  explicit SagaFailedError(domain::SagaRecord record);

  const domain::SagaRecord& record() const noexcept { return record_; }
  std::optional<ErrorCode> cause() const noexcept { return record_.failure_code; }

 private:
  domain::SagaRecord record_;
};

struct SagaDefinition {
  std::string workflow;
  std::vector<SagaStep> steps;

  const SagaStep* findStep(const std::string& name) const;
};

// -----------------------------------------------------------------------------
// SagaInterpreter — runs a step list and folds compensation over its ledger
// -----------------------------------------------------------------------------
//
// @brief  Executes a SagaDefinition in order, recording every completed step
//         in a SagaRecord that is persisted after each change.
//
// @details
// run():
//   for each step (condition permitting):
//     current_step = name; save
//     invoke the action with the step timeout
//     append name to completed_steps; save
//   outcome = Completed; save
//
// On the first failing step (exception or StepTimeout):
//   outcome = Compensating, failure_code / failure_message captured; save
//   for completed_steps back to front: run compensation; a throwing
//   compensation is logged (ERROR) and listed in compensation_failures, and
//   the fold continues with the next one
//   outcome = Failed; save
// The failing step itself is never compensated and never retried.
//
// run() does not throw for step failures; it returns the final record and
// callers inspect outcome. Store failures do propagate.
//
// Step timeout: the action runs on a helper thread. If it has not returned
// after step_timeout the run logs it and the step counts as failed with
// StepTimeout, but the interpreter still waits for it to return before
// touching anything else; a step is never abandoned while running.
//   - overran, then threw        failing step, not compensated
//   - overran, then succeeded    appended to completed_steps and compensated
//                                with the others (irreversible steps: the run
//                                continues instead, with a WARNING)
// A step that never returns therefore blocks its run.
//
// recoverIncomplete(): for every stored record of this workflow that is
// still Running or Compensating, compensates the completed steps that are
// not yet in compensated_steps (back to front) and marks it Compensated.
//
// Thread model: run() may be called concurrently; each run owns its record.
// -----------------------------------------------------------------------------
class SagaInterpreter {
 public:
  SagaInterpreter(ISagaStore& store, const ITimeProvider& time,
                  IdGenerator& saga_ids, std::chrono::milliseconds step_timeout);

  domain::SagaRecord run(const SagaDefinition& definition,
                         const domain::SagaTrigger& trigger);

  std::vector<domain::SagaRecord> recoverIncomplete(const SagaDefinition& definition);

  std::chrono::milliseconds stepTimeout() const { return step_timeout_; }

 private:
  struct StepAttempt {
    bool succeeded{false};
    bool overran{false};
    std::optional<ErrorCode> code;
    std::string error;
  };

  StepAttempt invokeWithTimeout(const SagaStep& step,
                                const domain::SagaTrigger& trigger) const;
  void compensate(const SagaDefinition& definition, domain::SagaRecord& record);
  void persist(domain::SagaRecord& record);

  ISagaStore& store_;
  const ITimeProvider& time_;
  IdGenerator& saga_ids_;
  const std::chrono::milliseconds step_timeout_;
};

}  // namespace shiptrack
