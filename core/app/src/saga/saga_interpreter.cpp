#include "shiptrack/saga/saga_interpreter.hpp"

#include "shiptrack/common/error.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <string>
#include <utility>

namespace shiptrack {

using domain::SagaOutcome;
using domain::SagaRecord;
using domain::SagaTrigger;

SagaFailedError::SagaFailedError(SagaRecord record)
    : TrackingError(ErrorCode::SagaFailed,
                    record.workflow + " " + record.saga_id + " for " +
                        record.trigger.shipment_id + " failed: " +
                        record.failure_message),
      record_(std::move(record)) {}

const SagaStep* SagaDefinition::findStep(const std::string& name) const {
  for (const auto& step : steps) {
    if (step.name == name) {
      return &step;
    }
  }
  return nullptr;
}

SagaInterpreter::SagaInterpreter(ISagaStore& store, const ITimeProvider& time,
                                 IdGenerator& saga_ids,
                                 std::chrono::milliseconds step_timeout)
    : store_(store), time_(time), saga_ids_(saga_ids), step_timeout_(step_timeout) {
  if (step_timeout_.count() <= 0) {
    throw TrackingError(ErrorCode::InvalidArgument, "saga step timeout must be positive");
  }
}

// -----------------------------------------------------------------------------
// run(): forward pass, then compensation on the first failure
// -----------------------------------------------------------------------------
SagaRecord SagaInterpreter::run(const SagaDefinition& definition,
                                const SagaTrigger& trigger) {
  SagaRecord record;
  record.saga_id = saga_ids_.next_id();
  record.workflow = definition.workflow;
  record.trigger = trigger;
  record.outcome = SagaOutcome::Running;
  record.started_at = ms_to_timestamp(time_.now_ms());
  persist(record);

  for (const auto& step : definition.steps) {
    if (step.condition && !step.condition(trigger)) {
      continue;
    }

    record.current_step = step.name;
    persist(record);

    const StepAttempt attempt = invokeWithTimeout(step, trigger);

    bool failed = !attempt.succeeded;
    if (attempt.overran && attempt.succeeded && step.irreversible) {
      // Finished late but cannot be undone: the saga is past its point of no
      // return, so it goes forward.
      std::cerr << "[" << definition.workflow << "] WARNING: step " << step.name
                << " for " << trigger.shipment_id << " (" << record.saga_id
                << ") finished after the " << step_timeout_.count()
                << " ms timeout; continuing\n";
    } else if (attempt.overran) {
      record.failure_code = ErrorCode::StepTimeout;
      record.failure_message = step.name + ": did not finish within " +
                               std::to_string(step_timeout_.count()) + " ms";
      if (attempt.succeeded) {
        // Its effect is real, so it is compensated with the earlier steps.
        record.completed_steps.push_back(step.name);
        failed = true;
      } else {
        record.failure_message += ", then failed: " + attempt.error;
      }
    } else if (!attempt.succeeded) {
      record.failure_code = attempt.code;
      record.failure_message = step.name + ": " + attempt.error;
    }

    if (failed) {
      std::cerr << "[" << definition.workflow << "] ERROR: step " << step.name
                << " failed for " << trigger.shipment_id << " (" << record.saga_id
                << "): " << record.failure_message << "\n";
      record.outcome = SagaOutcome::Compensating;
      persist(record);
      compensate(definition, record);
      record.outcome = SagaOutcome::Failed;
      record.finished_at = ms_to_timestamp(time_.now_ms());
      persist(record);
      return record;
    }

    record.completed_steps.push_back(step.name);
    record.current_step.reset();
    persist(record);
  }

  record.outcome = SagaOutcome::Completed;
  record.finished_at = ms_to_timestamp(time_.now_ms());
  persist(record);
  return record;
}

// -----------------------------------------------------------------------------
// recoverIncomplete(): replay compensation for interrupted runs
// -----------------------------------------------------------------------------
std::vector<SagaRecord> SagaInterpreter::recoverIncomplete(
    const SagaDefinition& definition) {
  std::vector<SagaRecord> recovered;
  for (auto record : store_.findInFlight()) {
    if (record.workflow != definition.workflow) {
      continue;
    }
    std::cout << "[" << definition.workflow << "] recovering " << record.saga_id
              << " (" << domain::sagaOutcomeToString(record.outcome) << ", "
              << record.completed_steps.size() << " completed steps)\n";

    record.outcome = SagaOutcome::Compensating;
    if (record.failure_message.empty()) {
      record.failure_message = "interrupted before completion";
    }
    persist(record);
    compensate(definition, record);
    record.outcome = SagaOutcome::Compensated;
    record.current_step.reset();
    record.finished_at = ms_to_timestamp(time_.now_ms());
    persist(record);
    recovered.push_back(record);
  }
  return recovered;
}

// -----------------------------------------------------------------------------
// compensate(): reverse fold over completed_steps, best effort
// -----------------------------------------------------------------------------
void SagaInterpreter::compensate(const SagaDefinition& definition, SagaRecord& record) {
  for (auto it = record.completed_steps.rbegin(); it != record.completed_steps.rend();
       ++it) {
    const std::string& name = *it;
    if (std::find(record.compensated_steps.begin(), record.compensated_steps.end(),
                  name) != record.compensated_steps.end()) {
      continue;
    }

    const SagaStep* step = definition.findStep(name);
    if (step == nullptr) {
      std::cerr << "[" << definition.workflow << "] ERROR: compensation " << name
                << " failed: step not defined in workflow\n";
      record.compensation_failures.push_back(name);
      persist(record);
      continue;
    }

    try {
      if (step->compensation) {
        step->compensation(record.trigger);
      }
      record.compensated_steps.push_back(name);
    } catch (const std::exception& e) {
      std::cerr << "[" << definition.workflow << "] ERROR: compensation " << name
                << " failed for " << record.trigger.shipment_id << ": " << e.what()
                << "\n";
      record.compensation_failures.push_back(name);
    }
    persist(record);
  }
}

// -----------------------------------------------------------------------------
// invokeWithTimeout(): run the action on a helper thread, wait step_timeout_,
// then keep waiting until it returns
// -----------------------------------------------------------------------------
SagaInterpreter::StepAttempt SagaInterpreter::invokeWithTimeout(
    const SagaStep& step, const SagaTrigger& trigger) const {
  StepAttempt attempt;
  std::future<void> done =
      std::async(std::launch::async, [&step, &trigger] { step.action(trigger); });

  if (done.wait_for(step_timeout_) == std::future_status::timeout) {
    attempt.overran = true;
    std::cerr << "[SagaInterpreter] ERROR: step " << step.name << " for "
              << trigger.shipment_id << " exceeded " << step_timeout_.count()
              << " ms; waiting for it before compensating\n";
    done.wait();
  }

  try {
    done.get();
    attempt.succeeded = true;
  } catch (const TrackingError& e) {
    attempt.code = e.code();
    attempt.error = e.message();
  } catch (const std::exception& e) {
    attempt.error = e.what();
  }
  return attempt;
}

void SagaInterpreter::persist(SagaRecord& record) { store_.save(record); }

}  // namespace shiptrack
