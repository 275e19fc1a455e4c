#pragma once

#include <stdexcept>
#include <string>

namespace shiptrack {

// -----------------------------------------------------------------------------
// ErrorCode — failure taxonomy shared by every component
// -----------------------------------------------------------------------------
//
// @brief  Classifies why an operation was refused. Callers branch on the code,
//         never on the message text.
//
// @details
// Only ConcurrentModification is worth retrying, and even then the retry is
// the caller's decision (reload the aggregate, re-apply the intent). Nothing
// inside the engine retries on its own.
//
//   InvalidArgument         malformed input (time ordering, radius, ids)
//   InvalidLocationData     coordinates out of range or missing shipment id
//   InvalidState            operation not allowed in the current status
//   InvalidTransition       (from, to) pair absent from the transition table
//   PreconditionFailed      e.g. dispatch without stops
//   NotFound                unknown shipment, location, geofence, saga
//   AlreadyExists           duplicate shipment number or geofence name
//   ConcurrentModification  optimistic version check failed on save
//   StaleUpdate             location report older than the current latest
//   StepTimeout             saga step did not return within its timeout
//   SagaFailed              saga step failed; compensation has run
// -----------------------------------------------------------------------------
enum class ErrorCode {
  InvalidArgument,
  InvalidLocationData,
  InvalidState,
  InvalidTransition,
  PreconditionFailed,
  NotFound,
  AlreadyExists,
  ConcurrentModification,
  StaleUpdate,
  StepTimeout,
  SagaFailed,
};

const char* errorCodeToString(ErrorCode code);

// True only for failures a caller may sensibly retry after reloading state.
bool isRetryable(ErrorCode code);

// -----------------------------------------------------------------------------
// TrackingError
// -----------------------------------------------------------------------------
//
// @brief  Exception thrown by domain operations. Carries an ErrorCode next to
//         the human-readable message.
//
// @details
// what() is prefixed with the code name, e.g.
//   "InvalidTransition: cannot transition from Created to Delivered"
// so log lines stay greppable. message() returns the bare text.
// -----------------------------------------------------------------------------
class TrackingError : public std::runtime_error {
 public:
  TrackingError(ErrorCode code, const std::string& message);

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }

 private:
  ErrorCode code_;
  std::string message_;
};

}  // namespace shiptrack
