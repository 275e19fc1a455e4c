#include "shiptrack/common/error.hpp"

namespace shiptrack {

const char* errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidArgument:        return "InvalidArgument";
    case ErrorCode::InvalidLocationData:    return "InvalidLocationData";
    case ErrorCode::InvalidState:           return "InvalidState";
    case ErrorCode::InvalidTransition:      return "InvalidTransition";
    case ErrorCode::PreconditionFailed:     return "PreconditionFailed";
    case ErrorCode::NotFound:               return "NotFound";
    case ErrorCode::AlreadyExists:          return "AlreadyExists";
    case ErrorCode::ConcurrentModification: return "ConcurrentModification";
    case ErrorCode::StaleUpdate:            return "StaleUpdate";
    case ErrorCode::StepTimeout:            return "StepTimeout";
    case ErrorCode::SagaFailed:             return "SagaFailed";
  }
  return "Unknown";
}

bool isRetryable(ErrorCode code) {
  return code == ErrorCode::ConcurrentModification;
}

TrackingError::TrackingError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(errorCodeToString(code)) + ": " + message),
      code_(code),
      message_(message) {}

}  // namespace shiptrack
