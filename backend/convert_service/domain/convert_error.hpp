#pragma once
#include <string>
#include <string_view>

namespace convert_service {

enum class ErrorCode {
  Validation,       // bad options, mixed media categories; rejected before spawning
  UnreadableMedia,  // probe could not parse the source
  Spawn,            // engine binary missing or not runnable
  Encode,           // engine exited non-zero
  Terminated,       // engine stopped by terminate(); pause, not a failure
  NotFound,         // unknown task id
  Conflict,         // operation not allowed in the task's current state
  Storage           // catalog directory could not be read or written
};

struct ConvertError {
  ErrorCode code;
  std::string message;
};

inline std::string_view toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::Validation: return "ValidationError";
    case ErrorCode::UnreadableMedia: return "UnreadableMedia";
    case ErrorCode::Spawn: return "SpawnError";
    case ErrorCode::Encode: return "EncodeError";
    case ErrorCode::Terminated: return "Terminated";
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::Conflict: return "Conflict";
    case ErrorCode::Storage: return "StorageError";
  }
  return "Unknown";
}

inline ConvertError validationError(std::string message) {
  return ConvertError{ErrorCode::Validation, std::move(message)};
}

} // namespace convert_service
