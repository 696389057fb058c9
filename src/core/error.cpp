#include "uidkit/core/error.h"

namespace uidkit::core {

std::string_view to_string(const ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidAlphabet:
      return "INVALID_ALPHABET";
    case ErrorCode::kInvalidSize:
      return "INVALID_SIZE";
    case ErrorCode::kInvalidCharacter:
      return "INVALID_CHARACTER";
    case ErrorCode::kInvalidTimestamp:
      return "INVALID_TIMESTAMP";
    case ErrorCode::kNotConfigured:
      return "NOT_CONFIGURED";
    case ErrorCode::kAlreadyConfigured:
      return "ALREADY_CONFIGURED";
    case ErrorCode::kClockMovedBackward:
      return "CLOCK_MOVED_BACKWARD";
    case ErrorCode::kSequenceExhausted:
      return "SEQUENCE_EXHAUSTED";
    case ErrorCode::kNoSecureRandomSource:
      return "NO_SECURE_RANDOM_SOURCE";
  }
  return "UNKNOWN";  // unreachable — all enumerators covered above
}

std::string format_error(const Error& error) {
  std::string out{to_string(error.code)};
  if (!error.message.empty()) {
    out += ": ";
    out += error.message;
  }
  return out;
}

}  // namespace uidkit::core
