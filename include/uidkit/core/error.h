#pragma once

#include "uidkit/core/result.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace uidkit::core {

// ErrorCode follows E.14 (use purpose-designed types as error indicators).
// Every fallible engine operation reports exactly one of these codes.
enum class ErrorCode : uint8_t {
  kInvalidAlphabet,       // alphabet shorter than 2 symbols or containing duplicates
  kInvalidSize,           // size, length or identity field outside the allowed range
  kInvalidCharacter,      // decode/parse met a character outside the alphabet
  kInvalidTimestamp,      // timestamp negative or too wide for the bit layout
  kNotConfigured,         // Snowflake generation before configuration
  kAlreadyConfigured,     // Snowflake configuration applied twice
  kClockMovedBackward,    // wall clock regressed during Snowflake generation
  kSequenceExhausted,     // monotonic ULID increment overflowed inside one millisecond
  kNoSecureRandomSource,  // no CSPRNG available in this environment
};

struct Error {
  ErrorCode code;
  std::string message;
};

template <typename T>
using Outcome = Result<T, Error>;

// to_string returns the canonical upper-snake-case name of an ErrorCode.
// The returned string_view is a string literal and is always valid.
[[nodiscard]] std::string_view to_string(ErrorCode code);

// format_error renders "<CODE>: <message>" for logs and CLI output.
[[nodiscard]] std::string format_error(const Error& error);

[[nodiscard]] inline Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

}  // namespace uidkit::core
