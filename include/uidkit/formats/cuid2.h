#pragma once

#include "uidkit/core/error.h"
#include "uidkit/core/random_source.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace uidkit::formats {

inline constexpr std::size_t kCuid2DefaultLength = 24;
inline constexpr std::size_t kCuid2MinLength = 24;
inline constexpr std::size_t kCuid2MaxLength = 32;

// Minimum number of random base36 digits, however long the timestamp and fingerprint are.
inline constexpr std::size_t kCuid2MinRandomDigits = 8;
// Bytes drawn beyond the minimum for the random digits, bounding the reduction bias.
inline constexpr std::size_t kCuid2ReductionBytes = 8;

// default_cuid2_fingerprint: first three alphanumeric characters of the host name plus
// (pid mod 1000) in base36, lower-cased. Stable for the life of the process.
[[nodiscard]] std::string default_cuid2_fingerprint();

// normalize_cuid2_fingerprint lower-cases fingerprint; any non-alphanumeric character
// fails with kInvalidCharacter.
[[nodiscard]] core::Outcome<std::string> normalize_cuid2_fingerprint(std::string_view fingerprint);

// generate_cuid2 concatenates, then truncates to `length`:
//   one random letter | now_ms in base36 | random base36 digits | fingerprint
// The random segment is sized to fill the remainder (at least 8 digits).
// Errors: kInvalidSize (length outside [24, 32]), kInvalidTimestamp (now_ms < 0),
// kInvalidCharacter (fingerprint), or the random source's error.
[[nodiscard]] core::Outcome<std::string> generate_cuid2(core::IRandomSource& random,
                                                        std::int64_t now_ms, std::size_t length,
                                                        std::string_view fingerprint);

// is_valid_cuid2: length in [24, 32], a lower-case leading letter, all-alphanumeric body.
[[nodiscard]] bool is_valid_cuid2(std::string_view id);

}  // namespace uidkit::formats
