#pragma once

#include "uidkit/core/bytes.h"
#include "uidkit/core/error.h"
#include "uidkit/core/random_source.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace uidkit::formats {

// ULID layout: 10 Crockford Base32 time digits (48-bit ms) + 16 random digits (80 bits).
inline constexpr std::size_t kUlidLength = 26;
inline constexpr std::size_t kUlidTimeLength = 10;
inline constexpr std::size_t kUlidRandomLength = 16;
inline constexpr std::size_t kUlidRandomBytes = 10;
inline constexpr std::int64_t kUlidMaxTimestampMs = (std::int64_t{1} << 48) - 1;

struct UlidFields {
  std::int64_t timestamp_ms{0};
  core::Bytes random;  // 10 bytes
  core::Bytes bytes;   // 16 bytes: timestamp big-endian followed by random
};

// decode_crockford maps one Crockford Base32 digit (either case) to its value.
// I, L, O and U are rejected like any other non-alphabet character.
[[nodiscard]] std::optional<std::uint8_t> decode_crockford(char ch);

// encode_ulid_time renders a 48-bit timestamp as 10 digits, most significant first.
// Fails with kInvalidTimestamp outside [0, 2^48).
[[nodiscard]] core::Outcome<std::string> encode_ulid_time(std::int64_t timestamp_ms);

// encode_ulid_random renders 10 random bytes as exactly 16 digits (left-padded with '0').
[[nodiscard]] std::string encode_ulid_random(core::ByteView random);

// format_ulid concatenates the time and random parts.
[[nodiscard]] core::Outcome<std::string> format_ulid(std::int64_t timestamp_ms,
                                                     core::ByteView random);

[[nodiscard]] core::Outcome<std::string> generate_ulid(core::IRandomSource& random,
                                                       std::int64_t timestamp_ms);

// is_valid_ulid accepts 26 Crockford digits (either case) whose first digit is at most '7'.
[[nodiscard]] bool is_valid_ulid(std::string_view id);

[[nodiscard]] std::optional<UlidFields> parse_ulid(std::string_view id);
[[nodiscard]] std::optional<std::int64_t> ulid_timestamp(std::string_view id);

}  // namespace uidkit::formats
