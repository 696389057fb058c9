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

inline constexpr std::size_t kUuidByteLength = 16;
inline constexpr std::size_t kUuidStringLength = 36;

// Largest timestamp representable in the 48-bit UUIDv7 unix_ts_ms field.
inline constexpr std::int64_t kUuidV7MaxTimestampMs = (std::int64_t{1} << 48) - 1;

// RFC 4122 §4.1.1 variant, decoded from the top bits of octet 8.
enum class UuidVariant : uint8_t {
  kNcs,        // 0xx
  kRfc4122,    // 10x
  kMicrosoft,  // 110
  kFuture,     // 111
};

[[nodiscard]] std::string_view to_string(UuidVariant variant);

struct UuidFields {
  int version{0};  // high nibble of octet 6
  UuidVariant variant{UuidVariant::kNcs};
  core::Bytes bytes;                         // 16 bytes
  std::optional<std::int64_t> timestamp_ms;  // version 7 only
};

// generate_uuid_v4 draws 16 random bytes and stamps version 4 and the RFC 4122 variant.
[[nodiscard]] core::Outcome<std::string> generate_uuid_v4(core::IRandomSource& random);

// generate_uuid_v7 writes timestamp_ms big-endian into octets 0-5, fills the rest with
// random bytes, then stamps version 7 and the RFC 4122 variant.
// Fails with kInvalidTimestamp outside [0, 2^48).
[[nodiscard]] core::Outcome<std::string> generate_uuid_v7(core::IRandomSource& random,
                                                          std::int64_t timestamp_ms);

// format_uuid renders 16 bytes in lower-case 8-4-4-4-12 form.
[[nodiscard]] std::string format_uuid(core::ByteView bytes);

// is_valid_uuid checks the canonical 8-4-4-4-12 hex pattern (either case) only.
// Version and variant are not enforced.
[[nodiscard]] bool is_valid_uuid(std::string_view id);

// parse_uuid returns nullopt when is_valid_uuid(id) is false.
[[nodiscard]] std::optional<UuidFields> parse_uuid(std::string_view id);

// uuid_v7_timestamp returns the embedded millisecond timestamp of a version 7 UUID.
[[nodiscard]] std::optional<std::int64_t> uuid_v7_timestamp(std::string_view id);

}  // namespace uidkit::formats
