#pragma once

#include "uidkit/core/error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace uidkit::formats {

// 64-bit layout, MSB to LSB:
//   41 bits (timestamp - epoch) | 5 bits datacenter_id | 5 bits worker_id | 12 bits sequence
inline constexpr unsigned kSnowflakeSequenceBits = 12;
inline constexpr unsigned kSnowflakeWorkerShift = 12;
inline constexpr unsigned kSnowflakeDatacenterShift = 17;
inline constexpr unsigned kSnowflakeTimestampShift = 22;

inline constexpr int kSnowflakeMaxNodeId = 31;
inline constexpr std::uint32_t kSnowflakeMaxSequence = 4095;
inline constexpr std::int64_t kSnowflakeMaxTimestampDelta = (std::int64_t{1} << 41) - 1;
inline constexpr std::size_t kSnowflakeMaxDigits = 20;

// Epochs share the 48-bit millisecond range of UUIDv7 and ULID timestamps, so
// epoch + (2^41 - 1) always fits in int64.
inline constexpr std::int64_t kSnowflakeMaxEpochMs = (std::int64_t{1} << 48) - 1;

// 2021-01-01T00:00:00Z
inline constexpr std::int64_t kDefaultSnowflakeEpochMs = 1609459200000;

// SnowflakeConfig identifies one logical generator. Worker and datacenter IDs are
// assigned externally; nothing here coordinates across processes.
struct SnowflakeConfig {
  int worker_id{0};      // NOLINT(misc-non-private-member-variables-in-classes)
  int datacenter_id{0};  // NOLINT(misc-non-private-member-variables-in-classes)
  std::int64_t epoch_ms{kDefaultSnowflakeEpochMs};

  bool operator==(const SnowflakeConfig&) const = default;
};

struct SnowflakeFields {
  std::int64_t timestamp_ms{0};  // absolute: relative timestamp + epoch
  std::uint32_t datacenter_id{0};
  std::uint32_t worker_id{0};
  std::uint32_t sequence{0};
};

// validate_snowflake_config: worker/datacenter in [0, 31] (kInvalidSize) and
// an epoch in [0, kSnowflakeMaxEpochMs] (kInvalidTimestamp).
[[nodiscard]] core::Outcome<bool> validate_snowflake_config(const SnowflakeConfig& config);

// compose_snowflake packs the layout above. Fails with kInvalidTimestamp when
// timestamp_ms precedes the epoch or the delta exceeds 41 bits, and with kInvalidSize
// when sequence exceeds 4095.
[[nodiscard]] core::Outcome<std::uint64_t> compose_snowflake(std::int64_t timestamp_ms,
                                                             std::uint32_t sequence,
                                                             const SnowflakeConfig& config);

// decompose_snowflake is the shift-and-mask inverse of compose_snowflake.
// epoch_ms must lie in [0, kSnowflakeMaxEpochMs].
[[nodiscard]] SnowflakeFields decompose_snowflake(std::uint64_t value, std::int64_t epoch_ms);

// parse_snowflake_value reads a decimal string. Non-digits fail with kInvalidCharacter;
// empty input, more than 20 digits or a value above UINT64_MAX fail with kInvalidSize.
[[nodiscard]] core::Outcome<std::uint64_t> parse_snowflake_value(std::string_view id);

// parse_snowflake fails with kInvalidTimestamp when epoch_ms is outside
// [0, kSnowflakeMaxEpochMs], otherwise as parse_snowflake_value.
[[nodiscard]] core::Outcome<SnowflakeFields> parse_snowflake(
    std::string_view id, std::int64_t epoch_ms = kDefaultSnowflakeEpochMs);

// is_valid_snowflake is syntactic only: 1-20 decimal digits fitting in 64 bits.
[[nodiscard]] bool is_valid_snowflake(std::string_view id);

}  // namespace uidkit::formats
