#include "uidkit/formats/snowflake.h"

#include <limits>

namespace uidkit::formats {

namespace {

bool epoch_in_range(const std::int64_t epoch_ms) {
  return epoch_ms >= 0 && epoch_ms <= kSnowflakeMaxEpochMs;
}

core::Error epoch_error(const std::int64_t epoch_ms) {
  return core::make_error(core::ErrorCode::kInvalidTimestamp,
                          "epoch must be between 0 and " + std::to_string(kSnowflakeMaxEpochMs) +
                              ", got " + std::to_string(epoch_ms));
}

}  // namespace

core::Outcome<bool> validate_snowflake_config(const SnowflakeConfig& config) {
  if (config.worker_id < 0 || config.worker_id > kSnowflakeMaxNodeId) {
    return core::Outcome<bool>::err(core::make_error(
        core::ErrorCode::kInvalidSize,
        "worker_id must be between 0 and 31, got " + std::to_string(config.worker_id)));
  }
  if (config.datacenter_id < 0 || config.datacenter_id > kSnowflakeMaxNodeId) {
    return core::Outcome<bool>::err(core::make_error(
        core::ErrorCode::kInvalidSize,
        "datacenter_id must be between 0 and 31, got " + std::to_string(config.datacenter_id)));
  }
  if (!epoch_in_range(config.epoch_ms)) {
    return core::Outcome<bool>::err(epoch_error(config.epoch_ms));
  }
  return core::Outcome<bool>::ok(true);
}

core::Outcome<std::uint64_t> compose_snowflake(const std::int64_t timestamp_ms,
                                               const std::uint32_t sequence,
                                               const SnowflakeConfig& config) {
  const std::int64_t delta = timestamp_ms - config.epoch_ms;
  if (delta < 0 || delta > kSnowflakeMaxTimestampDelta) {
    return core::Outcome<std::uint64_t>::err(core::make_error(
        core::ErrorCode::kInvalidTimestamp,
        "timestamp " + std::to_string(timestamp_ms) + " is outside the 41-bit window of epoch " +
            std::to_string(config.epoch_ms)));
  }
  if (sequence > kSnowflakeMaxSequence) {
    return core::Outcome<std::uint64_t>::err(
        core::make_error(core::ErrorCode::kInvalidSize,
                         "sequence must be at most 4095, got " + std::to_string(sequence)));
  }

  const std::uint64_t value =
      (static_cast<std::uint64_t>(delta) << kSnowflakeTimestampShift) |
      (static_cast<std::uint64_t>(config.datacenter_id & 0x1F) << kSnowflakeDatacenterShift) |
      (static_cast<std::uint64_t>(config.worker_id & 0x1F) << kSnowflakeWorkerShift) |
      static_cast<std::uint64_t>(sequence);
  return core::Outcome<std::uint64_t>::ok(value);
}

SnowflakeFields decompose_snowflake(const std::uint64_t value, const std::int64_t epoch_ms) {
  SnowflakeFields fields;
  fields.timestamp_ms =
      static_cast<std::int64_t>((value >> kSnowflakeTimestampShift) & 0x1FFFFFFFFFFULL) +
      epoch_ms;
  fields.datacenter_id = static_cast<std::uint32_t>((value >> kSnowflakeDatacenterShift) & 0x1FU);
  fields.worker_id = static_cast<std::uint32_t>((value >> kSnowflakeWorkerShift) & 0x1FU);
  fields.sequence = static_cast<std::uint32_t>(value & kSnowflakeMaxSequence);
  return fields;
}

core::Outcome<std::uint64_t> parse_snowflake_value(const std::string_view id) {
  if (id.empty() || id.size() > kSnowflakeMaxDigits) {
    return core::Outcome<std::uint64_t>::err(core::make_error(
        core::ErrorCode::kInvalidSize,
        "snowflake must have 1 to 20 digits, got " + std::to_string(id.size())));
  }

  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t value = 0;
  for (std::size_t pos = 0; pos < id.size(); ++pos) {
    const char ch = id[pos];
    if (ch < '0' || ch > '9') {
      return core::Outcome<std::uint64_t>::err(core::make_error(
          core::ErrorCode::kInvalidCharacter,
          "snowflake contains non-digit '" + std::string(1, ch) + "' at position " +
              std::to_string(pos)));
    }
    const auto digit = static_cast<std::uint64_t>(ch - '0');
    if (value > (kMax - digit) / 10) {
      return core::Outcome<std::uint64_t>::err(core::make_error(
          core::ErrorCode::kInvalidSize, "snowflake value exceeds 64 bits"));
    }
    value = value * 10 + digit;
  }
  return core::Outcome<std::uint64_t>::ok(value);
}

core::Outcome<SnowflakeFields> parse_snowflake(const std::string_view id,
                                               const std::int64_t epoch_ms) {
  if (!epoch_in_range(epoch_ms)) {
    return core::Outcome<SnowflakeFields>::err(epoch_error(epoch_ms));
  }
  auto value = parse_snowflake_value(id);
  if (!value.has_value()) {
    return core::Outcome<SnowflakeFields>::err(value.error());
  }
  return core::Outcome<SnowflakeFields>::ok(decompose_snowflake(value.value(), epoch_ms));
}

bool is_valid_snowflake(const std::string_view id) {
  return parse_snowflake_value(id).has_value();
}

}  // namespace uidkit::formats
