#include "uidkit/generators/snowflake_generator.h"

#include <thread>

namespace uidkit::generators {

core::Outcome<std::unique_ptr<SnowflakeGenerator>> SnowflakeGenerator::create(
    const formats::SnowflakeConfig& config, core::IClock& clock) {
  auto valid = formats::validate_snowflake_config(config);
  if (!valid.has_value()) {
    return core::Outcome<std::unique_ptr<SnowflakeGenerator>>::err(valid.error());
  }
  // Private constructor: std::make_unique cannot reach it.
  return core::Outcome<std::unique_ptr<SnowflakeGenerator>>::ok(
      std::unique_ptr<SnowflakeGenerator>(new SnowflakeGenerator(config, clock)));
}

core::Outcome<std::uint64_t> SnowflakeGenerator::next_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::int64_t now = clock_.now_millis();

  if (now < state_.last_timestamp_ms) {
    return core::Outcome<std::uint64_t>::err(core::make_error(
        core::ErrorCode::kClockMovedBackward,
        "clock moved backwards by " + std::to_string(state_.last_timestamp_ms - now) +
            "ms; refusing to generate"));
  }

  std::uint32_t sequence = 0;
  if (now == state_.last_timestamp_ms) {
    sequence = (state_.sequence + 1) & formats::kSnowflakeMaxSequence;
    if (sequence == 0) {
      // Sequence space for this millisecond is used up.
      while (now <= state_.last_timestamp_ms) {
        std::this_thread::yield();
        now = clock_.now_millis();
      }
    }
  }

  auto value = formats::compose_snowflake(now, sequence, config_);
  if (value.has_value()) {
    state_.last_timestamp_ms = now;
    state_.sequence = sequence;
  }
  return value;
}

core::Outcome<std::string> SnowflakeGenerator::next() {
  auto value = next_id();
  if (!value.has_value()) {
    return core::Outcome<std::string>::err(value.error());
  }
  return core::Outcome<std::string>::ok(std::to_string(value.value()));
}

}  // namespace uidkit::generators
