#pragma once

#include "uidkit/core/clock.h"
#include "uidkit/core/error.h"
#include "uidkit/formats/snowflake.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace uidkit::generators {

// SnowflakeGenerator owns the sequence state for one (worker_id, datacenter_id) identity.
// Create one instance per logical worker; two instances with the same identity can
// produce duplicate IDs.
//
// Per call:
// - now < last timestamp: fail with kClockMovedBackward, state untouched
// - now == last timestamp: sequence = (sequence + 1) mod 4096; on wraparound, yield until
//   the clock passes the last timestamp and stamp the ID with the new millisecond
// - now > last timestamp: sequence = 0
//
// Thread-safe: calls are serialised by an internal mutex.
class SnowflakeGenerator {
 public:
  // create validates config (see formats::validate_snowflake_config).
  [[nodiscard]] static core::Outcome<std::unique_ptr<SnowflakeGenerator>> create(
      const formats::SnowflakeConfig& config, core::IClock& clock);

  ~SnowflakeGenerator() = default;

  // Disable copy/move (mutex not copyable)
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  [[nodiscard]] core::Outcome<std::uint64_t> next_id();

  // next renders next_id() in decimal.
  [[nodiscard]] core::Outcome<std::string> next();

  [[nodiscard]] const formats::SnowflakeConfig& config() const { return config_; }

 private:
  SnowflakeGenerator(const formats::SnowflakeConfig& config, core::IClock& clock)
      : config_(config), clock_(clock) {}

  struct GeneratorState {
    std::int64_t last_timestamp_ms{-1};
    std::uint32_t sequence{0};
  };

  const formats::SnowflakeConfig config_;
  core::IClock& clock_;
  std::mutex mutex_;
  GeneratorState state_;
};

}  // namespace uidkit::generators
