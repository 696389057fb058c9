#pragma once

#include "uidkit/core/bytes.h"
#include "uidkit/core/clock.h"
#include "uidkit/core/error.h"
#include "uidkit/core/random_source.h"

#include <cstdint>
#include <mutex>
#include <string>

namespace uidkit::generators {

// MonotonicUlidGenerator produces ULIDs that sort strictly increasing for one instance.
//
// Within one millisecond the previous 80-bit random value is incremented (big-endian,
// with carry) instead of drawing a fresh one. Any other clock reading, including one
// that went backwards, draws a fresh random value and restarts the state at that
// millisecond, so every ID carries the time it was generated.
// An increment that overflows 80 bits fails with kSequenceExhausted and leaves state
// untouched.
//
// Thread-safe: every read and update of the state happens under one mutex.
class MonotonicUlidGenerator {
 public:
  MonotonicUlidGenerator(core::IRandomSource& random, core::IClock& clock)
      : random_(random), clock_(clock) {}
  ~MonotonicUlidGenerator() = default;

  // Disable copy/move (mutex not copyable)
  MonotonicUlidGenerator(const MonotonicUlidGenerator&) = delete;
  MonotonicUlidGenerator& operator=(const MonotonicUlidGenerator&) = delete;
  MonotonicUlidGenerator(MonotonicUlidGenerator&&) = delete;
  MonotonicUlidGenerator& operator=(MonotonicUlidGenerator&&) = delete;

  [[nodiscard]] core::Outcome<std::string> next();

 private:
  struct GeneratorState {
    std::int64_t last_timestamp_ms{-1};  // -1 until the first successful call
    core::Bytes last_random;             // 10 bytes once initialised
  };

  core::IRandomSource& random_;
  core::IClock& clock_;
  std::mutex mutex_;
  GeneratorState state_;
};

// increment_big_endian adds one to value with carry. Returns false on overflow of all
// bytes, in which case value is left unchanged.
[[nodiscard]] bool increment_big_endian(core::Bytes& value);

}  // namespace uidkit::generators
