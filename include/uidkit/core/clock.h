#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace uidkit::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests pin or step the clock explicitly.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current time as milliseconds since the Unix epoch (UTC).
  virtual std::int64_t now_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_millis() override;
};

// Fixed clock: returns a settable timestamp for deterministic tests.
// Thread-safe: set()/advance() may race with now_millis() from generator threads.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t fixed_millis) : millis_(fixed_millis) {}
  ~FixedClock() override = default;

  // Not copyable or movable (contains atomic)
  FixedClock(const FixedClock&) = delete;
  FixedClock& operator=(const FixedClock&) = delete;
  FixedClock(FixedClock&&) = delete;
  FixedClock& operator=(FixedClock&&) = delete;

  std::int64_t now_millis() override;

  void set(std::int64_t millis);
  void advance(std::int64_t delta_millis);

 private:
  std::atomic<std::int64_t> millis_;
};

// format_iso8601_millis renders Unix milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
[[nodiscard]] std::string format_iso8601_millis(std::int64_t millis);

}  // namespace uidkit::core
