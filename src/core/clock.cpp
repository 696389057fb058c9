#include "uidkit/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace uidkit::core {

std::int64_t SystemClock::now_millis() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

std::int64_t FixedClock::now_millis() {
  return millis_.load(std::memory_order_acquire);
}

void FixedClock::set(const std::int64_t millis) {
  millis_.store(millis, std::memory_order_release);
}

void FixedClock::advance(const std::int64_t delta_millis) {
  millis_.fetch_add(delta_millis, std::memory_order_acq_rel);
}

std::string format_iso8601_millis(const std::int64_t millis) {
  // Floor division so pre-1970 values keep a non-negative millisecond part.
  std::int64_t seconds = millis / 1000;
  std::int64_t remainder = millis % 1000;
  if (remainder < 0) {
    remainder += 1000;
    --seconds;
  }

  const auto time_t_value = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << remainder << 'Z';
  return oss.str();
}

}  // namespace uidkit::core
