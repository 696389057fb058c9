#include "uidkit/generators/monotonic_ulid_generator.h"

#include "uidkit/formats/ulid.h"

#include <utility>

namespace uidkit::generators {

bool increment_big_endian(core::Bytes& value) {
  for (std::size_t i = value.size(); i-- > 0;) {
    if (value[i] != 0xFF) {
      ++value[i];
      for (std::size_t j = i + 1; j < value.size(); ++j) {
        value[j] = 0;
      }
      return true;
    }
  }
  return false;
}

core::Outcome<std::string> MonotonicUlidGenerator::next() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::int64_t now = clock_.now_millis();

  if (now == state_.last_timestamp_ms) {
    core::Bytes incremented = state_.last_random;
    if (!increment_big_endian(incremented)) {
      return core::Outcome<std::string>::err(core::make_error(
          core::ErrorCode::kSequenceExhausted,
          "monotonic ULID random component exhausted within millisecond " +
              std::to_string(state_.last_timestamp_ms)));
    }
    auto id = formats::format_ulid(state_.last_timestamp_ms, incremented);
    if (id.has_value()) {
      state_.last_random = std::move(incremented);
    }
    return id;
  }

  auto drawn = random_.bytes(formats::kUlidRandomBytes);
  if (!drawn.has_value()) {
    return core::Outcome<std::string>::err(drawn.error());
  }
  auto id = formats::format_ulid(now, drawn.value());
  if (id.has_value()) {
    state_.last_timestamp_ms = now;
    state_.last_random = drawn.take_value();
  }
  return id;
}

}  // namespace uidkit::generators
