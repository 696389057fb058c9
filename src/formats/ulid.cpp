#include "uidkit/formats/ulid.h"

#include "uidkit/codec/alphabets.h"
#include "uidkit/codec/base_codec.h"

#include <utility>

namespace uidkit::formats {

namespace {

const codec::Alphabet& crockford_alphabet() {
  static const codec::Alphabet alphabet =
      codec::Alphabet::create(codec::kCrockfordBase32).take_value();
  return alphabet;
}

char to_upper_ascii(const char ch) {
  if (ch >= 'a' && ch <= 'z') {
    constexpr char kCaseOffset = 'a' - 'A';
    return static_cast<char>(ch - kCaseOffset);
  }
  return ch;
}

}  // namespace

std::optional<std::uint8_t> decode_crockford(const char ch) {
  const int index = crockford_alphabet().index_of(to_upper_ascii(ch));
  if (index < 0) {
    return std::nullopt;
  }
  return static_cast<std::uint8_t>(index);
}

core::Outcome<std::string> encode_ulid_time(const std::int64_t timestamp_ms) {
  if (timestamp_ms < 0 || timestamp_ms > kUlidMaxTimestampMs) {
    return core::Outcome<std::string>::err(core::make_error(
        core::ErrorCode::kInvalidTimestamp,
        "ULID timestamp must fit in 48 bits, got " + std::to_string(timestamp_ms)));
  }

  auto ts = static_cast<std::uint64_t>(timestamp_ms);
  std::string out(kUlidTimeLength, '0');
  for (std::size_t i = kUlidTimeLength; i-- > 0;) {
    out[i] = codec::kCrockfordBase32[ts & 0x1FU];
    ts >>= 5U;
  }
  return core::Outcome<std::string>::ok(std::move(out));
}

std::string encode_ulid_random(const core::ByteView random) {
  return codec::pad_left(codec::encode(random, crockford_alphabet()), kUlidRandomLength, '0');
}

core::Outcome<std::string> format_ulid(const std::int64_t timestamp_ms,
                                       const core::ByteView random) {
  auto time_part = encode_ulid_time(timestamp_ms);
  if (!time_part.has_value()) {
    return time_part;
  }
  return core::Outcome<std::string>::ok(time_part.value() + encode_ulid_random(random));
}

core::Outcome<std::string> generate_ulid(core::IRandomSource& random,
                                         const std::int64_t timestamp_ms) {
  auto drawn = random.bytes(kUlidRandomBytes);
  if (!drawn.has_value()) {
    return core::Outcome<std::string>::err(drawn.error());
  }
  return format_ulid(timestamp_ms, drawn.value());
}

bool is_valid_ulid(const std::string_view id) {
  if (id.size() != kUlidLength) {
    return false;
  }
  // 26 digits carry 130 bits; a leading digit above 7 overflows the 128-bit value.
  const auto first = decode_crockford(id[0]);
  if (!first.has_value() || *first > 7) {
    return false;
  }
  for (const char ch : id) {
    if (!decode_crockford(ch).has_value()) {
      return false;
    }
  }
  return true;
}

std::optional<UlidFields> parse_ulid(const std::string_view id) {
  if (!is_valid_ulid(id)) {
    return std::nullopt;
  }

  std::uint64_t ts = 0;
  for (std::size_t i = 0; i < kUlidTimeLength; ++i) {
    ts = (ts << 5U) | *decode_crockford(id[i]);
  }

  std::string random_part;
  random_part.reserve(kUlidRandomLength);
  for (std::size_t i = kUlidTimeLength; i < kUlidLength; ++i) {
    random_part.push_back(to_upper_ascii(id[i]));
  }
  auto random = codec::decode_fixed(random_part, crockford_alphabet(), kUlidRandomBytes);
  if (!random.has_value()) {
    return std::nullopt;
  }

  UlidFields fields;
  fields.timestamp_ms = static_cast<std::int64_t>(ts);
  fields.random = random.take_value();
  fields.bytes.reserve(6 + kUlidRandomBytes);
  for (std::size_t i = 0; i < 6; ++i) {
    fields.bytes.push_back(static_cast<std::uint8_t>((ts >> (8U * (5U - i))) & 0xFFU));
  }
  fields.bytes.insert(fields.bytes.end(), fields.random.begin(), fields.random.end());
  return fields;
}

std::optional<std::int64_t> ulid_timestamp(const std::string_view id) {
  const auto fields = parse_ulid(id);
  if (!fields.has_value()) {
    return std::nullopt;
  }
  return fields->timestamp_ms;
}

}  // namespace uidkit::formats
