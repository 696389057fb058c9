#include "uidkit/formats/uuid.h"

#include <algorithm>
#include <array>
#include <utility>

namespace uidkit::formats {

namespace {

constexpr std::array<std::size_t, 4> kHyphenPositions = {8, 13, 18, 23};

bool is_hyphen_position(const std::size_t pos) {
  for (const std::size_t hyphen : kHyphenPositions) {
    if (pos == hyphen) {
      return true;
    }
  }
  return false;
}

// RFC 4122 §4.1.3 / RFC 9562 §5: version lives in the high nibble of octet 6,
// the variant in the top two bits of octet 8.
void stamp_version_and_variant(core::Bytes& bytes, const std::uint8_t version) {
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0FU) | (version << 4U));
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3FU) | 0x80U);
}

UuidVariant decode_variant(const std::uint8_t octet) {
  if ((octet & 0x80U) == 0) {
    return UuidVariant::kNcs;
  }
  if ((octet & 0xC0U) == 0x80U) {
    return UuidVariant::kRfc4122;
  }
  if ((octet & 0xE0U) == 0xC0U) {
    return UuidVariant::kMicrosoft;
  }
  return UuidVariant::kFuture;
}

}  // namespace

std::string_view to_string(const UuidVariant variant) {
  switch (variant) {
    case UuidVariant::kNcs:
      return "NCS";
    case UuidVariant::kRfc4122:
      return "RFC4122";
    case UuidVariant::kMicrosoft:
      return "Microsoft";
    case UuidVariant::kFuture:
      return "Future";
  }
  return "unknown";  // unreachable — all enumerators covered above
}

core::Outcome<std::string> generate_uuid_v4(core::IRandomSource& random) {
  auto drawn = random.bytes(kUuidByteLength);
  if (!drawn.has_value()) {
    return core::Outcome<std::string>::err(drawn.error());
  }
  core::Bytes bytes = drawn.take_value();
  stamp_version_and_variant(bytes, 4);
  return core::Outcome<std::string>::ok(format_uuid(bytes));
}

core::Outcome<std::string> generate_uuid_v7(core::IRandomSource& random,
                                            const std::int64_t timestamp_ms) {
  if (timestamp_ms < 0 || timestamp_ms > kUuidV7MaxTimestampMs) {
    return core::Outcome<std::string>::err(core::make_error(
        core::ErrorCode::kInvalidTimestamp,
        "UUIDv7 timestamp must fit in 48 bits, got " + std::to_string(timestamp_ms)));
  }

  auto drawn = random.bytes(kUuidByteLength - 6);
  if (!drawn.has_value()) {
    return core::Outcome<std::string>::err(drawn.error());
  }
  const core::Bytes& tail = drawn.value();

  core::Bytes bytes(kUuidByteLength, 0);
  const auto ts = static_cast<std::uint64_t>(timestamp_ms);
  for (std::size_t i = 0; i < 6; ++i) {
    bytes[i] = static_cast<std::uint8_t>((ts >> (8U * (5U - i))) & 0xFFU);
  }
  std::copy(tail.begin(), tail.end(), bytes.begin() + 6);
  stamp_version_and_variant(bytes, 7);
  return core::Outcome<std::string>::ok(format_uuid(bytes));
}

std::string format_uuid(const core::ByteView bytes) {
  const std::string hex = core::to_hex(bytes);
  std::string out;
  out.reserve(kUuidStringLength);
  for (std::size_t i = 0; i < hex.size(); ++i) {
    if (is_hyphen_position(out.size())) {
      out.push_back('-');
    }
    out.push_back(hex[i]);
  }
  return out;
}

bool is_valid_uuid(const std::string_view id) {
  if (id.size() != kUuidStringLength) {
    return false;
  }
  for (std::size_t pos = 0; pos < id.size(); ++pos) {
    if (is_hyphen_position(pos)) {
      if (id[pos] != '-') {
        return false;
      }
    } else if (core::hex_digit_value(id[pos]) < 0) {
      return false;
    }
  }
  return true;
}

std::optional<UuidFields> parse_uuid(const std::string_view id) {
  if (!is_valid_uuid(id)) {
    return std::nullopt;
  }

  std::string hex;
  hex.reserve(kUuidByteLength * 2);
  for (const char ch : id) {
    if (ch != '-') {
      hex.push_back(ch);
    }
  }
  auto bytes = core::from_hex(hex);
  if (!bytes.has_value()) {
    return std::nullopt;
  }

  UuidFields fields;
  fields.bytes = std::move(*bytes);
  fields.version = fields.bytes[6] >> 4U;
  fields.variant = decode_variant(fields.bytes[8]);
  if (fields.version == 7) {
    std::uint64_t ts = 0;
    for (std::size_t i = 0; i < 6; ++i) {
      ts = (ts << 8U) | fields.bytes[i];
    }
    fields.timestamp_ms = static_cast<std::int64_t>(ts);
  }
  return fields;
}

std::optional<std::int64_t> uuid_v7_timestamp(const std::string_view id) {
  const auto fields = parse_uuid(id);
  if (!fields.has_value()) {
    return std::nullopt;
  }
  return fields->timestamp_ms;
}

}  // namespace uidkit::formats
