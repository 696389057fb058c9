#include "uidkit/engine/format.h"

namespace uidkit::engine {

std::string_view to_string(const Format format) {
  switch (format) {
    case Format::kUuidV4:
      return "uuid-v4";
    case Format::kUuidV7:
      return "uuid-v7";
    case Format::kUlid:
      return "ulid";
    case Format::kUlidMonotonic:
      return "ulid-monotonic";
    case Format::kNanoid:
      return "nanoid";
    case Format::kCuid2:
      return "cuid2";
    case Format::kSnowflake:
      return "snowflake";
    case Format::kShortBase58:
      return "short-base58";
    case Format::kShortBase62:
      return "short-base62";
    case Format::kShortYoutube:
      return "short-youtube";
  }
  return "unknown";  // unreachable — all enumerators covered above
}

std::optional<Format> parse_format(const std::string_view name) {
  if (name == "uuid") {
    return Format::kUuidV4;
  }
  if (name == "short") {
    return Format::kShortBase58;
  }
  for (const Format format : kAllFormats) {
    if (to_string(format) == name) {
      return format;
    }
  }
  return std::nullopt;
}

bool is_stateful(const Format format) {
  switch (format) {
    case Format::kUlidMonotonic:
    case Format::kSnowflake:
      return true;
    case Format::kUuidV4:
    case Format::kUuidV7:
    case Format::kUlid:
    case Format::kNanoid:
    case Format::kCuid2:
    case Format::kShortBase58:
    case Format::kShortBase62:
    case Format::kShortYoutube:
      return false;
  }
  return false;  // unreachable — all enumerators covered above
}

}  // namespace uidkit::engine
