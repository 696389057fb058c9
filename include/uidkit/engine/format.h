#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace uidkit::engine {

// Format is the closed set of identifier families the engine dispatches over.
// Every switch on Format must cover all enumerators; adding a format is a compile-time
// change, never a runtime lookup.
enum class Format : uint8_t {
  kUuidV4,
  kUuidV7,
  kUlid,
  kUlidMonotonic,
  kNanoid,
  kCuid2,
  kSnowflake,
  kShortBase58,
  kShortBase62,
  kShortYoutube,
};

inline constexpr std::array<Format, 10> kAllFormats = {
    Format::kUuidV4,      Format::kUuidV7,      Format::kUlid,      Format::kUlidMonotonic,
    Format::kNanoid,      Format::kCuid2,       Format::kSnowflake, Format::kShortBase58,
    Format::kShortBase62, Format::kShortYoutube,
};

// to_string returns the canonical format name ("uuid-v4", "short-base58", ...).
[[nodiscard]] std::string_view to_string(Format format);

// parse_format accepts canonical names plus the aliases "uuid" (uuid-v4) and
// "short" (short-base58). Case-sensitive.
[[nodiscard]] std::optional<Format> parse_format(std::string_view name);

// True for the formats that share one sequence of IDs per engine instance.
[[nodiscard]] bool is_stateful(Format format);

}  // namespace uidkit::engine
