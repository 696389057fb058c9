#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uidkit::core {

using Bytes = std::vector<std::uint8_t>;
using ByteView = std::span<const std::uint8_t>;

// to_hex returns the lower-case hexadecimal rendering of bytes (two digits per byte).
[[nodiscard]] std::string to_hex(ByteView bytes);

// from_hex parses a hexadecimal string (either case) into bytes.
// Returns nullopt on odd length or any non-hex character.
[[nodiscard]] std::optional<Bytes> from_hex(std::string_view hex);

// hex_digit_value maps '0'-'9', 'a'-'f', 'A'-'F' to 0-15; returns -1 otherwise.
[[nodiscard]] constexpr int hex_digit_value(const char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace uidkit::core
