#include "uidkit/core/bytes.h"

namespace uidkit::core {

std::string to_hex(const ByteView bytes) {
  constexpr std::string_view kDigits = "0123456789abcdef";

  std::string out;
  out.reserve(bytes.size() * 2);
  for (const std::uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4u]);
    out.push_back(kDigits[b & 0x0Fu]);
  }
  return out;
}

std::optional<Bytes> from_hex(const std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }

  Bytes out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = hex_digit_value(hex[i]);
    const int lo = hex_digit_value(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

}  // namespace uidkit::core
