#include "uidkit/codec/base_codec.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace uidkit::codec {

namespace {

// Multiplies the big-endian integer in `value` by `base` and adds `digit`, growing as needed.
void multiply_add(core::Bytes& value, const std::uint32_t base, const std::uint32_t digit) {
  std::uint32_t carry = digit;
  for (std::size_t i = value.size(); i-- > 0;) {
    const std::uint32_t acc = static_cast<std::uint32_t>(value[i]) * base + carry;
    value[i] = static_cast<std::uint8_t>(acc & 0xFFU);
    carry = acc >> 8;
  }
  while (carry != 0) {
    value.insert(value.begin(), static_cast<std::uint8_t>(carry & 0xFFU));
    carry >>= 8;
  }
}

// Accumulates text into a minimal big-endian integer (no leading zero bytes).
core::Outcome<core::Bytes> accumulate(const std::string_view text, const Alphabet& alphabet) {
  core::Bytes value;
  const auto base = static_cast<std::uint32_t>(alphabet.size());
  for (std::size_t pos = 0; pos < text.size(); ++pos) {
    const int digit = alphabet.index_of(text[pos]);
    if (digit < 0) {
      return core::Outcome<core::Bytes>::err(core::make_error(
          core::ErrorCode::kInvalidCharacter,
          "character '" + std::string(1, text[pos]) + "' at position " + std::to_string(pos) +
              " is not in the alphabet"));
    }
    multiply_add(value, base, static_cast<std::uint32_t>(digit));
  }
  return core::Outcome<core::Bytes>::ok(std::move(value));
}

}  // namespace

std::string encode(const core::ByteView bytes, const Alphabet& alphabet) {
  core::Bytes number(bytes.begin(), bytes.end());
  const auto base = static_cast<std::uint32_t>(alphabet.size());

  std::size_t start = 0;
  while (start < number.size() && number[start] == 0) {
    ++start;
  }

  std::string out;
  while (start < number.size()) {
    std::uint32_t remainder = 0;
    for (std::size_t i = start; i < number.size(); ++i) {
      const std::uint32_t acc = (remainder << 8) | number[i];
      number[i] = static_cast<std::uint8_t>(acc / base);
      remainder = acc % base;
    }
    out.push_back(alphabet.at(remainder));
    while (start < number.size() && number[start] == 0) {
      ++start;
    }
  }

  std::reverse(out.begin(), out.end());
  return out;
}

core::Outcome<std::string> encode(const core::ByteView bytes, const std::string_view alphabet) {
  auto created = Alphabet::create(alphabet);
  if (!created.has_value()) {
    return core::Outcome<std::string>::err(created.error());
  }
  return core::Outcome<std::string>::ok(encode(bytes, created.value()));
}

core::Outcome<core::Bytes> decode(const std::string_view text, const Alphabet& alphabet) {
  auto accumulated = accumulate(text, alphabet);
  if (!accumulated.has_value()) {
    return accumulated;
  }
  core::Bytes value = accumulated.take_value();

  const std::size_t width = decoded_byte_length(text.size(), alphabet.size());
  if (value.size() < width) {
    value.insert(value.begin(), width - value.size(), 0);
  }
  return core::Outcome<core::Bytes>::ok(std::move(value));
}

core::Outcome<core::Bytes> decode(const std::string_view text, const std::string_view alphabet) {
  auto created = Alphabet::create(alphabet);
  if (!created.has_value()) {
    return core::Outcome<core::Bytes>::err(created.error());
  }
  return decode(text, created.value());
}

core::Outcome<core::Bytes> decode_fixed(const std::string_view text, const Alphabet& alphabet,
                                        const std::size_t byte_length) {
  auto accumulated = accumulate(text, alphabet);
  if (!accumulated.has_value()) {
    return accumulated;
  }
  core::Bytes value = accumulated.take_value();

  if (value.size() > byte_length) {
    return core::Outcome<core::Bytes>::err(core::make_error(
        core::ErrorCode::kInvalidSize, "decoded value needs " + std::to_string(value.size()) +
                                           " bytes, expected at most " +
                                           std::to_string(byte_length)));
  }
  value.insert(value.begin(), byte_length - value.size(), 0);
  return core::Outcome<core::Bytes>::ok(std::move(value));
}

std::size_t decoded_byte_length(const std::size_t symbol_count, const std::size_t base) {
  if (symbol_count == 0 || base < 2) {
    return 0;
  }
  const double bits = static_cast<double>(symbol_count) * std::log2(static_cast<double>(base));
  // Power-of-two bases give exact bit counts; trim float noise before rounding up.
  return static_cast<std::size_t>(std::ceil(bits / 8.0 - 1e-9));
}

std::string pad_left(std::string text, const std::size_t width, const char fill) {
  if (text.size() < width) {
    text.insert(text.begin(), width - text.size(), fill);
  }
  return text;
}

}  // namespace uidkit::codec
