#pragma once

#include "uidkit/codec/alphabet.h"
#include "uidkit/core/bytes.h"
#include "uidkit/core/error.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace uidkit::codec {

// Arbitrary-alphabet codec between a byte sequence and a string.
//
// The byte sequence is treated as one big-endian unsigned integer and converted by
// repeated division by the alphabet size. Leading zero bytes carry no value, so:
//   encode({0x00, 0x00}) == ""              (all-zero input encodes to the empty string)
//   decode(encode(b)) == b                  only when the caller tracks b.size() itself
// Fixed-width formats call decode_fixed() with their known byte width.

// encode with a pre-validated alphabet. Never fails.
[[nodiscard]] std::string encode(core::ByteView bytes, const Alphabet& alphabet);

// encode validating the alphabet first (kInvalidAlphabet).
[[nodiscard]] core::Outcome<std::string> encode(core::ByteView bytes, std::string_view alphabet);

// decode maps each character to its alphabet index (kInvalidCharacter if absent) and
// accumulates value = value * base + index. The result is left-padded with zero bytes to
// decoded_byte_length(text.size(), alphabet.size()).
[[nodiscard]] core::Outcome<core::Bytes> decode(std::string_view text, const Alphabet& alphabet);
[[nodiscard]] core::Outcome<core::Bytes> decode(std::string_view text, std::string_view alphabet);

// decode_fixed decodes into exactly byte_length bytes. Fails with kInvalidSize when the
// decoded value does not fit.
[[nodiscard]] core::Outcome<core::Bytes> decode_fixed(std::string_view text,
                                                      const Alphabet& alphabet,
                                                      std::size_t byte_length);

// ceil(symbol_count * log2(base) / 8): bytes needed to hold symbol_count digits of base.
[[nodiscard]] std::size_t decoded_byte_length(std::size_t symbol_count, std::size_t base);

// pad_left prepends fill until text has at least width characters.
[[nodiscard]] std::string pad_left(std::string text, std::size_t width, char fill);

}  // namespace uidkit::codec
