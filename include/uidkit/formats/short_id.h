#pragma once

#include "uidkit/codec/alphabets.h"
#include "uidkit/core/error.h"
#include "uidkit/core/random_source.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace uidkit::formats {

inline constexpr std::size_t kShortIdMinSize = 1;
inline constexpr std::size_t kShortIdMaxSize = 256;

enum class ShortPreset : uint8_t {
  kBase58,   // default; no 0, O, I, l
  kBase62,   // alphanumeric
  kYoutube,  // Base64 URL-safe
};

[[nodiscard]] std::string_view preset_alphabet(ShortPreset preset);
[[nodiscard]] std::size_t preset_default_size(ShortPreset preset);

// short_id_bytes_needed = ceil(size * log2(alphabet_size) / 8).
[[nodiscard]] std::size_t short_id_bytes_needed(std::size_t size, std::size_t alphabet_size);

// Upper bound on the entropy of one generated ID, in bits:
//   min(8 * bytes_needed, size * log2(alphabet_size))
// Padding with alphabet[0] and truncation both keep the real value at or below this bound;
// IDs are not uniform over all alphabet_size^size strings.
[[nodiscard]] double short_id_entropy_bound_bits(std::size_t size, std::size_t alphabet_size);

// generate_short_id draws short_id_bytes_needed() random bytes, encodes them with the
// base codec, then right-pads with alphabet[0] or truncates to exactly `size` characters.
// Errors: kInvalidAlphabet, kInvalidSize (size outside [1, 256]), or the random source's.
[[nodiscard]] core::Outcome<std::string> generate_short_id(
    core::IRandomSource& random, std::size_t size, std::string_view alphabet = codec::kBase58);

[[nodiscard]] core::Outcome<std::string> generate_short_id(core::IRandomSource& random,
                                                           ShortPreset preset);

// is_valid_short_id: non-empty and every character drawn from alphabet.
[[nodiscard]] bool is_valid_short_id(std::string_view id,
                                     std::string_view alphabet = codec::kBase58);

}  // namespace uidkit::formats
