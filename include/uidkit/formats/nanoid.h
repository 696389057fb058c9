#pragma once

#include "uidkit/codec/alphabet.h"
#include "uidkit/codec/alphabets.h"
#include "uidkit/core/error.h"
#include "uidkit/core/random_source.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace uidkit::formats {

inline constexpr std::size_t kNanoidDefaultSize = 21;
inline constexpr std::size_t kNanoidMinSize = 1;
inline constexpr std::size_t kNanoidMaxSize = 256;

// sample_alphabet draws `count` symbols uniformly from alphabet by byte-rejection sampling:
// a byte b is kept only when b < 256 - (256 mod n) and maps to alphabet[b mod n].
// Random bytes are requested in batches and refilled until the output is complete.
[[nodiscard]] core::Outcome<std::string> sample_alphabet(core::IRandomSource& random,
                                                         const codec::Alphabet& alphabet,
                                                         std::size_t count);

// generate_nanoid validates alphabet (kInvalidAlphabet) and size in [1, 256] (kInvalidSize).
[[nodiscard]] core::Outcome<std::string> generate_nanoid(
    core::IRandomSource& random, std::size_t size = kNanoidDefaultSize,
    std::string_view alphabet = codec::kNanoidUrlAlphabet);

// is_valid_nanoid: non-empty and every character drawn from alphabet.
[[nodiscard]] bool is_valid_nanoid(std::string_view id,
                                   std::string_view alphabet = codec::kNanoidUrlAlphabet);

}  // namespace uidkit::formats
