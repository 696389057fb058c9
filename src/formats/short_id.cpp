#include "uidkit/formats/short_id.h"

#include "uidkit/codec/alphabet.h"
#include "uidkit/codec/base_codec.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace uidkit::formats {

std::string_view preset_alphabet(const ShortPreset preset) {
  switch (preset) {
    case ShortPreset::kBase58:
      return codec::kBase58;
    case ShortPreset::kBase62:
      return codec::kBase62;
    case ShortPreset::kYoutube:
      return codec::kBase64Url;
  }
  return codec::kBase58;  // unreachable — all enumerators covered above
}

std::size_t preset_default_size(const ShortPreset preset) {
  switch (preset) {
    case ShortPreset::kBase58:
      return 11;
    case ShortPreset::kBase62:
      return 10;
    case ShortPreset::kYoutube:
      return 11;
  }
  return 11;  // unreachable — all enumerators covered above
}

std::size_t short_id_bytes_needed(const std::size_t size, const std::size_t alphabet_size) {
  return codec::decoded_byte_length(size, alphabet_size);
}

double short_id_entropy_bound_bits(const std::size_t size, const std::size_t alphabet_size) {
  if (alphabet_size < 2) {
    return 0.0;
  }
  const double drawn_bits = 8.0 * static_cast<double>(short_id_bytes_needed(size, alphabet_size));
  const double symbol_bits =
      static_cast<double>(size) * std::log2(static_cast<double>(alphabet_size));
  return std::min(drawn_bits, symbol_bits);
}

core::Outcome<std::string> generate_short_id(core::IRandomSource& random, const std::size_t size,
                                             const std::string_view alphabet) {
  auto created = codec::Alphabet::create(alphabet);
  if (!created.has_value()) {
    return core::Outcome<std::string>::err(created.error());
  }
  if (size < kShortIdMinSize || size > kShortIdMaxSize) {
    return core::Outcome<std::string>::err(core::make_error(
        core::ErrorCode::kInvalidSize,
        "short id size must be between 1 and 256, got " + std::to_string(size)));
  }
  const codec::Alphabet& symbols = created.value();

  auto drawn = random.bytes(short_id_bytes_needed(size, symbols.size()));
  if (!drawn.has_value()) {
    return core::Outcome<std::string>::err(drawn.error());
  }

  std::string id = codec::encode(drawn.value(), symbols);
  // Right-pad or truncate to the exact size.
  id.resize(size, symbols.at(0));
  return core::Outcome<std::string>::ok(std::move(id));
}

core::Outcome<std::string> generate_short_id(core::IRandomSource& random,
                                             const ShortPreset preset) {
  return generate_short_id(random, preset_default_size(preset), preset_alphabet(preset));
}

bool is_valid_short_id(const std::string_view id, const std::string_view alphabet) {
  auto created = codec::Alphabet::create(alphabet);
  if (!created.has_value()) {
    return false;
  }
  return created.value().contains_all(id);
}

}  // namespace uidkit::formats
