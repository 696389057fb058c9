#include "uidkit/formats/nanoid.h"

#include <cstdint>
#include <utility>

namespace uidkit::formats {

core::Outcome<std::string> sample_alphabet(core::IRandomSource& random,
                                           const codec::Alphabet& alphabet,
                                           const std::size_t count) {
  const std::size_t base = alphabet.size();
  const std::size_t threshold = 256 - (256 % base);
  // Expected number of draws for `count` accepted bytes.
  const std::size_t batch = (count * 256 + threshold - 1) / threshold;

  std::string out;
  out.reserve(count);
  while (out.size() < count) {
    auto drawn = random.bytes(batch);
    if (!drawn.has_value()) {
      return core::Outcome<std::string>::err(drawn.error());
    }
    for (const std::uint8_t byte : drawn.value()) {
      if (byte < threshold) {
        out.push_back(alphabet.at(byte % base));
        if (out.size() == count) {
          break;
        }
      }
    }
  }
  return core::Outcome<std::string>::ok(std::move(out));
}

core::Outcome<std::string> generate_nanoid(core::IRandomSource& random, const std::size_t size,
                                           const std::string_view alphabet) {
  auto created = codec::Alphabet::create(alphabet);
  if (!created.has_value()) {
    return core::Outcome<std::string>::err(created.error());
  }
  if (size < kNanoidMinSize || size > kNanoidMaxSize) {
    return core::Outcome<std::string>::err(core::make_error(
        core::ErrorCode::kInvalidSize,
        "nanoid size must be between 1 and 256, got " + std::to_string(size)));
  }
  return sample_alphabet(random, created.value(), size);
}

bool is_valid_nanoid(const std::string_view id, const std::string_view alphabet) {
  auto created = codec::Alphabet::create(alphabet);
  if (!created.has_value()) {
    return false;
  }
  return created.value().contains_all(id);
}

}  // namespace uidkit::formats
