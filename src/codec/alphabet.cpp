#include "uidkit/codec/alphabet.h"

#include <utility>

namespace uidkit::codec {

core::Outcome<Alphabet> Alphabet::create(const std::string_view symbols) {
  if (symbols.size() < 2) {
    return core::Outcome<Alphabet>::err(core::make_error(
        core::ErrorCode::kInvalidAlphabet, "alphabet must contain at least 2 symbols"));
  }

  std::array<bool, 256> seen{};
  for (const char ch : symbols) {
    const auto slot = static_cast<unsigned char>(ch);
    if (seen[slot]) {
      return core::Outcome<Alphabet>::err(core::make_error(
          core::ErrorCode::kInvalidAlphabet,
          std::string("alphabet contains duplicate symbol '") + ch + "'"));
    }
    seen[slot] = true;
  }

  return core::Outcome<Alphabet>::ok(Alphabet(std::string(symbols)));
}

Alphabet::Alphabet(std::string symbols) : symbols_(std::move(symbols)) {
  index_.fill(-1);
  for (std::size_t i = 0; i < symbols_.size(); ++i) {
    index_[static_cast<unsigned char>(symbols_[i])] = static_cast<std::int16_t>(i);
  }
}

bool Alphabet::contains_all(const std::string_view text) const {
  if (text.empty()) {
    return false;
  }
  for (const char ch : text) {
    if (!contains(ch)) {
      return false;
    }
  }
  return true;
}

}  // namespace uidkit::codec
