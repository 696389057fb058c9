#pragma once

#include "uidkit/core/error.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace uidkit::codec {

// Alphabet is an ordered set of single-byte symbols used for index<->char mapping.
//
// Invariants (enforced by create()):
// - at least 2 symbols
// - no duplicate symbols
// - at most 256 symbols (implied by single-byte symbols and uniqueness)
class Alphabet {
 public:
  // create validates symbols and builds the reverse lookup table.
  // Fails with kInvalidAlphabet on fewer than 2 symbols or any duplicate.
  [[nodiscard]] static core::Outcome<Alphabet> create(std::string_view symbols);

  [[nodiscard]] std::size_t size() const { return symbols_.size(); }
  [[nodiscard]] char at(std::size_t index) const { return symbols_[index]; }
  [[nodiscard]] const std::string& symbols() const { return symbols_; }

  // index_of returns the position of ch, or -1 when ch is not in the alphabet.
  [[nodiscard]] int index_of(char ch) const {
    return index_[static_cast<unsigned char>(ch)];
  }
  [[nodiscard]] bool contains(char ch) const { return index_of(ch) >= 0; }

  // contains_all is true when text is non-empty and every character is in the alphabet.
  [[nodiscard]] bool contains_all(std::string_view text) const;

 private:
  explicit Alphabet(std::string symbols);

  std::string symbols_;
  std::array<std::int16_t, 256> index_{};
};

}  // namespace uidkit::codec
