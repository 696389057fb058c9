#include "uidkit/formats/cuid2.h"

#include "uidkit/codec/alphabets.h"
#include "uidkit/codec/base_codec.h"
#include "uidkit/core/bytes.h"
#include "uidkit/formats/nanoid.h"

#include <unistd.h>

#include <array>
#include <utility>

namespace uidkit::formats {

namespace {

const codec::Alphabet& base36_alphabet() {
  static const codec::Alphabet alphabet =
      codec::Alphabet::create(codec::kBase36Lower).take_value();
  return alphabet;
}

const codec::Alphabet& letter_alphabet() {
  static const codec::Alphabet alphabet =
      codec::Alphabet::create(codec::kLowerLetters).take_value();
  return alphabet;
}

bool is_lower_letter(const char ch) {
  return ch >= 'a' && ch <= 'z';
}

bool is_alnum_ascii(const char ch) {
  return is_lower_letter(ch) || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
}

char to_lower_ascii(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    constexpr char kCaseOffset = 'a' - 'A';
    return static_cast<char>(ch + kCaseOffset);
  }
  return ch;
}

// Unsigned integer rendered in lower-case base36; zero renders as "0".
std::string to_base36(std::uint64_t value) {
  core::Bytes be(8, 0);
  for (std::size_t i = 8; i-- > 0;) {
    be[i] = static_cast<std::uint8_t>(value & 0xFFU);
    value >>= 8U;
  }
  std::string digits = codec::encode(be, base36_alphabet());
  return digits.empty() ? std::string("0") : digits;
}

}  // namespace

std::string default_cuid2_fingerprint() {
  std::array<char, 256> host{};
  std::string prefix;
  if (::gethostname(host.data(), host.size() - 1) == 0) {
    for (const char ch : std::string_view(host.data())) {
      if (is_alnum_ascii(ch)) {
        prefix.push_back(to_lower_ascii(ch));
        if (prefix.size() == 3) {
          break;
        }
      }
    }
  }
  if (prefix.empty()) {
    prefix = "nod";
  }
  return prefix + to_base36(static_cast<std::uint64_t>(::getpid()) % 1000U);
}

core::Outcome<std::string> normalize_cuid2_fingerprint(const std::string_view fingerprint) {
  std::string out;
  out.reserve(fingerprint.size());
  for (std::size_t pos = 0; pos < fingerprint.size(); ++pos) {
    const char ch = fingerprint[pos];
    if (!is_alnum_ascii(ch)) {
      return core::Outcome<std::string>::err(core::make_error(
          core::ErrorCode::kInvalidCharacter,
          "fingerprint character '" + std::string(1, ch) + "' at position " +
              std::to_string(pos) + " is not alphanumeric"));
    }
    out.push_back(to_lower_ascii(ch));
  }
  return core::Outcome<std::string>::ok(std::move(out));
}

core::Outcome<std::string> generate_cuid2(core::IRandomSource& random, const std::int64_t now_ms,
                                          const std::size_t length,
                                          const std::string_view fingerprint) {
  if (length < kCuid2MinLength || length > kCuid2MaxLength) {
    return core::Outcome<std::string>::err(core::make_error(
        core::ErrorCode::kInvalidSize,
        "cuid2 length must be between 24 and 32, got " + std::to_string(length)));
  }
  if (now_ms < 0) {
    return core::Outcome<std::string>::err(core::make_error(
        core::ErrorCode::kInvalidTimestamp,
        "cuid2 timestamp must be non-negative, got " + std::to_string(now_ms)));
  }

  auto fp = normalize_cuid2_fingerprint(fingerprint);
  if (!fp.has_value()) {
    return fp;
  }

  auto letter = sample_alphabet(random, letter_alphabet(), 1);
  if (!letter.has_value()) {
    return letter;
  }

  const std::string timestamp = to_base36(static_cast<std::uint64_t>(now_ms));
  const std::size_t fixed = 1 + timestamp.size() + fp.value().size();
  const std::size_t random_digits =
      fixed + kCuid2MinRandomDigits < length ? length - fixed : kCuid2MinRandomDigits;

  // The kept digits are the k-byte draw reduced mod 36^d, d = random_digits. 256^k is never
  // a power of 36, so residues below 256^k mod 36^d are one draw more likely; the extra
  // bytes make that excess at most 2^-64 of any residue's probability.
  auto drawn = random.bytes(
      codec::decoded_byte_length(random_digits, base36_alphabet().size()) + kCuid2ReductionBytes);
  if (!drawn.has_value()) {
    return core::Outcome<std::string>::err(drawn.error());
  }
  std::string body =
      codec::pad_left(codec::encode(drawn.value(), base36_alphabet()), random_digits, '0');
  // Keep the low-order digits: the value mod 36^random_digits.
  body = body.substr(body.size() - random_digits);

  std::string id = letter.value() + timestamp + body + fp.value();
  id.resize(length);
  return core::Outcome<std::string>::ok(std::move(id));
}

bool is_valid_cuid2(const std::string_view id) {
  if (id.size() < kCuid2MinLength || id.size() > kCuid2MaxLength) {
    return false;
  }
  if (!is_lower_letter(id[0])) {
    return false;
  }
  for (const char ch : id) {
    if (!is_alnum_ascii(ch)) {
      return false;
    }
  }
  return true;
}

}  // namespace uidkit::formats
