#include "uidkit/formats/cuid2.h"

#include "uidkit/codec/alphabet.h"
#include "uidkit/codec/alphabets.h"
#include "uidkit/codec/base_codec.h"
#include "uidkit/core/random_source.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using uidkit::core::Bytes;
using uidkit::core::ErrorCode;
using uidkit::core::FixedRandomSource;

TEST_CASE("CUID2 layout over a fixed draw", "[cuid2]") {
  FixedRandomSource random(Bytes{0x00});

  // 'a' + base36(0) + 20 random digits + fingerprint
  const auto id = uidkit::formats::generate_cuid2(random, 0, 24, "fp");
  REQUIRE(id.has_value());
  CHECK(id.value() == "a0" + std::string(20, '0') + "fp");
}

TEST_CASE("CUID2 over-draws before reducing to base36 digits", "[cuid2]") {
  FixedRandomSource random(Bytes{0x00});
  const auto id = uidkit::formats::generate_cuid2(random, 0, 24, "fp");
  REQUIRE(id.has_value());

  // One batch for the letter, then enough bytes for 20 base36 digits plus the extra bytes.
  const std::size_t digit_bytes = uidkit::codec::decoded_byte_length(20, 36);
  REQUIRE(digit_bytes == 13);
  CHECK(random.bytes_drawn() == 2 + digit_bytes + uidkit::formats::kCuid2ReductionBytes);
}

TEST_CASE("CUID2 keeps the low-order digits of a wide draw", "[cuid2]") {
  // The letter consumes one two-byte batch, leaving the pattern aligned for the body draw.
  // 21 bytes encode to more than 20 base36 digits, so the body is a suffix.
  FixedRandomSource random(Bytes{0x01, 0xFF});
  const auto id = uidkit::formats::generate_cuid2(random, 0, 24, "fp");
  REQUIRE(id.has_value());
  REQUIRE(id.value().size() == 24);
  CHECK(id.value()[0] == 'b');

  Bytes wide;
  for (std::size_t i = 0; i < 13 + uidkit::formats::kCuid2ReductionBytes; ++i) {
    wide.push_back(i % 2 == 0 ? 0x01 : 0xFF);
  }
  const auto alphabet = uidkit::codec::Alphabet::create(uidkit::codec::kBase36Lower);
  REQUIRE(alphabet.has_value());
  const std::string encoded = uidkit::codec::encode(wide, alphabet.value());
  REQUIRE(encoded.size() > 20);
  CHECK(id.value().substr(2, 20) == encoded.substr(encoded.size() - 20));
}

TEST_CASE("CUID2 embeds the base36 timestamp after the first letter", "[cuid2]") {
  FixedRandomSource random(Bytes{0x07});
  const auto id = uidkit::formats::generate_cuid2(random, 1700000000000, 32, "zz");
  REQUIRE(id.has_value());
  REQUIRE(id.value().size() == 32);
  CHECK(id.value()[0] == 'h');
  CHECK(id.value().substr(1, 8) == "loyw3v28");
  CHECK(id.value().substr(30) == "zz");
}

TEST_CASE("CUID2 lengths", "[cuid2]") {
  auto created = uidkit::core::SystemRandomSource::create();
  REQUIRE(created.has_value());
  auto random = created.take_value();
  const std::string fingerprint = uidkit::formats::default_cuid2_fingerprint();

  for (std::size_t length = 24; length <= 32; ++length) {
    const auto id = uidkit::formats::generate_cuid2(*random, 1700000000000, length, fingerprint);
    REQUIRE(id.has_value());
    CHECK(id.value().size() == length);
    CHECK(uidkit::formats::is_valid_cuid2(id.value()));
  }

  CHECK(uidkit::formats::generate_cuid2(*random, 0, 23, fingerprint).error().code ==
        ErrorCode::kInvalidSize);
  CHECK(uidkit::formats::generate_cuid2(*random, 0, 33, fingerprint).error().code ==
        ErrorCode::kInvalidSize);
  CHECK(uidkit::formats::generate_cuid2(*random, -1, 24, fingerprint).error().code ==
        ErrorCode::kInvalidTimestamp);
}

TEST_CASE("CUID2 always starts with a letter", "[cuid2]") {
  auto created = uidkit::core::SystemRandomSource::create();
  REQUIRE(created.has_value());
  auto random = created.take_value();

  for (int i = 0; i < 500; ++i) {
    const auto id = uidkit::formats::generate_cuid2(*random, 1700000000000 + i, 24, "host1");
    REQUIRE(id.has_value());
    CHECK(id.value()[0] >= 'a');
    CHECK(id.value()[0] <= 'z');
  }
}

TEST_CASE("CUID2 fingerprint handling", "[cuid2][fingerprint]") {
  SECTION("normalised to lower case") {
    const auto fp = uidkit::formats::normalize_cuid2_fingerprint("HoSt7");
    REQUIRE(fp.has_value());
    CHECK(fp.value() == "host7");
  }

  SECTION("non-alphanumeric is rejected") {
    CHECK(uidkit::formats::normalize_cuid2_fingerprint("my-host").error().code ==
          ErrorCode::kInvalidCharacter);

    FixedRandomSource random(Bytes{0x00});
    CHECK(uidkit::formats::generate_cuid2(random, 0, 24, "a b").error().code ==
          ErrorCode::kInvalidCharacter);
  }

  SECTION("default fingerprint is lower-case alphanumeric") {
    const std::string fp = uidkit::formats::default_cuid2_fingerprint();
    REQUIRE(fp.size() >= 2);
    REQUIRE(fp.size() <= 5);
    for (const char ch : fp) {
      CHECK(((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')));
    }
    CHECK(fp == uidkit::formats::default_cuid2_fingerprint());
  }
}

TEST_CASE("CUID2 validation", "[cuid2][validate]") {
  CHECK(uidkit::formats::is_valid_cuid2("clh3am5yk0000qj1f8b9g2n7"));
  CHECK(uidkit::formats::is_valid_cuid2("clh3am5yk0000qj1f8b9g2n7p0123456"));
  CHECK_FALSE(uidkit::formats::is_valid_cuid2("clh3am5yk0000qj1f8b9g2n"));
  CHECK_FALSE(uidkit::formats::is_valid_cuid2("clh3am5yk0000qj1f8b9g2n7p01234567"));
  CHECK_FALSE(uidkit::formats::is_valid_cuid2("1lh3am5yk0000qj1f8b9g2n7"));
  CHECK_FALSE(uidkit::formats::is_valid_cuid2("Clh3am5yk0000qj1f8b9g2n7"));
  CHECK_FALSE(uidkit::formats::is_valid_cuid2("clh3am5yk0000qj1f8b9g2-7"));
}
