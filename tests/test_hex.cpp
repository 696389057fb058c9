#include "uidkit/core/bytes.h"

#include <catch2/catch_test_macros.hpp>

using uidkit::core::Bytes;

TEST_CASE("to_hex renders lower-case pairs", "[core][hex]") {
  CHECK(uidkit::core::to_hex(Bytes{0xDE, 0xAD, 0xBE, 0xEF}) == "deadbeef");
  CHECK(uidkit::core::to_hex(Bytes{0x00, 0x0F}) == "000f");
  CHECK(uidkit::core::to_hex(Bytes{}).empty());
}

TEST_CASE("from_hex parses either case", "[core][hex]") {
  SECTION("lower case") {
    const auto bytes = uidkit::core::from_hex("deadbeef");
    REQUIRE(bytes.has_value());
    CHECK(*bytes == Bytes{0xDE, 0xAD, 0xBE, 0xEF});
  }

  SECTION("upper case") {
    const auto bytes = uidkit::core::from_hex("DEADBEEF");
    REQUIRE(bytes.has_value());
    CHECK(*bytes == Bytes{0xDE, 0xAD, 0xBE, 0xEF});
  }

  SECTION("empty input is empty bytes") {
    const auto bytes = uidkit::core::from_hex("");
    REQUIRE(bytes.has_value());
    CHECK(bytes->empty());
  }
}

TEST_CASE("from_hex rejects malformed input", "[core][hex]") {
  CHECK_FALSE(uidkit::core::from_hex("abc").has_value());
  CHECK_FALSE(uidkit::core::from_hex("zz").has_value());
  CHECK_FALSE(uidkit::core::from_hex("0x12").has_value());
}

TEST_CASE("hex_digit_value maps digits", "[core][hex]") {
  STATIC_REQUIRE(uidkit::core::hex_digit_value('7') == 7);
  STATIC_REQUIRE(uidkit::core::hex_digit_value('b') == 11);
  STATIC_REQUIRE(uidkit::core::hex_digit_value('F') == 15);
  STATIC_REQUIRE(uidkit::core::hex_digit_value('g') == -1);
}
