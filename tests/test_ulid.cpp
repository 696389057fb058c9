#include "uidkit/formats/ulid.h"

#include "uidkit/core/random_source.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using uidkit::core::Bytes;
using uidkit::core::ErrorCode;
using uidkit::core::FixedRandomSource;

TEST_CASE("ULID time part", "[ulid][time]") {
  SECTION("timestamp 0 is ten zero digits") {
    const auto time = uidkit::formats::encode_ulid_time(0);
    REQUIRE(time.has_value());
    CHECK(time.value() == "0000000000");
  }

  SECTION("reference timestamp") {
    const auto time = uidkit::formats::encode_ulid_time(1469918176385);
    REQUIRE(time.has_value());
    CHECK(time.value() == "01ARYZ6S41");
  }

  SECTION("largest 48-bit timestamp") {
    const auto time = uidkit::formats::encode_ulid_time(uidkit::formats::kUlidMaxTimestampMs);
    REQUIRE(time.has_value());
    CHECK(time.value() == "7ZZZZZZZZZ");
  }

  SECTION("out of range") {
    CHECK(uidkit::formats::encode_ulid_time(-1).error().code == ErrorCode::kInvalidTimestamp);
    CHECK(uidkit::formats::encode_ulid_time(uidkit::formats::kUlidMaxTimestampMs + 1)
              .error()
              .code == ErrorCode::kInvalidTimestamp);
  }
}

TEST_CASE("ULID random part is always 16 digits", "[ulid][random]") {
  CHECK(uidkit::formats::encode_ulid_random(Bytes(10, 0x00)) == "0000000000000000");
  CHECK(uidkit::formats::encode_ulid_random(Bytes(10, 0xFF)) == "ZZZZZZZZZZZZZZZZ");

  Bytes one(10, 0x00);
  one[9] = 0x01;
  CHECK(uidkit::formats::encode_ulid_random(one) == "0000000000000001");
}

TEST_CASE("generate_ulid produces 26 canonical characters", "[ulid][generate]") {
  FixedRandomSource zeros(Bytes{0x00});
  const auto id = uidkit::formats::generate_ulid(zeros, 0);
  REQUIRE(id.has_value());
  CHECK(id.value() == std::string(26, '0'));

  FixedRandomSource ones(Bytes{0xFF});
  const auto max_random = uidkit::formats::generate_ulid(ones, 1469918176385);
  REQUIRE(max_random.has_value());
  CHECK(max_random.value() == "01ARYZ6S41ZZZZZZZZZZZZZZZZ");
  CHECK(uidkit::formats::is_valid_ulid(max_random.value()));
}

TEST_CASE("parse_ulid recovers timestamp and random bytes", "[ulid][parse]") {
  const Bytes random_bytes = {0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF, 0x10, 0x32};
  FixedRandomSource random(random_bytes);

  const auto id = uidkit::formats::generate_ulid(random, 1700000000000);
  REQUIRE(id.has_value());

  const auto fields = uidkit::formats::parse_ulid(id.value());
  REQUIRE(fields.has_value());
  CHECK(fields->timestamp_ms == 1700000000000);
  CHECK(fields->random == random_bytes);
  REQUIRE(fields->bytes.size() == 16);
  CHECK(Bytes(fields->bytes.begin() + 6, fields->bytes.end()) == random_bytes);
  CHECK(uidkit::formats::ulid_timestamp(id.value()) == 1700000000000);
}

TEST_CASE("ULID decoding is case-insensitive", "[ulid][parse]") {
  const std::string upper = "01ARYZ6S41TSV4RRFFQ69G5FAV";
  std::string lower = "01aryz6s41tsv4rrffq69g5fav";

  CHECK(uidkit::formats::is_valid_ulid(upper));
  CHECK(uidkit::formats::is_valid_ulid(lower));

  const auto a = uidkit::formats::parse_ulid(upper);
  const auto b = uidkit::formats::parse_ulid(lower);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK(a->timestamp_ms == 1469918176385);
  CHECK(a->bytes == b->bytes);
}

TEST_CASE("ULID validation rejects non-canonical input", "[ulid][validate]") {
  SECTION("excluded Crockford letters") {
    CHECK_FALSE(uidkit::formats::is_valid_ulid("01ARYZ6S41TSV4RRFFQ69G5FAI"));
    CHECK_FALSE(uidkit::formats::is_valid_ulid("01ARYZ6S41TSV4RRFFQ69G5FAL"));
    CHECK_FALSE(uidkit::formats::is_valid_ulid("01ARYZ6S41TSV4RRFFQ69G5FAO"));
    CHECK_FALSE(uidkit::formats::is_valid_ulid("01ARYZ6S41TSV4RRFFQ69G5FAU"));
    CHECK_FALSE(uidkit::formats::is_valid_ulid("01ARYZ6S41TSV4RRFFQ69G5FAu"));
  }

  SECTION("wrong length") {
    CHECK_FALSE(uidkit::formats::is_valid_ulid("01ARYZ6S41TSV4RRFFQ69G5FA"));
    CHECK_FALSE(uidkit::formats::is_valid_ulid("01ARYZ6S41TSV4RRFFQ69G5FAVV"));
    CHECK_FALSE(uidkit::formats::is_valid_ulid(""));
  }

  SECTION("timestamp overflow") {
    CHECK(uidkit::formats::is_valid_ulid("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"));
    CHECK_FALSE(uidkit::formats::is_valid_ulid("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"));
  }

  SECTION("punctuation") {
    CHECK_FALSE(uidkit::formats::parse_ulid("01ARYZ6S41-SV4RRFFQ69G5FAV").has_value());
  }
}

TEST_CASE("decode_crockford", "[ulid][crockford]") {
  CHECK(uidkit::formats::decode_crockford('0') == 0);
  CHECK(uidkit::formats::decode_crockford('Z') == 31);
  CHECK(uidkit::formats::decode_crockford('z') == 31);
  CHECK(uidkit::formats::decode_crockford('j') == 18);
  CHECK_FALSE(uidkit::formats::decode_crockford('i').has_value());
  CHECK_FALSE(uidkit::formats::decode_crockford('U').has_value());
  CHECK_FALSE(uidkit::formats::decode_crockford('-').has_value());
}

TEST_CASE("ULIDs order by timestamp", "[ulid][order]") {
  auto created = uidkit::core::SystemRandomSource::create();
  REQUIRE(created.has_value());
  auto random = created.take_value();

  const auto earlier = uidkit::formats::generate_ulid(*random, 1700000000000);
  const auto later = uidkit::formats::generate_ulid(*random, 1700000000001);
  REQUIRE(earlier.has_value());
  REQUIRE(later.has_value());
  CHECK(earlier.value() < later.value());
}
