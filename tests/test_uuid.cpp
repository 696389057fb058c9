#include "uidkit/formats/uuid.h"

#include "uidkit/core/random_source.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using uidkit::core::Bytes;
using uidkit::core::ErrorCode;
using uidkit::core::FixedRandomSource;
using uidkit::formats::UuidVariant;

TEST_CASE("UUID v4 stamps version and variant bits", "[uuid][v4]") {
  SECTION("over an all-ones draw") {
    FixedRandomSource random(Bytes{0xFF});
    const auto id = uidkit::formats::generate_uuid_v4(random);
    REQUIRE(id.has_value());
    CHECK(id.value() == "ffffffff-ffff-4fff-bfff-ffffffffffff");
  }

  SECTION("over an all-zero draw") {
    FixedRandomSource random(Bytes{0x00});
    const auto id = uidkit::formats::generate_uuid_v4(random);
    REQUIRE(id.has_value());
    CHECK(id.value() == "00000000-0000-4000-8000-000000000000");
  }
}

TEST_CASE("Generated UUID v4 values parse as version 4 RFC4122", "[uuid][v4]") {
  auto created = uidkit::core::SystemRandomSource::create();
  REQUIRE(created.has_value());
  auto random = created.take_value();

  for (int i = 0; i < 200; ++i) {
    const auto id = uidkit::formats::generate_uuid_v4(*random);
    REQUIRE(id.has_value());
    REQUIRE(uidkit::formats::is_valid_uuid(id.value()));

    const auto fields = uidkit::formats::parse_uuid(id.value());
    REQUIRE(fields.has_value());
    CHECK(fields->version == 4);
    CHECK(fields->variant == UuidVariant::kRfc4122);
    CHECK(uidkit::formats::to_string(fields->variant) == "RFC4122");
    CHECK_FALSE(fields->timestamp_ms.has_value());
  }
}

TEST_CASE("UUID v7 layout", "[uuid][v7]") {
  FixedRandomSource random(Bytes{0x00});
  const auto id = uidkit::formats::generate_uuid_v7(random, 0x0123456789AB);
  REQUIRE(id.has_value());
  CHECK(id.value() == "01234567-89ab-7000-8000-000000000000");

  const auto fields = uidkit::formats::parse_uuid(id.value());
  REQUIRE(fields.has_value());
  CHECK(fields->version == 7);
  CHECK(fields->variant == UuidVariant::kRfc4122);
  REQUIRE(fields->timestamp_ms.has_value());
  CHECK(*fields->timestamp_ms == 0x0123456789AB);
  CHECK(uidkit::formats::uuid_v7_timestamp(id.value()) == 0x0123456789AB);
}

TEST_CASE("UUID v7 orders by millisecond", "[uuid][v7]") {
  auto created = uidkit::core::SystemRandomSource::create();
  REQUIRE(created.has_value());
  auto random = created.take_value();

  const std::int64_t base = 1700000000000;
  for (std::int64_t step = 1; step <= 50; ++step) {
    const auto earlier = uidkit::formats::generate_uuid_v7(*random, base + step - 1);
    const auto later = uidkit::formats::generate_uuid_v7(*random, base + step);
    REQUIRE(earlier.has_value());
    REQUIRE(later.has_value());
    CHECK(earlier.value() < later.value());
  }
}

TEST_CASE("UUID v7 rejects timestamps outside 48 bits", "[uuid][v7]") {
  FixedRandomSource random(Bytes{0x00});

  const auto negative = uidkit::formats::generate_uuid_v7(random, -1);
  REQUIRE_FALSE(negative.has_value());
  CHECK(negative.error().code == ErrorCode::kInvalidTimestamp);

  const auto too_wide =
      uidkit::formats::generate_uuid_v7(random, uidkit::formats::kUuidV7MaxTimestampMs + 1);
  REQUIRE_FALSE(too_wide.has_value());
  CHECK(too_wide.error().code == ErrorCode::kInvalidTimestamp);

  CHECK(uidkit::formats::generate_uuid_v7(random, uidkit::formats::kUuidV7MaxTimestampMs)
            .has_value());
}

TEST_CASE("UUID validation is pattern-only", "[uuid][validate]") {
  CHECK(uidkit::formats::is_valid_uuid("550e8400-e29b-41d4-a716-446655440000"));
  CHECK(uidkit::formats::is_valid_uuid("550E8400-E29B-41D4-A716-446655440000"));
  CHECK(uidkit::formats::is_valid_uuid("00000000-0000-0000-0000-000000000000"));

  CHECK_FALSE(uidkit::formats::is_valid_uuid(""));
  CHECK_FALSE(uidkit::formats::is_valid_uuid("550e8400e29b41d4a716446655440000"));
  CHECK_FALSE(uidkit::formats::is_valid_uuid("550e8400-e29b-41d4-a716-44665544000"));
  CHECK_FALSE(uidkit::formats::is_valid_uuid("550e8400-e29b-41d4-a716-44665544000g"));
  CHECK_FALSE(uidkit::formats::is_valid_uuid("550e8400-e29b_41d4-a716-446655440000"));
  CHECK_FALSE(uidkit::formats::parse_uuid("not-a-uuid").has_value());
}

TEST_CASE("UUID variant decoding follows RFC 4122", "[uuid][variant]") {
  const auto variant_of = [](const std::string& id) {
    const auto fields = uidkit::formats::parse_uuid(id);
    REQUIRE(fields.has_value());
    return fields->variant;
  };

  CHECK(variant_of("00000000-0000-0000-0000-000000000000") == UuidVariant::kNcs);
  CHECK(variant_of("00000000-0000-0000-7fff-000000000000") == UuidVariant::kNcs);
  CHECK(variant_of("00000000-0000-0000-8000-000000000000") == UuidVariant::kRfc4122);
  CHECK(variant_of("00000000-0000-0000-bfff-000000000000") == UuidVariant::kRfc4122);
  CHECK(variant_of("00000000-0000-0000-c000-000000000000") == UuidVariant::kMicrosoft);
  CHECK(variant_of("00000000-0000-0000-e000-000000000000") == UuidVariant::kFuture);
}

TEST_CASE("uuid_v7_timestamp is empty for other versions", "[uuid][v7]") {
  CHECK_FALSE(uidkit::formats::uuid_v7_timestamp("550e8400-e29b-41d4-a716-446655440000")
                  .has_value());
  CHECK_FALSE(uidkit::formats::uuid_v7_timestamp("garbage").has_value());
}

TEST_CASE("Random source failures propagate", "[uuid]") {
  class Broken final : public uidkit::core::IRandomSource {
   public:
    uidkit::core::Outcome<Bytes> bytes(std::size_t /*count*/) override {
      return uidkit::core::Outcome<Bytes>::err(
          uidkit::core::make_error(ErrorCode::kNoSecureRandomSource, "down"));
    }
  };
  Broken random;

  const auto id = uidkit::formats::generate_uuid_v4(random);
  REQUIRE_FALSE(id.has_value());
  CHECK(id.error().code == ErrorCode::kNoSecureRandomSource);
}
