#include "uidkit/core/random_source.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using uidkit::core::Bytes;

TEST_CASE("SystemRandomSource draws from the OS CSPRNG", "[core][random]") {
  auto created = uidkit::core::SystemRandomSource::create();
  REQUIRE(created.has_value());
  auto random = created.take_value();

  const std::string backend = random->backend_name();
  CHECK((backend == "getrandom" || backend == "/dev/urandom"));

  SECTION("returns exactly the requested count") {
    const auto bytes = random->bytes(32);
    REQUIRE(bytes.has_value());
    CHECK(bytes.value().size() == 32);
  }

  SECTION("zero bytes is not an error") {
    const auto bytes = random->bytes(0);
    REQUIRE(bytes.has_value());
    CHECK(bytes.value().empty());
  }

  SECTION("consecutive draws differ") {
    const auto first = random->bytes(32);
    const auto second = random->bytes(32);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first.value() != second.value());
  }
}

TEST_CASE("FixedRandomSource replays its pattern", "[core][random]") {
  uidkit::core::FixedRandomSource random(Bytes{1, 2, 3});

  const auto first = random.bytes(4);
  REQUIRE(first.has_value());
  CHECK(first.value() == Bytes{1, 2, 3, 1});

  const auto second = random.bytes(2);
  REQUIRE(second.has_value());
  CHECK(second.value() == Bytes{2, 3});

  CHECK(random.bytes_drawn() == 6);
}

TEST_CASE("FixedRandomSource with an empty pattern yields zeros", "[core][random]") {
  uidkit::core::FixedRandomSource random(Bytes{});
  const auto bytes = random.bytes(3);
  REQUIRE(bytes.has_value());
  CHECK(bytes.value() == Bytes{0, 0, 0});
}
