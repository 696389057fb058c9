#include "commands/formats.h"
#include "commands/generate.h"
#include "commands/parse.h"
#include "commands/validate.h"
#include "config.h"

#include "test_support.h"

#include "uidkit/core/clock.h"
#include "uidkit/core/diagnostics.h"
#include "uidkit/core/random_source.h"
#include "uidkit/engine/engine.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using uidkit::cli::CliConfig;
using uidkit::cli::Command;
using uidkit::engine::Format;
using uidkit::testing::ArgvBuilder;

namespace {

uidkit::apps::ParsedArgs<CliConfig> parse(const std::vector<std::string>& flags) {
  std::vector<std::string> args{"uidkit_cli", "generate"};
  args.insert(args.end(), flags.begin(), flags.end());
  ArgvBuilder argv(std::move(args));
  return uidkit::cli::parse_cli_args(argv.argc(), argv.argv(), 2);
}

}  // namespace

TEST_CASE("CLI flags populate the config", "[cli][config]") {
  const auto parsed = parse({"--format", "nanoid", "--count", "5", "--size", "12", "--alphabet",
                             "abcdef", "--json", "--verbose"});
  REQUIRE(parsed.errors.empty());
  CHECK(parsed.positionals.empty());
  CHECK(parsed.config.format == Format::kNanoid);
  CHECK(parsed.config.count == 5);
  CHECK(parsed.config.size == std::size_t{12});
  CHECK(parsed.config.alphabet == std::string("abcdef"));
  CHECK(parsed.config.json);
  CHECK(parsed.config.verbose);

  SECTION("defaults") {
    const auto empty = parse({});
    CHECK(empty.config.format == Format::kUuidV4);
    CHECK(empty.config.count == 1);
    CHECK_FALSE(empty.config.json);
    CHECK_FALSE(empty.config.worker_id.has_value());
  }
}

TEST_CASE("CLI rejects bad flag values", "[cli][config]") {
  CHECK(parse({"--count", "0"}).errors.size() == 1);
  CHECK(parse({"--count", "10001"}).errors.size() == 1);
  CHECK(parse({"--count", "12abc"}).errors.size() == 1);
  CHECK(parse({"--worker-id", "32"}).errors.size() == 1);
  CHECK(parse({"--datacenter-id", "-1"}).errors.size() == 1);
  CHECK(parse({"--epoch", "-5"}).errors.size() == 1);
  CHECK(parse({"--epoch", "9223372036854775807"}).errors.size() == 1);
  CHECK(parse({"--epoch", "281474976710656"}).errors.size() == 1);
  CHECK(parse({"--epoch", "281474976710655"}).errors.empty());
  CHECK(parse({"--format", "guid"}).errors.size() == 1);

  const auto missing = parse({"--size"});
  REQUIRE(missing.errors.size() == 1);
  CHECK(missing.errors.front() == "Option --size requires a value");

  const auto unknown = parse({"--colour", "red"});
  REQUIRE(unknown.errors.size() == 1);
  CHECK(unknown.errors.front() == "Unknown option: --colour");
  CHECK(unknown.positionals == std::vector<std::string>{"red"});
}

TEST_CASE("CLI cross-flag validation", "[cli][config]") {
  CliConfig config;

  SECTION("worker and datacenter travel together") {
    config.worker_id = 1;
    CHECK_FALSE(uidkit::cli::validate_cli_config(config, Command::kGenerate, 0).empty());
    config.datacenter_id = 2;
    CHECK(uidkit::cli::validate_cli_config(config, Command::kGenerate, 0).empty());
  }

  SECTION("snowflake generation needs an identity") {
    config.format = Format::kSnowflake;
    CHECK(uidkit::cli::validate_cli_config(config, Command::kGenerate, 0) ==
          "generate --format snowflake requires --worker-id and --datacenter-id");
    CHECK(uidkit::cli::validate_cli_config(config, Command::kParse, 1).empty());
  }

  SECTION("positional arguments") {
    CHECK(uidkit::cli::validate_cli_config(config, Command::kParse, 1).empty());
    CHECK_FALSE(uidkit::cli::validate_cli_config(config, Command::kParse, 0).empty());
    CHECK_FALSE(uidkit::cli::validate_cli_config(config, Command::kValidate, 2).empty());
    CHECK_FALSE(uidkit::cli::validate_cli_config(config, Command::kGenerate, 1).empty());
    CHECK_FALSE(uidkit::cli::validate_cli_config(config, Command::kFormats, 1).empty());
  }
}

TEST_CASE("CLI config converts to engine inputs", "[cli][config]") {
  CliConfig config;
  config.size = 9;
  config.timestamp_ms = 42;
  config.fingerprint = "abc";

  const auto params = uidkit::cli::to_generate_params(config);
  CHECK(params.size == std::size_t{9});
  CHECK(params.timestamp_ms == std::int64_t{42});
  CHECK(params.fingerprint == std::string("abc"));
  CHECK_FALSE(params.alphabet.has_value());

  CHECK_FALSE(uidkit::cli::to_snowflake_config(config).has_value());

  config.worker_id = 4;
  config.datacenter_id = 6;
  const auto snowflake = uidkit::cli::to_snowflake_config(config);
  REQUIRE(snowflake.has_value());
  CHECK(snowflake->worker_id == 4);
  CHECK(snowflake->datacenter_id == 6);
  CHECK(snowflake->epoch_ms == uidkit::formats::kDefaultSnowflakeEpochMs);

  config.verbose = true;
  const auto options = uidkit::cli::to_engine_options(config);
  CHECK(options.debug);
  CHECK(options.snowflake.has_value());
}

TEST_CASE("CLI commands write to the given streams", "[cli][commands]") {
  uidkit::core::FixedRandomSource random(uidkit::testing::counting_bytes(32));
  uidkit::core::FixedClock clock(1700000000000);
  uidkit::core::NullDiagnosticSink sink;
  auto created = uidkit::engine::Engine::create(random, clock, sink);
  REQUIRE(created.has_value());
  auto engine = created.take_value();

  std::ostringstream out;
  std::ostringstream err;
  CliConfig config;

  SECTION("generate prints one ID per line") {
    config.format = Format::kUlid;
    config.count = 3;
    CHECK(uidkit::cli::run_generate(*engine, config, out, err) == 0);
    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
      CHECK(line.size() == 26);
      ++count;
    }
    CHECK(count == 3);
    CHECK(err.str().empty());
  }

  SECTION("generate --json prints an array") {
    config.count = 2;
    config.json = true;
    CHECK(uidkit::cli::run_generate(*engine, config, out, err) == 0);
    const auto j = nlohmann::json::parse(out.str());
    REQUIRE(j.is_array());
    CHECK(j.size() == 2);
  }

  SECTION("generate reports failures") {
    config.format = Format::kSnowflake;
    CHECK(uidkit::cli::run_generate(*engine, config, out, err) == 1);
    CHECK(err.str().find("Failed to generate snowflake: NOT_CONFIGURED") == 0);
    CHECK(out.str().empty());
  }

  SECTION("parse prints fields") {
    config.format = Format::kUlid;
    CHECK(uidkit::cli::run_parse(*engine, config, "01ARYZ6S41TSV4RRFFQ69G5FAV", out, err) == 0);
    const auto j = nlohmann::json::parse(out.str());
    CHECK(j["timestamp_ms"] == 1469918176385LL);
  }

  SECTION("parse honours --epoch for snowflake") {
    config.format = Format::kSnowflake;
    config.epoch_ms = 0;
    CHECK(uidkit::cli::run_parse(*engine, config, "7130316800000413696", out, err) == 0);
    const auto j = nlohmann::json::parse(out.str());
    CHECK(j["timestamp_ms"] == 1700000000000LL);
    CHECK(j["worker_id"] == 5);
  }

  SECTION("parse rejects malformed input") {
    config.format = Format::kUuidV4;
    CHECK(uidkit::cli::run_parse(*engine, config, "nope", out, err) == 1);
    CHECK(err.str() == "Not a valid uuid-v4: nope\n");

    std::ostringstream err2;
    config.format = Format::kSnowflake;
    CHECK(uidkit::cli::run_parse(*engine, config, "12x", out, err2) == 1);
    CHECK(err2.str().find("Cannot parse '12x': INVALID_CHARACTER") == 0);
  }

  SECTION("validate prints a verdict") {
    config.format = Format::kCuid2;
    CHECK(uidkit::cli::run_validate(*engine, config, "clh3am5yk0000qj1f8b9g2n7", out) == 0);
    CHECK(out.str() == "valid\n");

    std::ostringstream json_out;
    config.json = true;
    CHECK(uidkit::cli::run_validate(*engine, config, "x", json_out) == 1);
    const auto j = nlohmann::json::parse(json_out.str());
    CHECK(j["valid"] == false);
    CHECK(j["format"] == "cuid2");
    CHECK(j["id"] == "x");
  }

  SECTION("formats lists every format") {
    CHECK(uidkit::cli::run_formats(config, out) == 0);
    CHECK(out.str().find("snowflake  (stateful)\n") != std::string::npos);
    CHECK(out.str().find("uuid-v4\n") == 0);

    std::ostringstream json_out;
    config.json = true;
    CHECK(uidkit::cli::run_formats(config, json_out) == 0);
    CHECK(nlohmann::json::parse(json_out.str()).size() == uidkit::engine::kAllFormats.size());
  }
}
