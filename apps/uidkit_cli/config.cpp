#include "config.h"

#include <charconv>
#include <string_view>
#include <system_error>

namespace uidkit::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Value Parsing
// ────────────────────────────────────────────────────────────────

// Whole-string integer parse; rejects signs for unsigned targets, trailing junk and overflow.
template <typename T>
std::optional<T> parse_integer(const std::string& value) {
  T out{};
  const char* begin = value.data();
  const char* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  if (value.empty() || ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return out;
}

std::string invalid_value(const std::string& flag, const std::string& value,
                          const std::string& expected) {
  return "Invalid " + flag + ": " + value + " (expected " + expected + ")";
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

std::string handle_format(CliConfig& config, const std::string& value) {
  const auto format = engine::parse_format(value);
  if (!format.has_value()) {
    return "Invalid --format: " + value + " (run 'uidkit_cli formats' for the list)";
  }
  config.format = *format;
  return {};
}

std::string handle_count(CliConfig& config, const std::string& value) {
  const auto count = parse_integer<std::size_t>(value);
  if (!count.has_value() || *count < 1 || *count > kMaxCount) {
    return invalid_value("--count", value, "1-10000");
  }
  config.count = *count;
  return {};
}

std::string handle_size(CliConfig& config, const std::string& value) {
  const auto size = parse_integer<std::size_t>(value);
  if (!size.has_value()) {
    return invalid_value("--size", value, "a positive integer");
  }
  config.size = *size;
  return {};
}

std::string handle_alphabet(CliConfig& config, const std::string& value) {
  config.alphabet = value;
  return {};
}

std::string handle_length(CliConfig& config, const std::string& value) {
  const auto length = parse_integer<std::size_t>(value);
  if (!length.has_value()) {
    return invalid_value("--length", value, "a positive integer");
  }
  config.length = *length;
  return {};
}

std::string handle_fingerprint(CliConfig& config, const std::string& value) {
  config.fingerprint = value;
  return {};
}

std::string handle_timestamp(CliConfig& config, const std::string& value) {
  const auto timestamp = parse_integer<std::int64_t>(value);
  if (!timestamp.has_value()) {
    return invalid_value("--timestamp", value, "Unix milliseconds");
  }
  config.timestamp_ms = *timestamp;
  return {};
}

std::string handle_worker_id(CliConfig& config, const std::string& value) {
  const auto id = parse_integer<int>(value);
  if (!id.has_value() || *id < 0 || *id > formats::kSnowflakeMaxNodeId) {
    return invalid_value("--worker-id", value, "0-31");
  }
  config.worker_id = *id;
  return {};
}

std::string handle_datacenter_id(CliConfig& config, const std::string& value) {
  const auto id = parse_integer<int>(value);
  if (!id.has_value() || *id < 0 || *id > formats::kSnowflakeMaxNodeId) {
    return invalid_value("--datacenter-id", value, "0-31");
  }
  config.datacenter_id = *id;
  return {};
}

std::string handle_epoch(CliConfig& config, const std::string& value) {
  const auto epoch = parse_integer<std::int64_t>(value);
  if (!epoch.has_value() || *epoch < 0 || *epoch > formats::kSnowflakeMaxEpochMs) {
    return invalid_value("--epoch", value, "Unix milliseconds in 0-281474976710655");
  }
  config.epoch_ms = *epoch;
  return {};
}

std::string handle_json(CliConfig& config, const std::string& /*value*/) {
  config.json = true;
  return {};
}

std::string handle_verbose(CliConfig& config, const std::string& /*value*/) {
  config.verbose = true;
  return {};
}

}  // namespace

std::optional<Command> parse_command(const std::string& name) {
  if (name == "generate") {
    return Command::kGenerate;
  }
  if (name == "parse") {
    return Command::kParse;
  }
  if (name == "validate") {
    return Command::kValidate;
  }
  if (name == "formats") {
    return Command::kFormats;
  }
  return std::nullopt;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliConfig>> build_option_registry() {
  return {
      {"--format", true, "Identifier format (see 'formats')", handle_format},
      {"--count", true, "Number of IDs to generate (1-10000)", handle_count},
      {"--size", true, "Output size for nanoid and short formats", handle_size},
      {"--alphabet", true, "Custom alphabet for nanoid and short formats", handle_alphabet},
      {"--length", true, "CUID2 length (24-32)", handle_length},
      {"--fingerprint", true, "CUID2 machine fingerprint", handle_fingerprint},
      {"--timestamp", true, "Timestamp in Unix ms for uuid-v7 and ulid", handle_timestamp},
      {"--worker-id", true, "Snowflake worker ID (0-31)", handle_worker_id},
      {"--datacenter-id", true, "Snowflake datacenter ID (0-31)", handle_datacenter_id},
      {"--epoch", true, "Snowflake epoch in Unix ms", handle_epoch},
      {"--json", false, "Emit JSON output", handle_json},
      {"--verbose", false, "Print startup diagnostics to stderr", handle_verbose},
  };
}

apps::ParsedArgs<CliConfig> parse_cli_args(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                           const int start) {
  return apps::parse_options(argc, argv, build_option_registry(), start);
}

std::string validate_cli_config(const CliConfig& config, const Command command,
                                const std::size_t positional_count) {
  if (config.worker_id.has_value() != config.datacenter_id.has_value()) {
    return "--worker-id and --datacenter-id must be given together";
  }

  switch (command) {
    case Command::kGenerate:
      if (config.format == engine::Format::kSnowflake && !config.worker_id.has_value()) {
        return "generate --format snowflake requires --worker-id and --datacenter-id";
      }
      if (positional_count != 0) {
        return "generate takes no positional arguments";
      }
      return {};
    case Command::kParse:
    case Command::kValidate:
      if (positional_count != 1) {
        return "expected exactly one <id> argument";
      }
      return {};
    case Command::kFormats:
      if (positional_count != 0) {
        return "formats takes no positional arguments";
      }
      return {};
  }
  return {};  // unreachable — all enumerators covered above
}

engine::GenerateParams to_generate_params(const CliConfig& config) {
  engine::GenerateParams params;
  params.timestamp_ms = config.timestamp_ms;
  params.size = config.size;
  params.alphabet = config.alphabet;
  params.length = config.length;
  params.fingerprint = config.fingerprint;
  return params;
}

std::optional<formats::SnowflakeConfig> to_snowflake_config(const CliConfig& config) {
  if (!config.worker_id.has_value() || !config.datacenter_id.has_value()) {
    return std::nullopt;
  }
  formats::SnowflakeConfig snowflake;
  snowflake.worker_id = *config.worker_id;
  snowflake.datacenter_id = *config.datacenter_id;
  snowflake.epoch_ms = config.epoch_ms.value_or(formats::kDefaultSnowflakeEpochMs);
  return snowflake;
}

engine::EngineOptions to_engine_options(const CliConfig& config) {
  engine::EngineOptions options;
  options.debug = config.verbose;
  options.snowflake = to_snowflake_config(config);
  return options;
}

}  // namespace uidkit::cli
