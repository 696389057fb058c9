#pragma once

#include "uidkit/engine/engine.h"
#include "uidkit/engine/format.h"
#include "uidkit/engine/generate_params.h"
#include "uidkit/formats/snowflake.h"

#include "shared/arg_parser.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uidkit::cli {

enum class Command : uint8_t {
  kGenerate,
  kParse,
  kValidate,
  kFormats,
};

[[nodiscard]] std::optional<Command> parse_command(const std::string& name);

inline constexpr std::size_t kMaxCount = 10000;

// CliConfig holds all parsed flags. Optional fields mean "not given on the command line".
struct CliConfig {
  engine::Format format{engine::Format::kUuidV4};  // NOLINT(readability-identifier-naming)
  std::size_t count{1};                            // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> size;                 // NOLINT(readability-identifier-naming)
  std::optional<std::string> alphabet;             // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> length;               // NOLINT(readability-identifier-naming)
  std::optional<std::string> fingerprint;          // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> timestamp_ms;        // NOLINT(readability-identifier-naming)
  std::optional<int> worker_id;                    // NOLINT(readability-identifier-naming)
  std::optional<int> datacenter_id;                // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> epoch_ms;            // NOLINT(readability-identifier-naming)
  bool json{false};                                // NOLINT(readability-identifier-naming)
  bool verbose{false};                             // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<CliConfig>> build_option_registry();

// parse_cli_args parses argv[start..] into a CliConfig; see apps::parse_options.
[[nodiscard]] apps::ParsedArgs<CliConfig> parse_cli_args(
    int argc, char* argv[], int start);  // NOLINT(modernize-avoid-c-arrays)

// validate_cli_config checks cross-flag preconditions for a command.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - --worker-id and --datacenter-id are given together
// - generate --format snowflake has both of them
// - parse and validate have exactly one <id> argument; generate and formats have none
[[nodiscard]] std::string validate_cli_config(const CliConfig& config, Command command,
                                              std::size_t positional_count);

[[nodiscard]] engine::GenerateParams to_generate_params(const CliConfig& config);

// to_snowflake_config is empty unless both --worker-id and --datacenter-id were given.
[[nodiscard]] std::optional<formats::SnowflakeConfig> to_snowflake_config(const CliConfig& config);

[[nodiscard]] engine::EngineOptions to_engine_options(const CliConfig& config);

}  // namespace uidkit::cli
