#include "commands/formats.h"
#include "commands/generate.h"
#include "commands/parse.h"
#include "commands/validate.h"
#include "config.h"

#include "uidkit/core/clock.h"
#include "uidkit/core/diagnostics.h"
#include "uidkit/core/random_source.h"
#include "uidkit/core/version.h"
#include "uidkit/engine/engine.h"

#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& os) {
  os << "uidkit_cli v" << uidkit::core::kBuildVersion << "\n"
     << "Usage: uidkit_cli <command> [flags]\n"
     << "Commands:\n"
     << "  generate          Generate identifiers\n"
     << "  parse <id>        Print the fields of an identifier as JSON\n"
     << "  validate <id>     Check an identifier (exit 0 valid, 1 invalid)\n"
     << "  formats           List supported formats\n"
     << "Flags:\n";
  for (const auto& opt : uidkit::cli::build_option_registry()) {
    os << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n"
       << "      " << opt.description << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(bugprone-exception-escape)
  if (argc < 2) {
    print_usage(std::cerr);
    return 1;
  }

  const std::string command_name = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (command_name == "--help" || command_name == "-h" || command_name == "help") {
    print_usage(std::cout);
    return 0;
  }
  const auto command = uidkit::cli::parse_command(command_name);
  if (!command.has_value()) {
    std::cerr << "Unknown command: " << command_name << "\n";
    print_usage(std::cerr);
    return 1;
  }

  auto parsed = uidkit::cli::parse_cli_args(argc, argv, 2);
  if (!parsed.errors.empty()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    return 1;
  }
  const uidkit::cli::CliConfig& config = parsed.config;

  // Refuse to start on an invalid configuration
  const std::string config_error =
      uidkit::cli::validate_cli_config(config, *command, parsed.positionals.size());
  if (!config_error.empty()) {
    std::cerr << "Error: " << config_error << "\n";
    return 1;
  }

  if (*command == uidkit::cli::Command::kFormats) {
    return uidkit::cli::run_formats(config, std::cout);
  }

  auto random_result = uidkit::core::SystemRandomSource::create();
  if (!random_result.has_value()) {
    std::cerr << "Error: " << uidkit::core::format_error(random_result.error()) << "\n";
    return 1;
  }
  auto random = random_result.take_value();

  uidkit::core::SystemClock clock;
  uidkit::core::StderrDiagnosticSink diagnostics(config.verbose
                                                     ? uidkit::core::DiagnosticLevel::kDebug
                                                     : uidkit::core::DiagnosticLevel::kWarning);

  if (config.verbose) {
    std::cerr << "uidkit_cli v" << uidkit::core::kBuildVersion << "\n";
    std::cerr << "Random source: " << random->backend_name() << "\n";
    std::cerr << "Format: " << uidkit::engine::to_string(config.format) << "\n";
  }

  auto engine_result = uidkit::engine::Engine::create(*random, clock, diagnostics,
                                                      uidkit::cli::to_engine_options(config));
  if (!engine_result.has_value()) {
    std::cerr << "Error: " << uidkit::core::format_error(engine_result.error()) << "\n";
    return 1;
  }
  auto engine = engine_result.take_value();

  switch (*command) {
    case uidkit::cli::Command::kGenerate:
      return uidkit::cli::run_generate(*engine, config, std::cout, std::cerr);
    case uidkit::cli::Command::kParse:
      return uidkit::cli::run_parse(*engine, config, parsed.positionals.front(), std::cout,
                                    std::cerr);
    case uidkit::cli::Command::kValidate:
      return uidkit::cli::run_validate(*engine, config, parsed.positionals.front(), std::cout);
    case uidkit::cli::Command::kFormats:
      return uidkit::cli::run_formats(config, std::cout);
  }
  return 1;  // unreachable — all enumerators covered above
}
