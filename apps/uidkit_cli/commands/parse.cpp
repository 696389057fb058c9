#include "parse.h"

#include "uidkit/engine/parsed_id_json.h"
#include "uidkit/formats/snowflake.h"

#include <optional>

namespace uidkit::cli {

namespace {

// An explicit --epoch overrides the engine's Snowflake epoch, so IDs minted elsewhere can
// be decoded without configuring a worker identity.
core::Outcome<std::optional<engine::ParsedId>> parse_id(const engine::Engine& engine,
                                                        const CliConfig& config,
                                                        const std::string& id) {
  if (config.format == engine::Format::kSnowflake && config.epoch_ms.has_value()) {
    auto fields = formats::parse_snowflake(id, *config.epoch_ms);
    if (!fields.has_value()) {
      return core::Outcome<std::optional<engine::ParsedId>>::err(fields.error());
    }
    return core::Outcome<std::optional<engine::ParsedId>>::ok(engine::ParsedId{fields.value()});
  }
  return engine.parse(config.format, id, to_generate_params(config));
}

}  // namespace

int run_parse(const engine::Engine& engine, const CliConfig& config, const std::string& id,
              std::ostream& out, std::ostream& err) {
  auto result = parse_id(engine, config, id);
  if (!result.has_value()) {
    err << "Cannot parse '" << id << "': " << core::format_error(result.error()) << "\n";
    return 1;
  }
  const auto& parsed = result.value();
  if (!parsed.has_value()) {
    err << "Not a valid " << engine::to_string(config.format) << ": " << id << "\n";
    return 1;
  }

  out << engine::parsed_id_to_json(*parsed, config.format).dump(2) << "\n";
  return 0;
}

}  // namespace uidkit::cli
