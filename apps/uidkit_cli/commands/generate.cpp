#include "generate.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace uidkit::cli {

int run_generate(engine::Engine& engine, const CliConfig& config, std::ostream& out,
                 std::ostream& err) {
  const engine::GenerateParams params = to_generate_params(config);

  std::vector<std::string> ids;
  ids.reserve(config.count);
  for (std::size_t i = 0; i < config.count; ++i) {
    auto id = engine.generate(config.format, params);
    if (!id.has_value()) {
      err << "Failed to generate " << engine::to_string(config.format) << ": "
          << core::format_error(id.error()) << "\n";
      return 1;
    }
    ids.push_back(id.take_value());
  }

  if (config.json) {
    out << nlohmann::json(ids).dump(2) << "\n";
    return 0;
  }
  for (const auto& id : ids) {
    out << id << "\n";
  }
  return 0;
}

}  // namespace uidkit::cli
