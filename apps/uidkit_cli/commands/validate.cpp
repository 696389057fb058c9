#include "validate.h"

#include <nlohmann/json.hpp>

namespace uidkit::cli {

int run_validate(const engine::Engine& engine, const CliConfig& config, const std::string& id,
                 std::ostream& out) {
  const bool valid = engine.is_valid(config.format, id, to_generate_params(config));

  if (config.json) {
    nlohmann::json j;
    j["format"] = std::string(engine::to_string(config.format));
    j["id"] = id;
    j["valid"] = valid;
    out << j.dump(2) << "\n";
  } else {
    out << (valid ? "valid" : "invalid") << "\n";
  }
  return valid ? 0 : 1;
}

}  // namespace uidkit::cli
