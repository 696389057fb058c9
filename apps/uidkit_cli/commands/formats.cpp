#include "formats.h"

#include <nlohmann/json.hpp>

#include <string>

namespace uidkit::cli {

int run_formats(const CliConfig& config, std::ostream& out) {
  if (config.json) {
    nlohmann::json names = nlohmann::json::array();
    for (const engine::Format format : engine::kAllFormats) {
      names.push_back(std::string(engine::to_string(format)));
    }
    out << names.dump(2) << "\n";
    return 0;
  }

  for (const engine::Format format : engine::kAllFormats) {
    out << engine::to_string(format);
    if (engine::is_stateful(format)) {
      out << "  (stateful)";
    }
    out << "\n";
  }
  return 0;
}

}  // namespace uidkit::cli
