#pragma once

#include "../config.h"

#include "uidkit/engine/engine.h"

#include <ostream>
#include <string>

namespace uidkit::cli {

// run_parse: print the fields of `id` as a JSON object. Exit code 1 when the ID is not a
// well-formed config.format identifier.
// Usage: uidkit_cli parse <id> [--format <name>] [--alphabet <chars>] [--epoch <ms>]
int run_parse(const engine::Engine& engine, const CliConfig& config, const std::string& id,
              std::ostream& out, std::ostream& err);

}  // namespace uidkit::cli
