#pragma once

#include "../config.h"

#include "uidkit/engine/engine.h"

#include <ostream>

namespace uidkit::cli {

// run_generate: print config.count identifiers of config.format, one per line, or a JSON
// array with --json. Stops at the first failure and reports it on err.
// Usage: uidkit_cli generate [--format <name>] [--count <n>] [format flags]
int run_generate(engine::Engine& engine, const CliConfig& config, std::ostream& out,
                 std::ostream& err);

}  // namespace uidkit::cli
