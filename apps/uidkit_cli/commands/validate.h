#pragma once

#include "../config.h"

#include "uidkit/engine/engine.h"

#include <ostream>
#include <string>

namespace uidkit::cli {

// run_validate: print "valid" or "invalid" (or a JSON verdict with --json).
// Exit code 0 when valid, 1 when invalid.
// Usage: uidkit_cli validate <id> [--format <name>] [--alphabet <chars>]
int run_validate(const engine::Engine& engine, const CliConfig& config, const std::string& id,
                 std::ostream& out);

}  // namespace uidkit::cli
