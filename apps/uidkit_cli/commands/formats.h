#pragma once

#include "../config.h"

#include <ostream>

namespace uidkit::cli {

// run_formats: list canonical format names, one per line, or a JSON array with --json.
// Usage: uidkit_cli formats [--json]
int run_formats(const CliConfig& config, std::ostream& out);

}  // namespace uidkit::cli
