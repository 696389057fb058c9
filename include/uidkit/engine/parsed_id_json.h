#pragma once

#include "uidkit/engine/format.h"
#include "uidkit/engine/parsed_id.h"

#include <nlohmann/json.hpp>

#include <string>

namespace uidkit::engine {

/// Serialize a parsed identifier to JSON. Every object carries "format";
/// timestamps appear both as "timestamp_ms" and as ISO 8601 "timestamp".
[[nodiscard]] nlohmann::json parsed_id_to_json(const ParsedId& parsed, Format format);

/// Serialize to a compact JSON string (no whitespace)
[[nodiscard]] std::string parsed_id_to_json_string(const ParsedId& parsed, Format format);

}  // namespace uidkit::engine
