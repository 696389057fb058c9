#pragma once

#include "uidkit/engine/format.h"
#include "uidkit/formats/snowflake.h"
#include "uidkit/formats/ulid.h"
#include "uidkit/formats/uuid.h"

#include <cstddef>
#include <string>
#include <variant>

namespace uidkit::engine {

// OpaqueFields describes identifiers with no internal structure (NanoID, CUID2, Short ID).
struct OpaqueFields {
  Format format{Format::kNanoid};
  std::string value;
  std::size_t length{0};
};

// ParsedId is produced by Engine::parse and never retained by the engine.
using ParsedId = std::variant<formats::UuidFields, formats::UlidFields, formats::SnowflakeFields,
                              OpaqueFields>;

}  // namespace uidkit::engine
