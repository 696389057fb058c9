#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace uidkit::engine {

// Optional per-call parameters. Fields a format does not use are ignored.
struct GenerateParams {
  std::optional<std::int64_t> timestamp_ms;  // uuid-v7, ulid (defaults to the engine clock)
  std::optional<std::size_t> size;           // nanoid, short-*
  std::optional<std::string> alphabet;       // nanoid, short-* (also used by parse/is_valid)
  std::optional<std::size_t> length;         // cuid2
  std::optional<std::string> fingerprint;    // cuid2 (defaults to the engine fingerprint)
};

}  // namespace uidkit::engine
