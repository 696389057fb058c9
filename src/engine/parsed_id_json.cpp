#include "uidkit/engine/parsed_id_json.h"

#include "uidkit/core/bytes.h"
#include "uidkit/core/clock.h"

namespace uidkit::engine {

nlohmann::json parsed_id_to_json(const ParsedId& parsed, const Format format) {
  nlohmann::json j;
  j["format"] = std::string(to_string(format));

  if (const auto* uuid = std::get_if<formats::UuidFields>(&parsed)) {
    j["version"] = uuid->version;
    j["variant"] = std::string(formats::to_string(uuid->variant));
    j["bytes"] = core::to_hex(uuid->bytes);
    if (uuid->timestamp_ms.has_value()) {
      j["timestamp_ms"] = uuid->timestamp_ms.value();
      j["timestamp"] = core::format_iso8601_millis(uuid->timestamp_ms.value());
    }
  } else if (const auto* ulid = std::get_if<formats::UlidFields>(&parsed)) {
    j["timestamp_ms"] = ulid->timestamp_ms;
    j["timestamp"] = core::format_iso8601_millis(ulid->timestamp_ms);
    j["random"] = core::to_hex(ulid->random);
  } else if (const auto* snowflake = std::get_if<formats::SnowflakeFields>(&parsed)) {
    j["timestamp_ms"] = snowflake->timestamp_ms;
    j["timestamp"] = core::format_iso8601_millis(snowflake->timestamp_ms);
    j["worker_id"] = snowflake->worker_id;
    j["datacenter_id"] = snowflake->datacenter_id;
    j["sequence"] = snowflake->sequence;
  } else if (const auto* opaque = std::get_if<OpaqueFields>(&parsed)) {
    j["length"] = opaque->length;
  }

  return j;
}

std::string parsed_id_to_json_string(const ParsedId& parsed, const Format format) {
  return parsed_id_to_json(parsed, format).dump();
}

}  // namespace uidkit::engine
