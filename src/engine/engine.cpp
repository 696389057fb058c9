#include "uidkit/engine/engine.h"

#include "uidkit/codec/alphabet.h"
#include "uidkit/codec/alphabets.h"
#include "uidkit/formats/cuid2.h"
#include "uidkit/formats/nanoid.h"
#include "uidkit/formats/short_id.h"
#include "uidkit/formats/ulid.h"
#include "uidkit/formats/uuid.h"

#include <utility>

namespace uidkit::engine {

namespace {

formats::ShortPreset short_preset(const Format format) {
  if (format == Format::kShortBase62) {
    return formats::ShortPreset::kBase62;
  }
  if (format == Format::kShortYoutube) {
    return formats::ShortPreset::kYoutube;
  }
  return formats::ShortPreset::kBase58;
}

// Alphabet used by the alphabet-driven formats when params.alphabet is unset.
std::string_view default_alphabet(const Format format) {
  if (format == Format::kNanoid) {
    return codec::kNanoidUrlAlphabet;
  }
  return formats::preset_alphabet(short_preset(format));
}

core::Outcome<std::optional<ParsedId>> parsed(std::optional<ParsedId> value) {
  return core::Outcome<std::optional<ParsedId>>::ok(std::move(value));
}

std::string describe_snowflake(const formats::SnowflakeConfig& config) {
  return "worker_id=" + std::to_string(config.worker_id) +
         " datacenter_id=" + std::to_string(config.datacenter_id) +
         " epoch_ms=" + std::to_string(config.epoch_ms);
}

}  // namespace

core::Outcome<std::unique_ptr<Engine>> Engine::create(core::IRandomSource& random,
                                                      core::IClock& clock,
                                                      core::IDiagnosticSink& diagnostics,
                                                      EngineOptions options) {
  std::string fingerprint = options.cuid2_fingerprint.has_value()
                                ? *options.cuid2_fingerprint
                                : formats::default_cuid2_fingerprint();
  auto normalized = formats::normalize_cuid2_fingerprint(fingerprint);
  if (!normalized.has_value()) {
    return core::Outcome<std::unique_ptr<Engine>>::err(normalized.error());
  }

  // Private constructor: std::make_unique cannot reach it.
  std::unique_ptr<Engine> engine(
      new Engine(random, clock, diagnostics, options.debug, normalized.take_value()));

  if (options.snowflake.has_value()) {
    auto configured = engine->configure_snowflake(*options.snowflake);
    if (!configured.has_value()) {
      return core::Outcome<std::unique_ptr<Engine>>::err(configured.error());
    }
  }

  diagnostics.emit(core::DiagnosticLevel::kInfo,
                   "engine ready (cuid2 fingerprint " + engine->cuid2_fingerprint_ + ")");
  return core::Outcome<std::unique_ptr<Engine>>::ok(std::move(engine));
}

Engine::Engine(core::IRandomSource& random, core::IClock& clock,
               core::IDiagnosticSink& diagnostics, const bool debug,
               std::string cuid2_fingerprint)
    : random_(random),
      clock_(clock),
      diagnostics_(diagnostics),
      debug_(debug),
      cuid2_fingerprint_(std::move(cuid2_fingerprint)),
      monotonic_ulid_(random, clock) {}

core::Outcome<std::string> Engine::generate(const Format format, const GenerateParams& params) {
  auto result = dispatch_generate(format, params);
  if (!result.has_value()) {
    report_failure(format, result.error());
  }
  return result;
}

core::Outcome<std::string> Engine::dispatch_generate(const Format format,
                                                     const GenerateParams& params) {
  switch (format) {
    case Format::kUuidV4:
      return formats::generate_uuid_v4(random_);
    case Format::kUuidV7:
      return formats::generate_uuid_v7(random_, params.timestamp_ms.value_or(clock_.now_millis()));
    case Format::kUlid:
      return formats::generate_ulid(random_, params.timestamp_ms.value_or(clock_.now_millis()));
    case Format::kUlidMonotonic:
      return monotonic_ulid_.next();
    case Format::kNanoid:
      return formats::generate_nanoid(
          random_, params.size.value_or(formats::kNanoidDefaultSize),
          params.alphabet.has_value() ? std::string_view(*params.alphabet)
                                      : default_alphabet(format));
    case Format::kCuid2:
      return formats::generate_cuid2(
          random_, clock_.now_millis(), params.length.value_or(formats::kCuid2DefaultLength),
          params.fingerprint.has_value() ? std::string_view(*params.fingerprint)
                                         : std::string_view(cuid2_fingerprint_));
    case Format::kSnowflake: {
      generators::SnowflakeGenerator* generator = snowflake_generator();
      if (generator == nullptr) {
        return core::Outcome<std::string>::err(core::make_error(
            core::ErrorCode::kNotConfigured,
            "snowflake is not configured; call configure_snowflake() first"));
      }
      return generator->next();
    }
    case Format::kShortBase58:
    case Format::kShortBase62:
    case Format::kShortYoutube:
      return formats::generate_short_id(
          random_, params.size.value_or(formats::preset_default_size(short_preset(format))),
          params.alphabet.has_value() ? std::string_view(*params.alphabet)
                                      : default_alphabet(format));
  }
  // unreachable — all enumerators covered above
  return core::Outcome<std::string>::err(
      core::make_error(core::ErrorCode::kInvalidSize, "unknown format"));
}

core::Outcome<std::uint64_t> Engine::generate_snowflake_id() {
  generators::SnowflakeGenerator* generator = snowflake_generator();
  if (generator == nullptr) {
    core::Error error = core::make_error(
        core::ErrorCode::kNotConfigured,
        "snowflake is not configured; call configure_snowflake() first");
    report_failure(Format::kSnowflake, error);
    return core::Outcome<std::uint64_t>::err(std::move(error));
  }
  auto value = generator->next_id();
  if (!value.has_value()) {
    report_failure(Format::kSnowflake, value.error());
  }
  return value;
}

core::Outcome<std::optional<ParsedId>> Engine::parse(const Format format,
                                                     const std::string_view id,
                                                     const GenerateParams& params) const {
  switch (format) {
    case Format::kUuidV4:
    case Format::kUuidV7: {
      auto fields = formats::parse_uuid(id);
      if (!fields.has_value()) {
        return parsed(std::nullopt);
      }
      return parsed(ParsedId{std::move(*fields)});
    }
    case Format::kUlid:
    case Format::kUlidMonotonic: {
      auto fields = formats::parse_ulid(id);
      if (!fields.has_value()) {
        return parsed(std::nullopt);
      }
      return parsed(ParsedId{std::move(*fields)});
    }
    case Format::kSnowflake: {
      const auto config = snowflake_config();
      const std::int64_t epoch =
          config.has_value() ? config->epoch_ms : formats::kDefaultSnowflakeEpochMs;
      auto fields = formats::parse_snowflake(id, epoch);
      if (!fields.has_value()) {
        return core::Outcome<std::optional<ParsedId>>::err(fields.error());
      }
      return parsed(ParsedId{fields.value()});
    }
    case Format::kCuid2:
      if (!formats::is_valid_cuid2(id)) {
        return parsed(std::nullopt);
      }
      return parsed(ParsedId{OpaqueFields{format, std::string(id), id.size()}});
    case Format::kNanoid:
    case Format::kShortBase58:
    case Format::kShortBase62:
    case Format::kShortYoutube: {
      auto alphabet = codec::Alphabet::create(
          params.alphabet.has_value() ? std::string_view(*params.alphabet)
                                      : default_alphabet(format));
      if (!alphabet.has_value()) {
        return core::Outcome<std::optional<ParsedId>>::err(alphabet.error());
      }
      if (!alphabet.value().contains_all(id)) {
        return parsed(std::nullopt);
      }
      return parsed(ParsedId{OpaqueFields{format, std::string(id), id.size()}});
    }
  }
  return parsed(std::nullopt);  // unreachable — all enumerators covered above
}

bool Engine::is_valid(const Format format, const std::string_view id,
                      const GenerateParams& params) const {
  switch (format) {
    case Format::kUuidV4:
    case Format::kUuidV7:
      return formats::is_valid_uuid(id);
    case Format::kUlid:
    case Format::kUlidMonotonic:
      return formats::is_valid_ulid(id);
    case Format::kSnowflake:
      return formats::is_valid_snowflake(id);
    case Format::kCuid2:
      return formats::is_valid_cuid2(id);
    case Format::kNanoid:
      return formats::is_valid_nanoid(id, params.alphabet.has_value()
                                              ? std::string_view(*params.alphabet)
                                              : default_alphabet(format));
    case Format::kShortBase58:
    case Format::kShortBase62:
    case Format::kShortYoutube:
      return formats::is_valid_short_id(id, params.alphabet.has_value()
                                                ? std::string_view(*params.alphabet)
                                                : default_alphabet(format));
  }
  return false;  // unreachable — all enumerators covered above
}

core::Outcome<bool> Engine::configure_snowflake(const formats::SnowflakeConfig& config) {
  std::lock_guard<std::mutex> lock(snowflake_mutex_);
  if (snowflake_ != nullptr) {
    return core::Outcome<bool>::err(core::make_error(
        core::ErrorCode::kAlreadyConfigured,
        "snowflake is already configured (" + describe_snowflake(snowflake_->config()) + ")"));
  }

  auto generator = generators::SnowflakeGenerator::create(config, clock_);
  if (!generator.has_value()) {
    return core::Outcome<bool>::err(generator.error());
  }
  snowflake_ = generator.take_value();
  diagnostics_.emit(core::DiagnosticLevel::kInfo,
                    "snowflake configured: " + describe_snowflake(config));
  return core::Outcome<bool>::ok(true);
}

std::optional<formats::SnowflakeConfig> Engine::snowflake_config() const {
  std::lock_guard<std::mutex> lock(snowflake_mutex_);
  if (snowflake_ == nullptr) {
    return std::nullopt;
  }
  return snowflake_->config();
}

generators::SnowflakeGenerator* Engine::snowflake_generator() const {
  std::lock_guard<std::mutex> lock(snowflake_mutex_);
  return snowflake_.get();
}

void Engine::report_failure(const Format format, const core::Error& error) {
  const std::string line = std::string(to_string(format)) + ": " + core::format_error(error);
  switch (error.code) {
    case core::ErrorCode::kClockMovedBackward:
    case core::ErrorCode::kSequenceExhausted:
      diagnostics_.emit(core::DiagnosticLevel::kWarning, line);
      return;
    case core::ErrorCode::kNoSecureRandomSource:
      diagnostics_.emit(core::DiagnosticLevel::kError, line);
      return;
    case core::ErrorCode::kInvalidAlphabet:
    case core::ErrorCode::kInvalidSize:
    case core::ErrorCode::kInvalidCharacter:
    case core::ErrorCode::kInvalidTimestamp:
    case core::ErrorCode::kNotConfigured:
    case core::ErrorCode::kAlreadyConfigured:
      if (debug_) {
        diagnostics_.emit(core::DiagnosticLevel::kDebug, line);
      }
      return;
  }
}

}  // namespace uidkit::engine
