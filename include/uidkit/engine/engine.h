#pragma once

#include "uidkit/core/clock.h"
#include "uidkit/core/diagnostics.h"
#include "uidkit/core/error.h"
#include "uidkit/core/random_source.h"
#include "uidkit/engine/format.h"
#include "uidkit/engine/generate_params.h"
#include "uidkit/engine/parsed_id.h"
#include "uidkit/formats/snowflake.h"
#include "uidkit/generators/monotonic_ulid_generator.h"
#include "uidkit/generators/snowflake_generator.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace uidkit::engine {

struct EngineOptions {
  bool debug{false};                                // per-call kDebug diagnostics on failure
  std::optional<std::string> cuid2_fingerprint;     // overrides default_cuid2_fingerprint()
  std::optional<formats::SnowflakeConfig> snowflake;  // applied once at construction
};

// Engine is the single entry point for generating, parsing and validating identifiers.
//
// It owns the per-format state (the monotonic ULID generator and, once configured, the
// Snowflake generator) and borrows the random source, clock and diagnostic sink, which
// must outlive it. Stateless formats draw from the shared random source on every call.
//
// Thread-safe: generate/parse/is_valid may be called concurrently.
class Engine {
 public:
  // create validates options (Snowflake config, CUID2 fingerprint) before building.
  [[nodiscard]] static core::Outcome<std::unique_ptr<Engine>> create(
      core::IRandomSource& random, core::IClock& clock, core::IDiagnosticSink& diagnostics,
      EngineOptions options = {});

  ~Engine() = default;

  // Disable copy/move (owns generator state and mutexes)
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;
  Engine(Engine&&) = delete;
  Engine& operator=(Engine&&) = delete;

  [[nodiscard]] core::Outcome<std::string> generate(Format format,
                                                    const GenerateParams& params = {});

  // generate_snowflake_id returns the raw 64-bit value. kNotConfigured before
  // configure_snowflake().
  [[nodiscard]] core::Outcome<std::uint64_t> generate_snowflake_id();

  // parse returns an empty optional for structurally invalid input. Snowflake input that
  // is not a 64-bit decimal, or an invalid params.alphabet, is reported as an error.
  [[nodiscard]] core::Outcome<std::optional<ParsedId>> parse(
      Format format, std::string_view id, const GenerateParams& params = {}) const;

  [[nodiscard]] bool is_valid(Format format, std::string_view id,
                              const GenerateParams& params = {}) const;

  // configure_snowflake applies config exactly once; a second call fails with
  // kAlreadyConfigured.
  [[nodiscard]] core::Outcome<bool> configure_snowflake(const formats::SnowflakeConfig& config);

  [[nodiscard]] std::optional<formats::SnowflakeConfig> snowflake_config() const;

  [[nodiscard]] const std::string& cuid2_fingerprint() const { return cuid2_fingerprint_; }

 private:
  Engine(core::IRandomSource& random, core::IClock& clock, core::IDiagnosticSink& diagnostics,
         bool debug, std::string cuid2_fingerprint);

  [[nodiscard]] core::Outcome<std::string> dispatch_generate(Format format,
                                                             const GenerateParams& params);
  [[nodiscard]] generators::SnowflakeGenerator* snowflake_generator() const;
  void report_failure(Format format, const core::Error& error);

  core::IRandomSource& random_;
  core::IClock& clock_;
  core::IDiagnosticSink& diagnostics_;
  const bool debug_;
  const std::string cuid2_fingerprint_;

  generators::MonotonicUlidGenerator monotonic_ulid_;

  mutable std::mutex snowflake_mutex_;
  std::unique_ptr<generators::SnowflakeGenerator> snowflake_;  // set once
};

}  // namespace uidkit::engine
