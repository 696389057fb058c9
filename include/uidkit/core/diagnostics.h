#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace uidkit::core {

enum class DiagnosticLevel : uint8_t {
  kDebug,
  kInfo,
  kWarning,
  kError,
};

[[nodiscard]] std::string_view to_string(DiagnosticLevel level);

struct DiagnosticRecord {
  DiagnosticLevel level;
  std::string message;
};

// IDiagnosticSink receives line-oriented engine diagnostics.
// Implementations must be safe to call from concurrent generator threads.
class IDiagnosticSink {
 public:
  virtual ~IDiagnosticSink() = default;
  virtual void emit(DiagnosticLevel level, std::string_view message) = 0;

 protected:
  IDiagnosticSink() = default;
  IDiagnosticSink(const IDiagnosticSink&) = default;
  IDiagnosticSink& operator=(const IDiagnosticSink&) = default;
  IDiagnosticSink(IDiagnosticSink&&) = default;
  IDiagnosticSink& operator=(IDiagnosticSink&&) = default;
};

// StderrDiagnosticSink writes "[uidkit] <LEVEL> <message>" lines to std::cerr.
// Records below min_level are dropped.
class StderrDiagnosticSink final : public IDiagnosticSink {
 public:
  explicit StderrDiagnosticSink(DiagnosticLevel min_level = DiagnosticLevel::kInfo)
      : min_level_(min_level) {}

  void emit(DiagnosticLevel level, std::string_view message) override;

 private:
  DiagnosticLevel min_level_;
  std::mutex mutex_;
};

// InMemoryDiagnosticSink keeps every record; used by tests to assert on diagnostics.
class InMemoryDiagnosticSink final : public IDiagnosticSink {
 public:
  void emit(DiagnosticLevel level, std::string_view message) override;

  [[nodiscard]] std::vector<DiagnosticRecord> records() const;
  [[nodiscard]] std::size_t count(DiagnosticLevel level) const;

 private:
  mutable std::mutex mutex_;
  std::vector<DiagnosticRecord> records_;
};

// NullDiagnosticSink discards everything. Default when no sink is wired.
class NullDiagnosticSink final : public IDiagnosticSink {
 public:
  void emit(DiagnosticLevel level, std::string_view message) override;
};

}  // namespace uidkit::core
