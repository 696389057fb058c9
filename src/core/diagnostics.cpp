#include "uidkit/core/diagnostics.h"

#include <iostream>

namespace uidkit::core {

std::string_view to_string(const DiagnosticLevel level) {
  switch (level) {
    case DiagnosticLevel::kDebug:
      return "DEBUG";
    case DiagnosticLevel::kInfo:
      return "INFO";
    case DiagnosticLevel::kWarning:
      return "WARNING";
    case DiagnosticLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";  // unreachable — all enumerators covered above
}

void StderrDiagnosticSink::emit(const DiagnosticLevel level, const std::string_view message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[uidkit] " << to_string(level) << " " << message << "\n";
}

void InMemoryDiagnosticSink::emit(const DiagnosticLevel level, const std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(DiagnosticRecord{level, std::string{message}});
}

std::vector<DiagnosticRecord> InMemoryDiagnosticSink::records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

std::size_t InMemoryDiagnosticSink::count(const DiagnosticLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t n = 0;
  for (const auto& record : records_) {
    if (record.level == level) {
      ++n;
    }
  }
  return n;
}

void NullDiagnosticSink::emit(DiagnosticLevel /*level*/, std::string_view /*message*/) {}

}  // namespace uidkit::core
