#pragma once

#include "uidkit/core/bytes.h"
#include "uidkit/core/error.h"

#include <cstddef>
#include <memory>
#include <mutex>

namespace uidkit::core {

// Abstract source of random bytes for dependency injection.
// Production code uses SystemRandomSource; tests inject FixedRandomSource to pin bit layouts.
// Implementations must be safe to call concurrently.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Return exactly `count` independently uniform random bytes.
  virtual Outcome<Bytes> bytes(std::size_t count) = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// SystemRandomSource draws from the operating system CSPRNG.
// Detection order: getrandom(2), then /dev/urandom. Fails closed with
// kNoSecureRandomSource when neither is usable; there is no non-cryptographic fallback.
class SystemRandomSource final : public IRandomSource {
 public:
  [[nodiscard]] static Outcome<std::unique_ptr<SystemRandomSource>> create();

  ~SystemRandomSource() override;

  // Disable copy/move (owns a file descriptor when using /dev/urandom)
  SystemRandomSource(const SystemRandomSource&) = delete;
  SystemRandomSource& operator=(const SystemRandomSource&) = delete;
  SystemRandomSource(SystemRandomSource&&) = delete;
  SystemRandomSource& operator=(SystemRandomSource&&) = delete;

  Outcome<Bytes> bytes(std::size_t count) override;

  // "getrandom" or "/dev/urandom"; used for startup diagnostics.
  [[nodiscard]] const char* backend_name() const;

 private:
  enum class Backend { kGetrandom, kUrandom };

  SystemRandomSource(Backend backend, int urandom_fd);

  Backend backend_;
  int urandom_fd_{-1};
};

// FixedRandomSource replays a byte pattern cyclically.
// Deterministic: for tests only, never for production identifiers.
class FixedRandomSource final : public IRandomSource {
 public:
  explicit FixedRandomSource(Bytes pattern);
  ~FixedRandomSource() override = default;

  // Disable copy/move (mutex not copyable)
  FixedRandomSource(const FixedRandomSource&) = delete;
  FixedRandomSource& operator=(const FixedRandomSource&) = delete;
  FixedRandomSource(FixedRandomSource&&) = delete;
  FixedRandomSource& operator=(FixedRandomSource&&) = delete;

  Outcome<Bytes> bytes(std::size_t count) override;

  // Total number of bytes handed out so far.
  [[nodiscard]] std::size_t bytes_drawn() const;

 private:
  mutable std::mutex mutex_;
  Bytes pattern_;
  std::size_t cursor_{0};
  std::size_t drawn_{0};
};

}  // namespace uidkit::core
