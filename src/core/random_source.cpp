#include "uidkit/core/random_source.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/random.h>
#include <unistd.h>
#include <utility>

namespace uidkit::core {

namespace {

// Fill `count` bytes via getrandom(2), retrying on EINTR and short reads.
// Returns 0 on success, errno on failure.
int fill_getrandom(std::uint8_t* out, const std::size_t count) {
  std::size_t filled = 0;
  while (filled < count) {
    const ssize_t n = getrandom(out + filled, count - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return errno;
    }
    filled += static_cast<std::size_t>(n);
  }
  return 0;
}

int fill_from_fd(const int fd, std::uint8_t* out, const std::size_t count) {
  std::size_t filled = 0;
  while (filled < count) {
    const ssize_t n = ::read(fd, out + filled, count - filled);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return errno;
    }
    if (n == 0) {
      return EIO;
    }
    filled += static_cast<std::size_t>(n);
  }
  return 0;
}

}  // namespace

Outcome<std::unique_ptr<SystemRandomSource>> SystemRandomSource::create() {
  using R = Outcome<std::unique_ptr<SystemRandomSource>>;

  // Probe getrandom with a single byte; ENOSYS means the kernel predates it.
  std::uint8_t probe = 0;
  const int probe_err = fill_getrandom(&probe, 1);
  if (probe_err == 0) {
    return R::ok(std::unique_ptr<SystemRandomSource>(
        new SystemRandomSource(Backend::kGetrandom, -1)));
  }

  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return R::err(make_error(ErrorCode::kNoSecureRandomSource,
                             "getrandom unavailable (" + std::string(std::strerror(probe_err)) +
                                 ") and /dev/urandom cannot be opened (" +
                                 std::string(std::strerror(errno)) + ")"));
  }
  return R::ok(
      std::unique_ptr<SystemRandomSource>(new SystemRandomSource(Backend::kUrandom, fd)));
}

SystemRandomSource::SystemRandomSource(const Backend backend, const int urandom_fd)
    : backend_(backend), urandom_fd_(urandom_fd) {}

SystemRandomSource::~SystemRandomSource() {
  if (urandom_fd_ >= 0) {
    ::close(urandom_fd_);
  }
}

Outcome<Bytes> SystemRandomSource::bytes(const std::size_t count) {
  Bytes out(count);
  if (count == 0) {
    return Outcome<Bytes>::ok(std::move(out));
  }

  const int err = backend_ == Backend::kGetrandom ? fill_getrandom(out.data(), count)
                                                  : fill_from_fd(urandom_fd_, out.data(), count);
  if (err != 0) {
    return Outcome<Bytes>::err(make_error(ErrorCode::kNoSecureRandomSource,
                                          std::string(backend_name()) +
                                              " failed: " + std::strerror(err)));
  }
  return Outcome<Bytes>::ok(std::move(out));
}

const char* SystemRandomSource::backend_name() const {
  switch (backend_) {
    case Backend::kGetrandom:
      return "getrandom";
    case Backend::kUrandom:
      return "/dev/urandom";
  }
  return "unknown";  // unreachable — all enumerators covered above
}

FixedRandomSource::FixedRandomSource(Bytes pattern) : pattern_(std::move(pattern)) {
  if (pattern_.empty()) {
    pattern_.push_back(0);
  }
}

Outcome<Bytes> FixedRandomSource::bytes(const std::size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);

  Bytes out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(pattern_[cursor_]);
    cursor_ = (cursor_ + 1) % pattern_.size();
  }
  drawn_ += count;
  return Outcome<Bytes>::ok(std::move(out));
}

std::size_t FixedRandomSource::bytes_drawn() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return drawn_;
}

}  // namespace uidkit::core
