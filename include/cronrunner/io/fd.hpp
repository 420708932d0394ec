#pragma once

#include "cronrunner/core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <utility>

namespace cronrunner::io {

enum class Ownership : std::uint8_t {
  Owned,    // We own the fd and will close it
  Borrowed  // We don't own the fd
};

/// RAII handle for a blocking file descriptor.
class Fd {
public:
  [[nodiscard]] static auto from_raw(int fd,
                                     Ownership ownership = Ownership::Owned)
      -> Fd {
    return Fd{fd, ownership};
  }

  Fd() noexcept = default;

  Fd(Fd&& other) noexcept
      : fd_(std::exchange(other.fd_, -1)),
        ownership_(std::exchange(other.ownership_, Ownership::Borrowed)) {
  }

  auto operator=(Fd&& other) noexcept -> Fd& {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
      ownership_ = std::exchange(other.ownership_, Ownership::Borrowed);
    }
    return *this;
  }

  Fd(const Fd&) = delete;
  auto operator=(const Fd&) -> Fd& = delete;

  ~Fd() {
    reset();
  }

  [[nodiscard]] auto get() const noexcept -> int {
    return fd_;
  }

  [[nodiscard]] auto is_open() const noexcept -> bool {
    return fd_ >= 0;
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return is_open();
  }

  /// Give up ownership; the caller becomes responsible for closing
  [[nodiscard]] auto release() noexcept -> int {
    ownership_ = Ownership::Borrowed;
    return std::exchange(fd_, -1);
  }

  auto reset() noexcept -> void;

private:
  Fd(int fd, Ownership ownership) noexcept : fd_(fd), ownership_(ownership) {
  }

  int fd_{-1};
  Ownership ownership_{Ownership::Borrowed};
};

struct Pipe {
  Fd read;
  Fd write;

  /// Both ends are close-on-exec
  [[nodiscard]] static auto create() -> Result<Pipe>;
};

/// Wakeup primitive for poll loops
class EventFd {
public:
  [[nodiscard]] static auto create() -> Result<EventFd>;

  EventFd() = default;

  [[nodiscard]] auto get() const noexcept -> int {
    return fd_.get();
  }

  auto notify() const noexcept -> void;
  auto drain() const noexcept -> void;

private:
  explicit EventFd(Fd fd) : fd_(std::move(fd)) {
  }

  Fd fd_;
};

/// Writes the whole buffer, retrying on EINTR and short writes
[[nodiscard]] auto write_all(int fd, std::string_view data) -> Result<void>;

[[nodiscard]] auto open_append(const std::filesystem::path& path,
                               int mode = 0644) -> Result<Fd>;

}  // namespace cronrunner::io
