#include "cronrunner/io/fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstdint>

#include <fcntl.h>
#include <unistd.h>

namespace cronrunner::io {

auto Fd::reset() noexcept -> void {
  if (fd_ >= 0 && ownership_ == Ownership::Owned) {
    ::close(fd_);
  }
  fd_ = -1;
  ownership_ = Ownership::Borrowed;
}

auto Pipe::create() -> Result<Pipe> {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) < 0) {
    return fail(last_system_error());
  }
  return Pipe{Fd::from_raw(fds[0]), Fd::from_raw(fds[1])};
}

auto EventFd::create() -> Result<EventFd> {
  int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (fd < 0) {
    return fail(last_system_error());
  }
  return EventFd{Fd::from_raw(fd)};
}

auto EventFd::notify() const noexcept -> void {
  std::uint64_t val = 1;
  // A full counter still leaves the fd readable, so a failed write is benign
  [[maybe_unused]] auto n = ::write(fd_.get(), &val, sizeof(val));
}

auto EventFd::drain() const noexcept -> void {
  std::uint64_t val;
  while (::read(fd_.get(), &val, sizeof(val)) > 0) {
  }
}

auto write_all(int fd, std::string_view data) -> Result<void> {
  while (!data.empty()) {
    ssize_t n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return fail(last_system_error());
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return ok();
}

auto open_append(const std::filesystem::path& path, int mode) -> Result<Fd> {
  int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC,
                  static_cast<mode_t>(mode));
  if (fd < 0) {
    return fail(last_system_error());
  }
  return Fd::from_raw(fd);
}

}  // namespace cronrunner::io
