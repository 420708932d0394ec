#include "cronrunner/executor/process_runner.hpp"

#include "cronrunner/core/error.hpp"
#include "cronrunner/io/fd.hpp"
#include "cronrunner/util/log.hpp"

#include <sys/syscall.h>
#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace cronrunner {

namespace {

inline constexpr std::size_t READ_BUFFER_SIZE = 4096;
inline constexpr int MAX_READS_PER_WAKEUP = 16;
inline constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(10);
inline constexpr auto CANCEL_POLL_INTERVAL = std::chrono::milliseconds(100);

auto pidfd_open(pid_t pid, unsigned int flags) -> int {
  return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto set_nonblocking(int fd) -> bool {
  int flags = ::fcntl(fd, F_GETFL);
  return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Lower a poll timeout (-1 = infinite) to at most `cap`
auto cap_timeout(int timeout_ms, std::chrono::milliseconds cap) -> int {
  auto c = static_cast<int>(cap.count());
  return timeout_ms < 0 ? c : std::min(timeout_ms, c);
}

// Parent side of one teed child stream
struct TeeStream {
  const char* name;
  io::Fd read_end;
  const std::vector<int>* targets{nullptr};
  bool write_failed{false};
};

// Writes the child side of a stream should be dup'd onto, and (when teeing)
// the pipe whose read end the parent keeps.
struct StreamPlan {
  int child_fd{-1};
  io::Fd pipe_write;
  TeeStream tee;
};

class ProcessRunner : public IProcessRunner {
public:
  explicit ProcessRunner(log::Logger& logger) : log_(logger) {
  }

  auto run(const std::vector<std::string>& argv, const OutputTargets& targets,
           std::optional<std::chrono::nanoseconds> budget,
           const CancellationToken& cancel) -> ProcessResult override;

private:
  auto plan_stream(const char* name, const std::vector<int>& targets,
                   int devnull) -> Result<StreamPlan>;
  auto pump(TeeStream& stream) -> void;
  auto reap(pid_t pid) -> int;

  log::Logger& log_;
};

auto ProcessRunner::plan_stream(const char* name,
                                const std::vector<int>& targets, int devnull)
    -> Result<StreamPlan> {
  StreamPlan plan;
  plan.tee.name = name;
  if (targets.empty()) {
    plan.child_fd = devnull;
    return plan;
  }
  if (targets.size() == 1) {
    plan.child_fd = targets.front();
    return plan;
  }

  auto pipe = io::Pipe::create();
  if (!pipe) {
    return fail(pipe.error());
  }
  if (!set_nonblocking(pipe->read.get())) {
    return fail(last_system_error());
  }
  plan.child_fd = pipe->write.get();
  plan.pipe_write = std::move(pipe->write);
  plan.tee.read_end = std::move(pipe->read);
  plan.tee.targets = &targets;
  return plan;
}

auto ProcessRunner::pump(TeeStream& stream) -> void {
  std::array<char, READ_BUFFER_SIZE> buffer;

  for (int i = 0; i < MAX_READS_PER_WAKEUP && stream.read_end; ++i) {
    ssize_t n = ::read(stream.read_end.get(), buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR)
        continue;
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        log_.warn("Reading child {} failed: {}", stream.name,
                  std::strerror(errno));
        stream.read_end.reset();
      }
      return;
    }
    if (n == 0) {
      stream.read_end.reset();
      return;
    }

    std::string_view chunk(buffer.data(), static_cast<std::size_t>(n));
    for (int fd : *stream.targets) {
      if (auto r = io::write_all(fd, chunk); !r && !stream.write_failed) {
        stream.write_failed = true;
        log_.warn("Copying child {} to fd {} failed: {}", stream.name, fd,
                  r.error().message());
      }
    }
  }
}

auto ProcessRunner::reap(pid_t pid) -> int {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      log_.warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      return -1;
    }
  }
  return status;
}

auto ProcessRunner::run(const std::vector<std::string>& argv,
                        const OutputTargets& targets,
                        std::optional<std::chrono::nanoseconds> budget,
                        const CancellationToken& cancel) -> ProcessResult {
  ProcessResult result;
  if (argv.empty()) {
    result.error = make_error_code(Error::InvalidArgument);
    return result;
  }

  io::Fd devnull;
  if (targets.out.empty() || targets.err.empty()) {
    devnull = io::Fd::from_raw(::open("/dev/null", O_WRONLY | O_CLOEXEC));
  }

  auto out_plan = plan_stream("stdout", targets.out, devnull.get());
  if (!out_plan) {
    result.error = out_plan.error();
    return result;
  }
  auto err_plan = plan_stream("stderr", targets.err, devnull.get());
  if (!err_plan) {
    result.error = err_plan.error();
    return result;
  }

  // Exec failure travels back as an errno through this close-on-exec pipe
  auto status_pipe = io::Pipe::create();
  if (!status_pipe) {
    result.error = status_pipe.error();
    return result;
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    cargv.push_back(const_cast<char*>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  const int child_out = out_plan->child_fd;
  const int child_err = err_plan->child_fd;
  const int status_write = status_pipe->write.get();

  pid_t pid = ::fork();
  if (pid < 0) {
    result.error = last_system_error();
    return result;
  }

  if (pid == 0) {
    // Child process - must only use async-signal-safe functions
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    // Dispositions the runner process changed must not leak into the job
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    setpgid(0, 0);

    if ((child_out < 0 || child_out == STDOUT_FILENO ||
         dup2(child_out, STDOUT_FILENO) >= 0) &&
        (child_err < 0 || child_err == STDERR_FILENO ||
         dup2(child_err, STDERR_FILENO) >= 0)) {
      execvp(cargv[0], cargv.data());
    }

    int err = errno;
    [[maybe_unused]] auto n = write(status_write, &err, sizeof(err));
    _exit(127);
  }

  result.pid = pid;
  setpgid(pid, pid);
  out_plan->pipe_write.reset();
  err_plan->pipe_write.reset();
  status_pipe->write.reset();

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_pipe->read.get(), &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    reap(pid);
    result.error = std::error_code(child_errno, std::system_category());
    return result;
  }

  auto pidfd = io::Fd::from_raw(pidfd_open(pid, 0));
  if (!pidfd) {
    log_.debug("pidfd_open failed for pid {}, polling for exit", pid);
  }

  std::optional<std::chrono::steady_clock::time_point> deadline_at;
  if (budget) {
    deadline_at = std::chrono::steady_clock::now() + *budget;
  }

  auto& out = out_plan->tee;
  auto& err = err_plan->tee;
  bool reaped = false;
  int status = 0;

  while (true) {
    if (cancel.is_cancelled()) {
      result.cancelled = true;
      break;
    }

    int timeout_ms = -1;
    if (deadline_at) {
      auto left = *deadline_at - std::chrono::steady_clock::now();
      if (left <= std::chrono::nanoseconds::zero()) {
        result.killed_by_timeout = true;
        break;
      }
      auto ms = std::chrono::ceil<std::chrono::milliseconds>(left).count();
      timeout_ms = static_cast<int>(std::min<long long>(ms, INT_MAX));
    }
    if (!pidfd) {
      timeout_ms = cap_timeout(timeout_ms, REAP_POLL_INTERVAL);
    }
    if (cancel.can_be_cancelled() && cancel.wait_fd() < 0) {
      timeout_ms = cap_timeout(timeout_ms, CANCEL_POLL_INTERVAL);
    }

    std::array<pollfd, 4> pfds{};
    nfds_t count = 0;
    int out_idx = -1;
    int err_idx = -1;
    if (pidfd) {
      pfds[count++] = {pidfd.get(), POLLIN, 0};
    }
    if (out.read_end) {
      out_idx = static_cast<int>(count);
      pfds[count++] = {out.read_end.get(), POLLIN, 0};
    }
    if (err.read_end) {
      err_idx = static_cast<int>(count);
      pfds[count++] = {err.read_end.get(), POLLIN, 0};
    }
    if (cancel.wait_fd() >= 0) {
      pfds[count++] = {cancel.wait_fd(), POLLIN, 0};
    }

    int rc = ::poll(pfds.data(), count, timeout_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      log_.error("poll failed while waiting for pid {}: {}", pid,
                 std::strerror(errno));
      std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }

    if (out_idx >= 0 && pfds[static_cast<std::size_t>(out_idx)].revents != 0) {
      pump(out);
    }
    if (err_idx >= 0 && pfds[static_cast<std::size_t>(err_idx)].revents != 0) {
      pump(err);
    }

    int w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      reaped = true;
      break;
    }
    if (w < 0 && errno != EINTR) {
      log_.warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      status = -1;
      reaped = true;
      break;
    }
  }

  if (result.killed_by_timeout || result.cancelled) {
    if (::kill(-pid, SIGKILL) < 0) {
      ::kill(pid, SIGKILL);
    }
  }

  // Whatever the child managed to write before it went away
  if (out.read_end) {
    pump(out);
  }
  if (err.read_end) {
    pump(err);
  }

  if (!reaped) {
    status = reap(pid);
  }

  if (!result.killed_by_timeout && !result.cancelled) {
    result.exit_code = status < 0 ? -1 : get_exit_code(status);
  }
  return result;
}

}  // namespace

auto OutputTargets::standard() -> OutputTargets {
  return OutputTargets{{STDOUT_FILENO}, {STDERR_FILENO}};
}

auto create_process_runner(log::Logger& logger)
    -> std::unique_ptr<IProcessRunner> {
  return std::make_unique<ProcessRunner>(logger);
}

}  // namespace cronrunner
