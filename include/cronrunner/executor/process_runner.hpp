#pragma once

#include "cronrunner/executor/cancellation.hpp"

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cronrunner {

namespace log {
class Logger;
}

// Where the child's stdout and stderr go. A stream with exactly one
// destination is handed to the child as-is; with several the runner tees
// through a pipe; with none the output is discarded.
struct OutputTargets {
  std::vector<int> out;
  std::vector<int> err;

  [[nodiscard]] static auto standard() -> OutputTargets;
};

struct ProcessResult {
  int exit_code{-1};
  bool killed_by_timeout{false};
  bool cancelled{false};
  std::error_code error;  // set when the process never started
  pid_t pid{-1};
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /// Runs argv (argv[0] looked up in PATH, no shell) and blocks until it
  /// exits, `budget` elapses, or `cancel` fires. On budget or cancellation
  /// the whole process group is killed.
  virtual auto run(const std::vector<std::string>& argv,
                   const OutputTargets& targets,
                   std::optional<std::chrono::nanoseconds> budget,
                   const CancellationToken& cancel) -> ProcessResult = 0;
};

[[nodiscard]] auto create_process_runner(log::Logger& logger)
    -> std::unique_ptr<IProcessRunner>;

}  // namespace cronrunner
