#pragma once

#include "cronrunner/config/job_config.hpp"
#include "cronrunner/executor/attempt.hpp"
#include "cronrunner/executor/process_runner.hpp"
#include "cronrunner/io/fd.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace cronrunner {

namespace log {
class Logger;
}

// Output destinations of one attempt. Writes the RUN END marker exactly once:
// from finish(), or from the destructor if the attempt never got that far.
class AttemptOutput {
public:
  AttemptOutput(AttemptOutput&&) noexcept = default;
  auto operator=(AttemptOutput&&) noexcept -> AttemptOutput& = delete;
  AttemptOutput(const AttemptOutput&) = delete;
  auto operator=(const AttemptOutput&) -> AttemptOutput& = delete;

  ~AttemptOutput();

  [[nodiscard]] auto targets() const noexcept -> const OutputTargets& {
    return targets_;
  }

  [[nodiscard]] auto has_file() const noexcept -> bool {
    return file_ != nullptr;
  }

  auto finish(const RunAttempt& attempt) -> void;

private:
  friend class OutputSink;

  AttemptOutput(std::shared_ptr<io::Fd> file, std::string firing_id,
                log::Logger& logger);

  auto write_end(int exit_code, std::chrono::nanoseconds duration,
                 bool timed_out) -> void;

  std::shared_ptr<io::Fd> file_;
  std::string firing_id_;
  log::Logger* log_;
  OutputTargets targets_;
  std::chrono::steady_clock::time_point started_;
};

class OutputSink {
public:
  OutputSink(std::optional<std::filesystem::path> path, LogMode mode,
             log::Logger& logger);

  OutputSink(const OutputSink&) = delete;
  auto operator=(const OutputSink&) -> OutputSink& = delete;

  /// Opens (or reuses) the log file and writes the RUN START marker.
  /// Never fails: without a usable file the attempt gets stdout/stderr only.
  [[nodiscard]] auto begin_attempt(std::string_view firing_id)
      -> AttemptOutput;

  [[nodiscard]] auto path() const noexcept
      -> const std::optional<std::filesystem::path>& {
    return path_;
  }

  [[nodiscard]] auto mode() const noexcept -> LogMode {
    return mode_;
  }

private:
  auto open_file(std::string_view firing_id) -> std::shared_ptr<io::Fd>;

  std::optional<std::filesystem::path> path_;
  LogMode mode_;
  log::Logger& log_;

  std::mutex mutex_;
  std::shared_ptr<io::Fd> persistent_;
};

}  // namespace cronrunner
