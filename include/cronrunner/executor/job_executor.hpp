#pragma once

#include "cronrunner/config/job_config.hpp"
#include "cronrunner/executor/attempt.hpp"
#include "cronrunner/executor/cancellation.hpp"
#include "cronrunner/executor/timeout_gate.hpp"

#include <chrono>
#include <optional>
#include <string_view>

namespace cronrunner {

class IProcessRunner;
class OutputSink;

namespace log {
class Logger;
}

// Runs one firing of the job: computes the deadline once, then loops
// gate -> runner -> classify -> retry policy until the policy stops or the
// gate refuses. Safe to call from several threads at once; each call is an
// independent firing.
class JobExecutor {
public:
  JobExecutor(const JobConfig& job, IProcessRunner& runner, OutputSink& sink,
              log::Logger& logger);

  [[nodiscard]] auto run(
      const CancellationToken& cancel = CancellationToken::none())
      -> RunOutcome;

private:
  auto run_attempt(std::string_view firing_id, int number,
                   std::optional<std::chrono::nanoseconds> budget,
                   const CancellationToken& cancel) -> RunAttempt;

  auto report(std::string_view firing_id, const RunAttempt& attempt,
              const std::optional<Deadline>& deadline) -> void;

  const JobConfig& job_;
  IProcessRunner& runner_;
  OutputSink& sink_;
  log::Logger& log_;
};

/// Process exit status for `--once`: 0 on success or skip, the child's exit
/// code on failure (127 when it never started), 124 after a deadline kill,
/// 130 when cancelled.
[[nodiscard]] auto exit_status_of(const RunOutcome& outcome) noexcept -> int;

}  // namespace cronrunner
