#include "cronrunner/executor/job_executor.hpp"

#include "cronrunner/executor/output_sink.hpp"
#include "cronrunner/executor/process_runner.hpp"
#include "cronrunner/executor/retry_policy.hpp"
#include "cronrunner/util/log.hpp"
#include "cronrunner/util/util.hpp"

#include <string>

namespace cronrunner {

namespace {

inline constexpr int EXIT_NOT_STARTED = 127;
inline constexpr int EXIT_TIMED_OUT = 124;
inline constexpr int EXIT_CANCELLED = 130;

auto status_of(AttemptOutcome outcome) noexcept -> FiringStatus {
  switch (outcome) {
    case AttemptOutcome::Succeeded: return FiringStatus::Succeeded;
    case AttemptOutcome::Failed: return FiringStatus::Failed;
    case AttemptOutcome::TimedOut: return FiringStatus::TimedOut;
    case AttemptOutcome::Cancelled: return FiringStatus::Cancelled;
  }
  return FiringStatus::Failed;
}

}  // namespace

JobExecutor::JobExecutor(const JobConfig& job, IProcessRunner& runner,
                         OutputSink& sink, log::Logger& logger)
    : job_(job), runner_(runner), sink_(sink), log_(logger) {
}

auto JobExecutor::run(const CancellationToken& cancel) -> RunOutcome {
  auto id = generate_firing_id();
  auto start = std::chrono::steady_clock::now();
  RunOutcome outcome;

  if (job_.command.empty()) {
    log_.info("[{}] Empty command, skipping execution", id);
    outcome.status = FiringStatus::Skipped;
    return outcome;
  }

  log_.info("[{}] Executing command: {}", id, job_.command_line);

  std::optional<Deadline> deadline;
  if (job_.kill_after) {
    deadline = Deadline::after(*job_.kill_after, start,
                               std::chrono::system_clock::now());
    log_.info("[{}] Hard kill deadline set for {} (limit: {})", id,
              format_rfc3339(deadline->wall), format_duration(deadline->limit));
  }

  auto policy = RetryPolicy::from(job_);

  for (int number = 1;; ++number) {
    if (cancel.is_cancelled()) {
      log_.warn("[{}] Cancelled; not starting attempt {}", id, number);
      outcome.status = FiringStatus::Cancelled;
      break;
    }

    auto gate = TimeoutGate::check(deadline, std::chrono::steady_clock::now());
    if (!gate.allows_attempt()) {
      log_.warn("[{}] Kill deadline reached; not starting attempt {}", id,
                number);
      outcome.status = FiringStatus::DeadlineExhausted;
      outcome.terminated_by_deadline = true;
      break;
    }

    auto attempt = run_attempt(id, number, gate.budget(), cancel);
    report(id, attempt, deadline);

    outcome.attempts = number;
    outcome.final_exit_code = attempt.exit_code;
    outcome.status = status_of(attempt.outcome());
    outcome.terminated_by_deadline = attempt.killed_by_timeout;

    if (policy.decide(attempt) == RetryDecision::Stop) {
      break;
    }
    log_.info("[{}] Restart on failure is enabled; restarting command "
              "(next attempt {})",
              id, number + 1);
  }

  outcome.total_duration = std::chrono::steady_clock::now() - start;
  log_.info("[{}] Firing finished: status={} attempts={} exit={} elapsed={}",
            id, to_string_view(outcome.status), outcome.attempts,
            outcome.final_exit_code, format_duration(outcome.total_duration));
  return outcome;
}

auto JobExecutor::run_attempt(std::string_view firing_id, int number,
                              std::optional<std::chrono::nanoseconds> budget,
                              const CancellationToken& cancel) -> RunAttempt {
  RunAttempt attempt;
  attempt.attempt = number;
  attempt.started_at = std::chrono::system_clock::now();

  if (budget) {
    log_.info("[{}] Starting attempt {} (budget {})", firing_id, number,
              format_duration(*budget));
  } else {
    log_.info("[{}] Starting attempt {}", firing_id, number);
  }

  auto output = sink_.begin_attempt(firing_id);
  auto start = std::chrono::steady_clock::now();
  auto result = runner_.run(job_.command, output.targets(), budget, cancel);
  attempt.duration = std::chrono::steady_clock::now() - start;

  attempt.exit_code = result.exit_code;
  attempt.killed_by_timeout = result.killed_by_timeout;
  attempt.cancelled = result.cancelled;
  attempt.error = result.error;

  output.finish(attempt);
  return attempt;
}

auto JobExecutor::report(std::string_view firing_id, const RunAttempt& attempt,
                         const std::optional<Deadline>& deadline) -> void {
  auto elapsed = format_duration(attempt.duration);

  switch (attempt.outcome()) {
    case AttemptOutcome::Succeeded:
      log_.info("[{}] Attempt {} completed after {}: exit code 0", firing_id,
                attempt.attempt, elapsed);
      break;
    case AttemptOutcome::Failed:
      if (attempt.error) {
        log_.error("[{}] Attempt {} failed to start {}: {}", firing_id,
                   attempt.attempt, job_.command.front(),
                   attempt.error.message());
      } else {
        log_.warn("[{}] Attempt {} exited after {}: exit code {}", firing_id,
                  attempt.attempt, elapsed, attempt.exit_code);
      }
      break;
    case AttemptOutcome::TimedOut:
      log_.warn("[{}] Attempt {} timed out after {}; hard deadline {} reached "
                "(limit: {}), process group killed",
                firing_id, attempt.attempt, elapsed,
                deadline ? format_rfc3339(deadline->wall) : std::string("-"),
                deadline ? format_duration(deadline->limit) : std::string("-"));
      break;
    case AttemptOutcome::Cancelled:
      log_.warn("[{}] Attempt {} cancelled after {}, process group killed",
                firing_id, attempt.attempt, elapsed);
      break;
  }
}

auto exit_status_of(const RunOutcome& outcome) noexcept -> int {
  switch (outcome.status) {
    case FiringStatus::Skipped:
    case FiringStatus::Succeeded:
      return 0;
    case FiringStatus::Failed:
      return outcome.final_exit_code < 0 ? EXIT_NOT_STARTED
                                         : outcome.final_exit_code;
    case FiringStatus::TimedOut:
    case FiringStatus::DeadlineExhausted:
      return EXIT_TIMED_OUT;
    case FiringStatus::Cancelled:
      return EXIT_CANCELLED;
  }
  return 1;
}

}  // namespace cronrunner
