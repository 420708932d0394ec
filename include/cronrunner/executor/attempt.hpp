#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace cronrunner {

enum class AttemptOutcome : std::uint8_t {
  Succeeded,
  Failed,     // nonzero exit or the process never started
  TimedOut,   // killed when the firing's deadline elapsed
  Cancelled,  // killed by a forced shutdown
};

// One execution of the child process inside a firing's retry loop
struct RunAttempt {
  int attempt{1};
  std::chrono::system_clock::time_point started_at{};
  std::chrono::nanoseconds duration{0};
  int exit_code{-1};
  bool killed_by_timeout{false};
  bool cancelled{false};
  std::error_code error;

  [[nodiscard]] auto outcome() const noexcept -> AttemptOutcome {
    if (cancelled)
      return AttemptOutcome::Cancelled;
    if (killed_by_timeout)
      return AttemptOutcome::TimedOut;
    if (error || exit_code != 0)
      return AttemptOutcome::Failed;
    return AttemptOutcome::Succeeded;
  }
};

enum class FiringStatus : std::uint8_t {
  Skipped,            // empty command, nothing spawned
  Succeeded,
  Failed,
  TimedOut,           // last attempt killed by the deadline
  DeadlineExhausted,  // a retry was refused because the deadline had passed
  Cancelled,
};

[[nodiscard]] constexpr auto to_string_view(FiringStatus s) noexcept
    -> std::string_view {
  switch (s) {
    case FiringStatus::Skipped: return "skipped";
    case FiringStatus::Succeeded: return "succeeded";
    case FiringStatus::Failed: return "failed";
    case FiringStatus::TimedOut: return "timed_out";
    case FiringStatus::DeadlineExhausted: return "deadline_exhausted";
    case FiringStatus::Cancelled: return "cancelled";
  }
  return "failed";
}

// Result of one firing; only ever consumed for logging (and --once)
struct RunOutcome {
  FiringStatus status{FiringStatus::Skipped};
  std::chrono::nanoseconds total_duration{0};
  int final_exit_code{0};
  int attempts{0};
  bool terminated_by_deadline{false};
};

}  // namespace cronrunner
