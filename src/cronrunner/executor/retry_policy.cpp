#include "cronrunner/executor/retry_policy.hpp"

namespace cronrunner {

auto RetryPolicy::decide(const RunAttempt& attempt) const noexcept
    -> RetryDecision {
  if (!restart_on_failure_) {
    return RetryDecision::Stop;
  }

  switch (attempt.outcome()) {
    case AttemptOutcome::Succeeded:
    case AttemptOutcome::Cancelled:
      return RetryDecision::Stop;
    case AttemptOutcome::Failed:
      return trigger_ == RetryTrigger::Failure ? RetryDecision::Continue
                                               : RetryDecision::Stop;
    case AttemptOutcome::TimedOut:
      // The deadline is shared, so the gate refuses the attempt this asks for
      return trigger_ == RetryTrigger::Timeout ? RetryDecision::Continue
                                               : RetryDecision::Stop;
  }
  return RetryDecision::Stop;
}

}  // namespace cronrunner
