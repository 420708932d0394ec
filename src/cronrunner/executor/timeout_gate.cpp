#include "cronrunner/executor/timeout_gate.hpp"

namespace cronrunner {

auto TimeoutGate::check(const std::optional<Deadline>& deadline,
                        std::chrono::steady_clock::time_point now) noexcept
    -> Decision {
  if (!deadline) {
    return Decision{Verdict::Unbounded, std::chrono::nanoseconds::zero()};
  }
  auto remaining = deadline->at - now;
  if (remaining <= std::chrono::nanoseconds::zero()) {
    return Decision{Verdict::Expired, std::chrono::nanoseconds::zero()};
  }
  return Decision{Verdict::Remaining,
                  std::chrono::duration_cast<std::chrono::nanoseconds>(remaining)};
}

}  // namespace cronrunner
