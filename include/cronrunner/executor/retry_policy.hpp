#pragma once

#include "cronrunner/config/job_config.hpp"
#include "cronrunner/executor/attempt.hpp"

#include <cstdint>

namespace cronrunner {

enum class RetryDecision : std::uint8_t {
  Continue,
  Stop,
};

class RetryPolicy {
public:
  RetryPolicy(bool restart_on_failure, RetryTrigger trigger) noexcept
      : restart_on_failure_(restart_on_failure), trigger_(trigger) {
  }

  [[nodiscard]] static auto from(const JobConfig& config) noexcept
      -> RetryPolicy {
    return RetryPolicy{config.restart_on_failure, config.retry_on};
  }

  [[nodiscard]] auto decide(const RunAttempt& attempt) const noexcept
      -> RetryDecision;

  [[nodiscard]] auto trigger() const noexcept -> RetryTrigger {
    return trigger_;
  }

private:
  bool restart_on_failure_;
  RetryTrigger trigger_;
};

}  // namespace cronrunner
