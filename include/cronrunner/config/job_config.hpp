#pragma once

#include "cronrunner/scheduler/cron.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cronrunner {

/// Which attempt outcome restart_on_failure reacts to
enum class RetryTrigger : std::uint8_t {
  Failure,  // nonzero exit or spawn failure; never after a deadline kill
  Timeout,  // deadline kill only; the spent deadline then refuses the retry
};

/// How child output reaches LOG_FILE
enum class LogMode : std::uint8_t {
  PerAttempt,  // open, bracket with markers, close around every attempt
  Persistent,  // one handle for the process lifetime, diagnostics mirrored
};

/// What happens when a firing is due while the previous one still runs
enum class OverlapPolicy : std::uint8_t {
  Allow,
  Skip,
};

[[nodiscard]] constexpr auto to_string_view(RetryTrigger t) noexcept
    -> std::string_view {
  switch (t) {
    case RetryTrigger::Failure: return "failure";
    case RetryTrigger::Timeout: return "timeout";
  }
  return "failure";
}

[[nodiscard]] constexpr auto to_string_view(LogMode m) noexcept
    -> std::string_view {
  switch (m) {
    case LogMode::PerAttempt: return "per-run";
    case LogMode::Persistent: return "persistent";
  }
  return "per-run";
}

[[nodiscard]] constexpr auto to_string_view(OverlapPolicy p) noexcept
    -> std::string_view {
  switch (p) {
    case OverlapPolicy::Allow: return "allow";
    case OverlapPolicy::Skip: return "skip";
  }
  return "allow";
}

[[nodiscard]] auto parse_retry_trigger(std::string_view s)
    -> std::optional<RetryTrigger>;
[[nodiscard]] auto parse_log_mode(std::string_view s) -> std::optional<LogMode>;
[[nodiscard]] auto parse_overlap_policy(std::string_view s)
    -> std::optional<OverlapPolicy>;

/// "1", "true", "yes", "y" in any case count as true; anything else is false
[[nodiscard]] auto parse_flag(std::string_view s) noexcept -> bool;

// The single supervised job. Built once at startup, then shared read-only by
// every firing.
struct JobConfig {
  CronExpr schedule;
  std::string command_line;
  std::vector<std::string> command;
  std::optional<std::chrono::nanoseconds> kill_after;
  bool restart_on_failure{false};
  RetryTrigger retry_on{RetryTrigger::Failure};
  std::optional<std::filesystem::path> log_path;
  LogMode log_mode{LogMode::PerAttempt};
  OverlapPolicy overlap{OverlapPolicy::Allow};

  /// Replaces command_line and re-tokenizes it on whitespace
  auto set_command(std::string_view line) -> void;
};

// Settings of the runner process itself
struct RunnerConfig {
  std::string log_level{"info"};
  std::string timezone;
  /// How long shutdown waits for in-flight firings; zero waits forever
  std::chrono::nanoseconds shutdown_timeout{0};
};

struct Config {
  JobConfig job;
  RunnerConfig runner;
};

}  // namespace cronrunner
