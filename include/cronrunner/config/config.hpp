#pragma once

#include "cronrunner/config/job_config.hpp"
#include "cronrunner/core/error.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace cronrunner {

// Environment variables the runner reads
namespace env {
inline constexpr std::string_view kCronExpression = "CRON_EXPRESSION";
inline constexpr std::string_view kCronCmd = "CRON_CMD";
inline constexpr std::string_view kKillAfterMin = "CRON_KILL_AFTER_MIN";
inline constexpr std::string_view kKillAfter = "CRON_KILL_AFTER";
inline constexpr std::string_view kLogFile = "LOG_FILE";
inline constexpr std::string_view kRestartOnFail = "RESTART_ON_FAIL";
inline constexpr std::string_view kRestartOn = "RESTART_ON";
inline constexpr std::string_view kLogMode = "LOG_MODE";
inline constexpr std::string_view kOverlap = "OVERLAP";
inline constexpr std::string_view kCronTz = "CRON_TZ";
inline constexpr std::string_view kLogLevel = "LOG_LEVEL";
inline constexpr std::string_view kShutdownTimeout = "SHUTDOWN_TIMEOUT";
}  // namespace env

using EnvLookup =
    std::function<std::optional<std::string>(std::string_view name)>;

/// Reads the real process environment; unset and empty both map to nullopt
[[nodiscard]] auto process_env() -> EnvLookup;

// Unvalidated settings as text, collected from a YAML file and/or the
// environment before anything is interpreted.
struct ConfigSource {
  std::optional<std::string> schedule;
  std::optional<std::string> command;
  std::optional<std::string> kill_after;
  std::optional<std::string> kill_after_min;
  std::optional<std::string> restart_on_failure;
  std::optional<std::string> restart_on;
  std::optional<std::string> log_file;
  std::optional<std::string> log_mode;
  std::optional<std::string> overlap;
  std::optional<std::string> timezone;
  std::optional<std::string> log_level;
  std::optional<std::string> shutdown_timeout;
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<ConfigSource>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<ConfigSource>;

  /// Settings from the environment alone
  [[nodiscard]] static auto load_from_env(const EnvLookup& env)
      -> Result<ConfigSource>;

  /// Overlays set variables onto `base`. CRON_EXPRESSION and CRON_CMD are
  /// base64 encoded.
  [[nodiscard]] static auto merge_env(ConfigSource base, const EnvLookup& env)
      -> Result<ConfigSource>;

  /// Validates everything and produces the immutable configuration
  [[nodiscard]] static auto build(const ConfigSource& source) -> Result<Config>;

  /// Checks that `name` is a known zone ("UTC", "Local" or a zoneinfo entry)
  [[nodiscard]] static auto validate_timezone(std::string_view name)
      -> Result<void>;

  /// Makes `name` the process time zone (TZ) used by local-time schedules
  [[nodiscard]] static auto apply_timezone(std::string_view name)
      -> Result<void>;
};

}  // namespace cronrunner
