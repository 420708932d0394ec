#include "cronrunner/config/job_config.hpp"

#include "cronrunner/util/util.hpp"

namespace cronrunner {

auto parse_retry_trigger(std::string_view s) -> std::optional<RetryTrigger> {
  auto v = trim(s);
  if (iequals(v, "failure"))
    return RetryTrigger::Failure;
  if (iequals(v, "timeout"))
    return RetryTrigger::Timeout;
  return std::nullopt;
}

auto parse_log_mode(std::string_view s) -> std::optional<LogMode> {
  auto v = trim(s);
  if (iequals(v, "per-run") || iequals(v, "per-attempt"))
    return LogMode::PerAttempt;
  if (iequals(v, "persistent"))
    return LogMode::Persistent;
  return std::nullopt;
}

auto parse_overlap_policy(std::string_view s) -> std::optional<OverlapPolicy> {
  auto v = trim(s);
  if (iequals(v, "allow"))
    return OverlapPolicy::Allow;
  if (iequals(v, "skip"))
    return OverlapPolicy::Skip;
  return std::nullopt;
}

auto parse_flag(std::string_view s) noexcept -> bool {
  auto v = trim(s);
  return v == "1" || iequals(v, "true") || iequals(v, "yes") || iequals(v, "y");
}

auto JobConfig::set_command(std::string_view line) -> void {
  command_line = std::string(line);
  command = split_fields(line);
}

}  // namespace cronrunner
