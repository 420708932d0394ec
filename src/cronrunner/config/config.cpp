#include "cronrunner/config/config.hpp"

#include "cronrunner/config/yaml_utils.hpp"
#include "cronrunner/util/base64.hpp"
#include "cronrunner/util/log.hpp"
#include "cronrunner/util/util.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<cronrunner::ConfigSource> {
  static bool decode(const Node& node, cronrunner::ConfigSource& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.schedule = cronrunner::yaml_get_text(node, "schedule");
    c.command = cronrunner::yaml_get_text(node, "command");
    c.kill_after = cronrunner::yaml_get_text(node, "kill_after");
    c.kill_after_min = cronrunner::yaml_get_text(node, "kill_after_min");
    c.restart_on_failure =
        cronrunner::yaml_get_text(node, "restart_on_failure");
    c.restart_on = cronrunner::yaml_get_text(node, "restart_on");
    c.log_file = cronrunner::yaml_get_text(node, "log_file");
    c.log_mode = cronrunner::yaml_get_text(node, "log_mode");
    c.overlap = cronrunner::yaml_get_text(node, "overlap");
    c.timezone = cronrunner::yaml_get_text(node, "timezone");
    c.log_level = cronrunner::yaml_get_text(node, "log_level");
    c.shutdown_timeout = cronrunner::yaml_get_text(node, "shutdown_timeout");
    return true;
  }
};

}  // namespace YAML

namespace cronrunner {

namespace {

auto kill_after_from_minutes(std::string_view text)
    -> Result<std::optional<std::chrono::nanoseconds>> {
  auto s = trim(text);
  long long minutes = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), minutes);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    log::error("Invalid {} value '{}': not an integer", env::kKillAfterMin,
               text);
    return fail(Error::ParseError);
  }
  if (minutes <= 0) {
    return std::optional<std::chrono::nanoseconds>{};
  }
  return std::optional<std::chrono::nanoseconds>{std::chrono::minutes(minutes)};
}

auto kill_after_from_duration(std::string_view text)
    -> Result<std::optional<std::chrono::nanoseconds>> {
  auto d = parse_duration(text);
  if (!d) {
    log::error("Invalid {} value '{}': expected a duration like 90s or 1h30m",
               env::kKillAfter, text);
    return fail(Error::ParseError);
  }
  if (*d <= std::chrono::nanoseconds::zero()) {
    return std::optional<std::chrono::nanoseconds>{};
  }
  return std::optional<std::chrono::nanoseconds>{*d};
}

auto zoneinfo_dir() -> std::filesystem::path {
  if (const char* dir = std::getenv("TZDIR"); dir && *dir) {
    return dir;
  }
  return "/usr/share/zoneinfo";
}

}  // namespace

auto process_env() -> EnvLookup {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr || *value == '\0') {
      return std::nullopt;
    }
    return std::string(value);
  };
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<ConfigSource> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<ConfigSource> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    if (!root.IsMap()) {
      log::error("Failed to parse YAML: top level must be a mapping");
      return fail(Error::ParseError);
    }
    return ok(root.as<ConfigSource>());
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_from_env(const EnvLookup& env)
    -> Result<ConfigSource> {
  return merge_env(ConfigSource{}, env);
}

auto ConfigLoader::merge_env(ConfigSource base, const EnvLookup& env)
    -> Result<ConfigSource> {
  auto decoded = [&](std::string_view name,
                     std::optional<std::string>& field) -> Result<void> {
    auto value = env(name);
    if (!value) {
      return ok();
    }
    auto text = base64_decode(*value);
    if (!text) {
      log::error("Failed to decode {}: {}", name, text.error().message());
      return fail(text.error());
    }
    field = std::move(*text);
    return ok();
  };

  auto plain = [&](std::string_view name, std::optional<std::string>& field) {
    if (auto value = env(name)) {
      field = std::move(*value);
    }
  };

  if (auto r = decoded(env::kCronExpression, base.schedule); !r) {
    return fail(r.error());
  }
  if (auto r = decoded(env::kCronCmd, base.command); !r) {
    return fail(r.error());
  }

  plain(env::kKillAfterMin, base.kill_after_min);
  plain(env::kKillAfter, base.kill_after);
  plain(env::kLogFile, base.log_file);
  plain(env::kRestartOnFail, base.restart_on_failure);
  plain(env::kRestartOn, base.restart_on);
  plain(env::kLogMode, base.log_mode);
  plain(env::kOverlap, base.overlap);
  plain(env::kCronTz, base.timezone);
  plain(env::kLogLevel, base.log_level);
  plain(env::kShutdownTimeout, base.shutdown_timeout);
  return ok(std::move(base));
}

auto ConfigLoader::build(const ConfigSource& source) -> Result<Config> {
  Config config;
  auto& job = config.job;

  if (!source.schedule || trim(*source.schedule).empty()) {
    log::error("{} environment variable is required", env::kCronExpression);
    return fail(Error::MissingVariable);
  }
  auto schedule = CronExpr::parse(*source.schedule, CronExpr::Zone::Local);
  if (!schedule) {
    log::error("Invalid cron schedule '{}': {}", *source.schedule,
               schedule.error().message());
    return fail(schedule.error());
  }
  job.schedule = std::move(*schedule);

  // A command that decodes to blank text is accepted; firings skip it
  if (!source.command) {
    log::error("{} environment variable is required", env::kCronCmd);
    return fail(Error::MissingVariable);
  }
  job.set_command(*source.command);

  if (source.kill_after) {
    auto k = kill_after_from_duration(*source.kill_after);
    if (!k) {
      return fail(k.error());
    }
    job.kill_after = *k;
  } else if (source.kill_after_min) {
    auto k = kill_after_from_minutes(*source.kill_after_min);
    if (!k) {
      return fail(k.error());
    }
    job.kill_after = *k;
  }

  if (source.restart_on_failure) {
    job.restart_on_failure = parse_flag(*source.restart_on_failure);
  }

  if (source.restart_on) {
    auto t = parse_retry_trigger(*source.restart_on);
    if (!t) {
      log::error("Invalid {} value '{}': expected failure or timeout",
                 env::kRestartOn, *source.restart_on);
      return fail(Error::InvalidArgument);
    }
    job.retry_on = *t;
  }

  if (source.log_file && !trim(*source.log_file).empty()) {
    job.log_path = std::filesystem::path(std::string(trim(*source.log_file)));
  }

  if (source.log_mode) {
    auto m = parse_log_mode(*source.log_mode);
    if (!m) {
      log::error("Invalid {} value '{}': expected per-run or persistent",
                 env::kLogMode, *source.log_mode);
      return fail(Error::InvalidArgument);
    }
    job.log_mode = *m;
  }

  if (source.overlap) {
    auto p = parse_overlap_policy(*source.overlap);
    if (!p) {
      log::error("Invalid {} value '{}': expected allow or skip",
                 env::kOverlap, *source.overlap);
      return fail(Error::InvalidArgument);
    }
    job.overlap = *p;
  }

  auto& runner = config.runner;
  if (source.timezone) {
    auto tz = std::string(trim(*source.timezone));
    if (!tz.empty()) {
      if (auto r = validate_timezone(tz); !r) {
        log::error("Invalid {} value '{}'", env::kCronTz, tz);
        return fail(r.error());
      }
      runner.timezone = std::move(tz);
    }
  }

  if (source.log_level) {
    if (!log::parse_level(trim(*source.log_level))) {
      log::error("Invalid {} value '{}'", env::kLogLevel, *source.log_level);
      return fail(Error::InvalidArgument);
    }
    runner.log_level = to_lower(trim(*source.log_level));
  }

  if (source.shutdown_timeout) {
    auto d = parse_duration(*source.shutdown_timeout);
    if (!d || *d < std::chrono::nanoseconds::zero()) {
      log::error("Invalid {} value '{}'", env::kShutdownTimeout,
                 *source.shutdown_timeout);
      return fail(Error::ParseError);
    }
    runner.shutdown_timeout = *d;
  }

  return ok(std::move(config));
}

auto ConfigLoader::validate_timezone(std::string_view name) -> Result<void> {
  if (name == "UTC" || name == "Local") {
    return ok();
  }
  if (name.empty() || name.front() == '/' ||
      name.find("..") != std::string_view::npos) {
    return fail(Error::InvalidTimezone);
  }
  std::error_code ec;
  auto path = zoneinfo_dir() / std::string(name);
  if (!std::filesystem::is_regular_file(path, ec)) {
    return fail(Error::InvalidTimezone);
  }
  return ok();
}

auto ConfigLoader::apply_timezone(std::string_view name) -> Result<void> {
  if (auto r = validate_timezone(name); !r) {
    return r;
  }
  if (name == "Local") {
    return ok();
  }
  if (::setenv("TZ", std::string(name).c_str(), 1) != 0) {
    return fail(last_system_error());
  }
  ::tzset();
  return ok();
}

}  // namespace cronrunner
