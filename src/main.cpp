#include "cronrunner/app/application.hpp"
#include "cronrunner/config/config.hpp"
#include "cronrunner/util/log.hpp"
#include "cronrunner/util/signals.hpp"
#include "cronrunner/util/util.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace {

inline constexpr std::size_t DEFAULT_LIST_COUNT = 5;

void print_usage(const char* prog) {
  fmt::print("cronrunner - run a command on a cron schedule\n");
  fmt::print("Usage: {} [OPTIONS]\n", prog);
  fmt::print("\n");
  fmt::print("The job is configured through environment variables:\n");
  fmt::print("  CRON_EXPRESSION       base64 cron schedule (required)\n");
  fmt::print("  CRON_CMD              base64 command line (required)\n");
  fmt::print("  CRON_KILL_AFTER_MIN   hard deadline per firing, minutes\n");
  fmt::print("  CRON_KILL_AFTER       hard deadline as a duration (90s, 1h30m)\n");
  fmt::print("  RESTART_ON_FAIL       1/true/yes/y to restart failed attempts\n");
  fmt::print("  RESTART_ON            failure (default) or timeout\n");
  fmt::print("  LOG_FILE              tee child output into this file\n");
  fmt::print("  LOG_MODE              per-run (default) or persistent\n");
  fmt::print("  OVERLAP               allow (default) or skip\n");
  fmt::print("  CRON_TZ               time zone for the schedule\n");
  fmt::print("  LOG_LEVEL             trace, debug, info, warn, error\n");
  fmt::print("  SHUTDOWN_TIMEOUT      kill in-flight firings after this long\n");
  fmt::print("\n");
  fmt::print("Options:\n");
  fmt::print("  -c, --config <file>   YAML config file (environment overrides)\n");
  fmt::print("  -o, --once            Run one firing now and exit with its code\n");
  fmt::print("  -l, --list [N]        Print the job and its next N firings\n");
  fmt::print("  -v, --version         Show version and exit\n");
  fmt::print("  -h, --help            Show this help message\n");
}

void print_version() {
  fmt::print("cronrunner v0.1.0\n");
}

struct Options {
  std::string config_file;
  std::size_t list_count = 0;
  bool list = false;
  bool once = false;
};

auto parse_count(std::string_view s) -> std::optional<std::size_t> {
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size() || value == 0) {
    return std::nullopt;
  }
  return value;
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        fmt::print(stderr, "Error: --config requires an argument\n");
        std::exit(1);
      }
      opts.config_file = argv[i];
    } else if (arg == "-o" || arg == "--once") {
      opts.once = true;
    } else if (arg == "-l" || arg == "--list") {
      opts.list = true;
      opts.list_count = DEFAULT_LIST_COUNT;
      if (i + 1 < argc) {
        if (auto n = parse_count(argv[i + 1])) {
          opts.list_count = *n;
          ++i;
        }
      }
    } else {
      fmt::print(stderr, "Unknown option: {}\n", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto load_config(const Options& opts) -> cronrunner::Result<cronrunner::Config> {
  using cronrunner::ConfigLoader;

  cronrunner::ConfigSource source;
  if (!opts.config_file.empty()) {
    auto file = ConfigLoader::load_from_file(opts.config_file);
    if (!file) {
      return cronrunner::fail(file.error());
    }
    source = std::move(*file);
  }

  auto merged = ConfigLoader::merge_env(std::move(source),
                                        cronrunner::process_env());
  if (!merged) {
    return cronrunner::fail(merged.error());
  }
  return ConfigLoader::build(*merged);
}

void list_job(const cronrunner::Application& app, std::size_t count) {
  const auto& job = app.config().job;
  fmt::print("schedule:    {}\n", job.schedule.raw());
  fmt::print("command:     {}\n", job.command_line);
  fmt::print("kill after:  {}\n",
             job.kill_after ? cronrunner::format_duration(*job.kill_after)
                            : std::string("unbounded"));
  fmt::print("restart:     {} (on {})\n", job.restart_on_failure ? "yes" : "no",
             cronrunner::to_string_view(job.retry_on));
  fmt::print("log file:    {} ({})\n",
             job.log_path ? job.log_path->string() : std::string("-"),
             cronrunner::to_string_view(job.log_mode));
  fmt::print("overlap:     {}\n", cronrunner::to_string_view(job.overlap));
  fmt::print("next firings:\n");
  for (auto tp : app.upcoming(count)) {
    fmt::print("  {}\n", cronrunner::format_rfc3339(tp));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  auto config = load_config(opts);
  if (!config) {
    cronrunner::log::error("Configuration error: {}",
                           config.error().message());
    return 1;
  }

  if (auto level = cronrunner::log::parse_level(config->runner.log_level)) {
    cronrunner::log::set_level(*level);
  }

  if (!config->runner.timezone.empty()) {
    if (auto r = cronrunner::ConfigLoader::apply_timezone(
            config->runner.timezone);
        !r) {
      cronrunner::log::error("Invalid CRON_TZ value '{}': {}",
                             config->runner.timezone, r.error().message());
      return 1;
    }
    cronrunner::log::info("Using CRON_TZ timezone: {}",
                          config->runner.timezone);
  }

  // Persistent mode mirrors diagnostics into the job's log file
  if (config->job.log_mode == cronrunner::LogMode::Persistent &&
      config->job.log_path) {
    if (auto file = cronrunner::log::FileSink::open(*config->job.log_path)) {
      cronrunner::log::logger().add_sink(std::move(*file));
    } else {
      cronrunner::log::warn("Failed to mirror diagnostics into {}: {}",
                            config->job.log_path->string(),
                            file.error().message());
    }
  }

  cronrunner::Application app(std::move(*config));
  const auto& job = app.config().job;

  if (opts.list) {
    list_job(app, opts.list_count);
    return 0;
  }

  cronrunner::log::info("Starting cronrunner with schedule: {}",
                        job.schedule.raw());
  cronrunner::log::info("Command to execute: {}", job.command_line);
  if (job.kill_after) {
    cronrunner::log::info("Command timeout: {}",
                          cronrunner::format_duration(*job.kill_after));
  }

  if (opts.once) {
    auto outcome = app.run_once();
    return cronrunner::exit_status_of(outcome);
  }

  cronrunner::setup_signal_handlers();
  app.start();
  cronrunner::log::info("Cron runner started successfully");

  cronrunner::wait_for_shutdown();

  cronrunner::log::info("Shutting down cron runner...");
  app.stop();
  cronrunner::log::info("Cron runner stopped");
  return 0;
}
