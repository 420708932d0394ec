#include "cronrunner/config/config.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"

using namespace cronrunner;
using namespace std::chrono_literals;

namespace {

// "* * * * *" and "echo hello"
constexpr const char* kEveryMinuteB64 = "KiAqICogKiAq";
constexpr const char* kEchoHelloB64 = "ZWNobyBoZWxsbw==";

auto build_from(std::map<std::string, std::string> vars) -> Result<Config> {
  auto source = ConfigLoader::load_from_env(test::env_from(std::move(vars)));
  if (!source) {
    return fail(source.error());
  }
  return ConfigLoader::build(*source);
}

auto base_env() -> std::map<std::string, std::string> {
  return {{"CRON_EXPRESSION", kEveryMinuteB64}, {"CRON_CMD", kEchoHelloB64}};
}

auto with(std::string key, std::string value)
    -> std::map<std::string, std::string> {
  auto vars = base_env();
  vars[std::move(key)] = std::move(value);
  return vars;
}

}  // namespace

class ConfigTest : public ::testing::Test {};

TEST_F(ConfigTest, MinimalEnvironment) {
  auto config = build_from(base_env());
  ASSERT_TRUE(config.has_value());

  const auto& job = config->job;
  EXPECT_EQ(job.schedule.raw(), "* * * * *");
  EXPECT_EQ(job.command_line, "echo hello");
  ASSERT_EQ(job.command.size(), 2u);
  EXPECT_EQ(job.command[0], "echo");
  EXPECT_EQ(job.command[1], "hello");
  EXPECT_FALSE(job.kill_after.has_value());
  EXPECT_FALSE(job.restart_on_failure);
  EXPECT_EQ(job.retry_on, RetryTrigger::Failure);
  EXPECT_FALSE(job.log_path.has_value());
  EXPECT_EQ(job.log_mode, LogMode::PerAttempt);
  EXPECT_EQ(job.overlap, OverlapPolicy::Allow);
  EXPECT_EQ(config->runner.log_level, "info");
  EXPECT_TRUE(config->runner.timezone.empty());
  EXPECT_EQ(config->runner.shutdown_timeout, 0ns);
}

TEST_F(ConfigTest, MissingScheduleIsFatal) {
  auto config = build_from({{"CRON_CMD", kEchoHelloB64}});
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().value(), static_cast<int>(Error::MissingVariable));
}

TEST_F(ConfigTest, MissingCommandIsFatal) {
  auto config = build_from({{"CRON_EXPRESSION", kEveryMinuteB64}});
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().value(), static_cast<int>(Error::MissingVariable));
}

TEST_F(ConfigTest, EmptyVariableCountsAsMissing) {
  auto config = build_from(with("CRON_CMD", ""));
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().value(), static_cast<int>(Error::MissingVariable));
}

TEST_F(ConfigTest, InvalidBase64IsFatal) {
  auto source = ConfigLoader::load_from_env(
      test::env_from(with("CRON_EXPRESSION", "not base64!")));
  ASSERT_FALSE(source.has_value());
  EXPECT_EQ(source.error().value(), static_cast<int>(Error::DecodeError));
}

TEST_F(ConfigTest, InvalidScheduleIsFatal) {
  // "* * * *"
  auto config = build_from(with("CRON_EXPRESSION", "KiAqICogKg=="));
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().value(), static_cast<int>(Error::ParseError));
}

TEST_F(ConfigTest, BlankCommandIsAccepted) {
  auto config = build_from(with("CRON_CMD", "ICA="));
  ASSERT_TRUE(config.has_value());
  EXPECT_TRUE(config->job.command.empty());
}

TEST_F(ConfigTest, KillAfterMinutes) {
  auto config = build_from(with("CRON_KILL_AFTER_MIN", "5"));
  ASSERT_TRUE(config.has_value());
  ASSERT_TRUE(config->job.kill_after.has_value());
  EXPECT_EQ(*config->job.kill_after, 5min);
}

TEST_F(ConfigTest, KillAfterMinutesZeroOrNegativeIsUnbounded) {
  for (auto value : {"0", "-3"}) {
    auto config = build_from(with("CRON_KILL_AFTER_MIN", value));
    ASSERT_TRUE(config.has_value()) << value;
    EXPECT_FALSE(config->job.kill_after.has_value()) << value;
  }
}

TEST_F(ConfigTest, KillAfterMinutesMustBeInteger) {
  for (auto value : {"abc", "1.5", "5m"}) {
    auto config = build_from(with("CRON_KILL_AFTER_MIN", value));
    ASSERT_FALSE(config.has_value()) << value;
    EXPECT_EQ(config.error().value(), static_cast<int>(Error::ParseError));
  }
}

TEST_F(ConfigTest, KillAfterDurationOverridesMinutes) {
  auto vars = with("CRON_KILL_AFTER_MIN", "5");
  vars["CRON_KILL_AFTER"] = "90s";
  auto config = build_from(vars);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(*config->job.kill_after, 90s);
}

TEST_F(ConfigTest, KillAfterDurationInvalid) {
  auto config = build_from(with("CRON_KILL_AFTER", "soon"));
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().value(), static_cast<int>(Error::ParseError));
}

TEST_F(ConfigTest, RestartOnFailFlag) {
  for (auto value : {"1", "true", "TRUE", "yes", "Y", " y "}) {
    auto config = build_from(with("RESTART_ON_FAIL", value));
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->job.restart_on_failure) << value;
  }
  for (auto value : {"0", "false", "no", "on", "enabled"}) {
    auto config = build_from(with("RESTART_ON_FAIL", value));
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->job.restart_on_failure) << value;
  }
}

TEST_F(ConfigTest, RestartOnTrigger) {
  auto config = build_from(with("RESTART_ON", "timeout"));
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->job.retry_on, RetryTrigger::Timeout);

  auto bad = build_from(with("RESTART_ON", "always"));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().value(), static_cast<int>(Error::InvalidArgument));
}

TEST_F(ConfigTest, LogFileAndMode) {
  auto vars = with("LOG_FILE", "/var/log/job.log");
  vars["LOG_MODE"] = "persistent";
  auto config = build_from(vars);
  ASSERT_TRUE(config.has_value());
  ASSERT_TRUE(config->job.log_path.has_value());
  EXPECT_EQ(config->job.log_path->string(), "/var/log/job.log");
  EXPECT_EQ(config->job.log_mode, LogMode::Persistent);

  auto bad = build_from(with("LOG_MODE", "sometimes"));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().value(), static_cast<int>(Error::InvalidArgument));
}

TEST_F(ConfigTest, OverlapPolicy) {
  auto config = build_from(with("OVERLAP", "skip"));
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->job.overlap, OverlapPolicy::Skip);

  auto bad = build_from(with("OVERLAP", "queue"));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().value(), static_cast<int>(Error::InvalidArgument));
}

TEST_F(ConfigTest, TimezoneValidation) {
  auto config = build_from(with("CRON_TZ", "UTC"));
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->runner.timezone, "UTC");

  auto bad = build_from(with("CRON_TZ", "Mars/Olympus_Mons"));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().value(), static_cast<int>(Error::InvalidTimezone));
}

TEST_F(ConfigTest, TimezoneFromZoneinfo) {
  if (!std::filesystem::exists("/usr/share/zoneinfo/Europe/Berlin")) {
    GTEST_SKIP() << "tzdata not installed";
  }
  EXPECT_TRUE(ConfigLoader::validate_timezone("Europe/Berlin").has_value());
}

TEST_F(ConfigTest, TimezoneRejectsPathTricks) {
  EXPECT_FALSE(ConfigLoader::validate_timezone("../../etc/passwd").has_value());
  EXPECT_FALSE(ConfigLoader::validate_timezone("/etc/localtime").has_value());
  EXPECT_FALSE(ConfigLoader::validate_timezone("").has_value());
}

TEST_F(ConfigTest, LogLevelAndShutdownTimeout) {
  auto vars = with("LOG_LEVEL", "DEBUG");
  vars["SHUTDOWN_TIMEOUT"] = "30s";
  auto config = build_from(vars);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->runner.log_level, "debug");
  EXPECT_EQ(config->runner.shutdown_timeout, 30s);

  auto bad = build_from(with("LOG_LEVEL", "verbose"));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().value(), static_cast<int>(Error::InvalidArgument));
}

TEST_F(ConfigTest, LoadYamlString) {
  auto source = ConfigLoader::load_from_string(R"(
schedule: "*/5 * * * *"
command: sleep 10
kill_after: 2m
restart_on_failure: true
restart_on: timeout
log_file: /tmp/job.log
overlap: skip
shutdown_timeout: 1m
)");
  ASSERT_TRUE(source.has_value());

  auto config = ConfigLoader::build(*source);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->job.schedule.raw(), "*/5 * * * *");
  ASSERT_EQ(config->job.command.size(), 2u);
  EXPECT_EQ(config->job.command[0], "sleep");
  EXPECT_EQ(*config->job.kill_after, 2min);
  EXPECT_TRUE(config->job.restart_on_failure);
  EXPECT_EQ(config->job.retry_on, RetryTrigger::Timeout);
  EXPECT_EQ(config->job.log_path->string(), "/tmp/job.log");
  EXPECT_EQ(config->job.overlap, OverlapPolicy::Skip);
  EXPECT_EQ(config->runner.shutdown_timeout, 1min);
}

TEST_F(ConfigTest, EnvironmentOverridesYaml) {
  auto source = ConfigLoader::load_from_string(R"(
schedule: "0 3 * * *"
command: sleep 10
kill_after_min: 10
)");
  ASSERT_TRUE(source.has_value());

  auto merged = ConfigLoader::merge_env(
      *source, test::env_from({{"CRON_CMD", kEchoHelloB64},
                               {"CRON_KILL_AFTER_MIN", "2"}}));
  ASSERT_TRUE(merged.has_value());

  auto config = ConfigLoader::build(*merged);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->job.schedule.raw(), "0 3 * * *");
  EXPECT_EQ(config->job.command_line, "echo hello");
  EXPECT_EQ(*config->job.kill_after, 2min);
}

TEST_F(ConfigTest, LoadYamlInvalid) {
  auto result = ConfigLoader::load_from_string("schedule: [unclosed");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().value(), static_cast<int>(Error::ParseError));
}

TEST_F(ConfigTest, LoadYamlNotAMapping) {
  auto result = ConfigLoader::load_from_string("- a\n- b\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().value(), static_cast<int>(Error::ParseError));
}

TEST_F(ConfigTest, LoadFile) {
  test::TempDir dir;
  auto path = dir.file("cronrunner.yaml");
  {
    std::ofstream out(path);
    out << "schedule: \"@hourly\"\ncommand: \"true\"\n";
  }

  auto source = ConfigLoader::load_from_file(path.string());
  ASSERT_TRUE(source.has_value());
  EXPECT_EQ(source->schedule.value_or(""), "@hourly");
  EXPECT_EQ(source->command.value_or(""), "true");
}

TEST_F(ConfigTest, LoadFileNotFound) {
  auto result = ConfigLoader::load_from_file("/nonexistent/cronrunner.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().value(), static_cast<int>(Error::FileNotFound));
}
