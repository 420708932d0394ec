#include "cronrunner/executor/output_sink.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <regex>
#include <string>

#include <unistd.h>

#include "gtest/gtest.h"

using namespace cronrunner;
using namespace std::chrono_literals;

namespace {

auto finished(int exit_code, std::chrono::nanoseconds duration,
              bool timed_out = false) -> RunAttempt {
  RunAttempt a;
  a.exit_code = exit_code;
  a.duration = duration;
  a.killed_by_timeout = timed_out;
  return a;
}

}  // namespace

class OutputSinkTest : public ::testing::Test {
protected:
  test::CapturingLogger capture_;
  test::TempDir dir_;
};

TEST_F(OutputSinkTest, NoLogPathUsesStandardStreams) {
  OutputSink sink(std::nullopt, LogMode::PerAttempt, capture_.logger());
  auto output = sink.begin_attempt("f1");

  EXPECT_FALSE(output.has_file());
  ASSERT_EQ(output.targets().out.size(), 1u);
  ASSERT_EQ(output.targets().err.size(), 1u);
  EXPECT_EQ(output.targets().out[0], STDOUT_FILENO);
  EXPECT_EQ(output.targets().err[0], STDERR_FILENO);
}

TEST_F(OutputSinkTest, MarkersBracketAttempt) {
  auto path = dir_.file("job.log");
  OutputSink sink(path, LogMode::PerAttempt, capture_.logger());

  {
    auto output = sink.begin_attempt("f1");
    ASSERT_TRUE(output.has_file());
    EXPECT_EQ(output.targets().out.size(), 2u);
    EXPECT_EQ(output.targets().err.size(), 2u);
    output.finish(finished(0, 1500ms));
  }

  auto content = test::read_file(path);
  std::regex shape(
      R"(===== RUN START \S+ =====\n===== RUN END \S+ exit=0 duration=1\.5s =====\n\n)");
  EXPECT_TRUE(std::regex_match(content, shape)) << content;
}

TEST_F(OutputSinkTest, TimeoutFlagInEndMarker) {
  auto path = dir_.file("job.log");
  OutputSink sink(path, LogMode::PerAttempt, capture_.logger());

  auto output = sink.begin_attempt("f1");
  output.finish(finished(-1, 2s, true));

  auto content = test::read_file(path);
  EXPECT_NE(content.find("exit=-1 duration=2s timeout=true ====="),
            std::string::npos)
      << content;
}

TEST_F(OutputSinkTest, EndMarkerWrittenWhenNotFinished) {
  auto path = dir_.file("job.log");
  OutputSink sink(path, LogMode::PerAttempt, capture_.logger());

  {
    [[maybe_unused]] auto output = sink.begin_attempt("f1");
  }

  auto content = test::read_file(path);
  EXPECT_EQ(test::count_occurrences(content, "RUN START"), 1u);
  EXPECT_EQ(test::count_occurrences(content, "RUN END"), 1u);
  EXPECT_NE(content.find("exit=-1"), std::string::npos);
}

TEST_F(OutputSinkTest, FinishWritesExactlyOneEndMarker) {
  auto path = dir_.file("job.log");
  OutputSink sink(path, LogMode::PerAttempt, capture_.logger());

  {
    auto output = sink.begin_attempt("f1");
    output.finish(finished(1, 10ms));
    output.finish(finished(1, 10ms));
  }

  auto content = test::read_file(path);
  EXPECT_EQ(test::count_occurrences(content, "RUN END"), 1u);
}

TEST_F(OutputSinkTest, AppendsAcrossAttempts) {
  auto path = dir_.file("job.log");
  OutputSink sink(path, LogMode::PerAttempt, capture_.logger());

  for (int i = 0; i < 3; ++i) {
    auto output = sink.begin_attempt("f1");
    output.finish(finished(i, 1ms));
  }

  auto content = test::read_file(path);
  EXPECT_EQ(test::count_occurrences(content, "RUN START"), 3u);
  EXPECT_EQ(test::count_occurrences(content, "RUN END"), 3u);
  EXPECT_NE(content.find("exit=2 "), std::string::npos);
}

TEST_F(OutputSinkTest, PersistentModeReusesOneHandle) {
  auto path = dir_.file("job.log");
  OutputSink sink(path, LogMode::Persistent, capture_.logger());

  int first_fd = -1;
  {
    auto output = sink.begin_attempt("f1");
    first_fd = output.targets().out.back();
    output.finish(finished(0, 1ms));
  }
  {
    auto output = sink.begin_attempt("f2");
    EXPECT_EQ(output.targets().out.back(), first_fd);
    output.finish(finished(0, 1ms));
  }

  auto content = test::read_file(path);
  EXPECT_EQ(test::count_occurrences(content, "RUN START"), 2u);
  EXPECT_EQ(test::count_occurrences(content, "RUN END"), 2u);
}

TEST_F(OutputSinkTest, OpenFailureIsNonFatal) {
  OutputSink sink(std::filesystem::path("/nonexistent-dir/job.log"),
                  LogMode::PerAttempt, capture_.logger());

  auto output = sink.begin_attempt("abcd1234");
  EXPECT_FALSE(output.has_file());
  EXPECT_EQ(output.targets().out.size(), 1u);
  EXPECT_EQ(output.targets().err.size(), 1u);
  output.finish(finished(0, 1ms));

  EXPECT_EQ(capture_.sink().count("Failed to open log file"), 1u);
  EXPECT_TRUE(capture_.sink().contains("[abcd1234]"));
}
