#include "cronrunner/executor/timeout_gate.hpp"

#include <chrono>

#include "gtest/gtest.h"

using namespace cronrunner;
using namespace std::chrono_literals;

namespace {

auto deadline_in(std::chrono::nanoseconds limit,
                 std::chrono::steady_clock::time_point start) -> Deadline {
  return Deadline::after(limit, start, std::chrono::system_clock::now());
}

}  // namespace

TEST(TimeoutGateTest, NoDeadlineIsUnbounded) {
  auto d = TimeoutGate::check(std::nullopt, std::chrono::steady_clock::now());
  EXPECT_EQ(d.verdict, TimeoutGate::Verdict::Unbounded);
  EXPECT_TRUE(d.allows_attempt());
  EXPECT_FALSE(d.budget().has_value());
}

TEST(TimeoutGateTest, RemainingBudget) {
  auto start = std::chrono::steady_clock::now();
  auto deadline = deadline_in(10min, start);

  auto d = TimeoutGate::check(deadline, start + 4min);
  EXPECT_EQ(d.verdict, TimeoutGate::Verdict::Remaining);
  EXPECT_TRUE(d.allows_attempt());
  ASSERT_TRUE(d.budget().has_value());
  EXPECT_EQ(*d.budget(), 6min);
}

TEST(TimeoutGateTest, ExpiredAtDeadline) {
  auto start = std::chrono::steady_clock::now();
  auto deadline = deadline_in(1s, start);

  auto d = TimeoutGate::check(deadline, start + 1s);
  EXPECT_EQ(d.verdict, TimeoutGate::Verdict::Expired);
  EXPECT_FALSE(d.allows_attempt());
}

TEST(TimeoutGateTest, ExpiredAfterDeadline) {
  auto start = std::chrono::steady_clock::now();
  auto deadline = deadline_in(1s, start);

  EXPECT_FALSE(TimeoutGate::check(deadline, start + 5s).allows_attempt());
}

TEST(TimeoutGateTest, BudgetShrinksAcrossAttempts) {
  auto start = std::chrono::steady_clock::now();
  auto deadline = deadline_in(60s, start);

  auto first = TimeoutGate::check(deadline, start);
  auto second = TimeoutGate::check(deadline, start + 25s);
  EXPECT_EQ(*first.budget(), 60s);
  EXPECT_EQ(*second.budget(), 35s);
}

TEST(TimeoutGateTest, DeadlineKeepsWallClockForDisplay) {
  auto wall = std::chrono::system_clock::now();
  auto d = Deadline::after(90s, std::chrono::steady_clock::now(), wall);
  EXPECT_EQ(d.wall - wall, 90s);
  EXPECT_EQ(d.limit, 90s);
}
