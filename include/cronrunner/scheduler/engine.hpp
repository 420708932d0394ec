#pragma once

#include "cronrunner/config/job_config.hpp"
#include "cronrunner/executor/cancellation.hpp"
#include "cronrunner/io/fd.hpp"
#include "cronrunner/scheduler/cron.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace cronrunner {

namespace log {
class Logger;
}

// Trigger source for the one job. A single loop thread sleeps in poll until
// the next cron instant, then hands the firing to a fresh worker thread and
// goes back to sleep; it never waits for a firing to finish.
class Engine {
public:
  using TimePoint = std::chrono::system_clock::time_point;
  using FiringCallback = std::function<void(const CancellationToken&)>;

  Engine(CronExpr schedule, OverlapPolicy overlap, log::Logger& logger);
  ~Engine();

  Engine(const Engine&) = delete;
  auto operator=(const Engine&) -> Engine& = delete;

  auto set_on_fire(FiringCallback cb) -> void;

  auto start() -> void;
  /// Stops triggering; firings already in flight keep running
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  /// Dispatches one firing right away; false if the overlap policy skipped it
  auto trigger_now() -> bool;

  [[nodiscard]] auto in_flight() const -> std::size_t;

  /// Waits until no firing is in flight; false if `timeout` ran out first
  auto wait_idle(std::optional<std::chrono::nanoseconds> timeout = std::nullopt)
      -> bool;

  /// Cancels the token of every firing currently in flight
  auto cancel_in_flight() -> void;

private:
  auto run_loop() -> void;
  auto dispatch(TimePoint scheduled_for) -> bool;
  auto finish_firing() -> void;
  auto notify() -> void;

  std::atomic<bool> running_{false};
  CronExpr schedule_;
  OverlapPolicy overlap_;
  log::Logger& log_;
  io::EventFd wake_fd_;
  std::thread loop_thread_;
  FiringCallback on_fire_;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::size_t in_flight_{0};
  CancellationSource cancel_source_;
};

}  // namespace cronrunner
