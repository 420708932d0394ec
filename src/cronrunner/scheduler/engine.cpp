#include "cronrunner/scheduler/engine.hpp"

#include "cronrunner/util/log.hpp"
#include "cronrunner/util/util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <system_error>

#include <poll.h>

namespace cronrunner {

namespace {

inline constexpr auto MAX_SLEEP = std::chrono::milliseconds(60000);

}  // namespace

Engine::Engine(CronExpr schedule, OverlapPolicy overlap, log::Logger& logger)
    : schedule_(std::move(schedule)), overlap_(overlap), log_(logger) {
  if (auto fd = io::EventFd::create()) {
    wake_fd_ = std::move(*fd);
  } else {
    log_.error("Failed to create eventfd: {}", fd.error().message());
  }
}

Engine::~Engine() {
  stop();
  wait_idle();
}

auto Engine::set_on_fire(FiringCallback cb) -> void {
  on_fire_ = std::move(cb);
}

auto Engine::start() -> void {
  if (running_.exchange(true))
    return;

  loop_thread_ = std::thread([this] { run_loop(); });
  log_.debug("Engine started");
}

auto Engine::stop() -> void {
  if (!running_.exchange(false))
    return;
  notify();
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  log_.debug("Engine stopped");
}

auto Engine::run_loop() -> void {
  auto next = schedule_.next_after(std::chrono::system_clock::now());
  if (next == TimePoint::max()) {
    log_.warn("Schedule '{}' has no upcoming firing", schedule_.raw());
  } else {
    log_.debug("Next firing at {}", format_rfc3339(next));
  }

  pollfd pfd{wake_fd_.get(), POLLIN, 0};

  while (running_.load(std::memory_order_relaxed)) {
    auto now = std::chrono::system_clock::now();

    if (next != TimePoint::max() && next <= now) {
      dispatch(next);
      // Instants missed while asleep are not replayed
      next = schedule_.next_after(std::max(now, next));
      if (next != TimePoint::max()) {
        log_.debug("Next firing at {}", format_rfc3339(next));
      }
      continue;
    }

    auto timeout = MAX_SLEEP;
    if (next != TimePoint::max()) {
      auto delay = std::chrono::ceil<std::chrono::milliseconds>(next - now);
      timeout = std::clamp(delay, std::chrono::milliseconds::zero(), MAX_SLEEP);
    }

    int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret < 0 && errno != EINTR) {
      log_.error("poll failed: {}", std::strerror(errno));
      break;
    }

    wake_fd_.drain();
  }
}

auto Engine::trigger_now() -> bool {
  return dispatch(std::chrono::system_clock::now());
}

auto Engine::dispatch(TimePoint scheduled_for) -> bool {
  CancellationToken token;
  {
    std::lock_guard lock(mutex_);
    if (overlap_ == OverlapPolicy::Skip && in_flight_ > 0) {
      log_.warn("Previous firing still running; skipping firing due at {}",
                format_rfc3339(scheduled_for));
      return false;
    }
    ++in_flight_;
    token = cancel_source_.token();
  }

  try {
    std::thread([this, token = std::move(token)] {
      try {
        if (on_fire_) {
          on_fire_(token);
        }
      } catch (const std::exception& e) {
        log_.error("Firing aborted by exception: {}", e.what());
      }
      finish_firing();
    }).detach();
  } catch (const std::system_error& e) {
    log_.error("Failed to start firing thread: {}", e.what());
    finish_firing();
    return false;
  }
  return true;
}

auto Engine::finish_firing() -> void {
  std::lock_guard lock(mutex_);
  --in_flight_;
  idle_cv_.notify_all();
}

auto Engine::in_flight() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return in_flight_;
}

auto Engine::wait_idle(std::optional<std::chrono::nanoseconds> timeout)
    -> bool {
  std::unique_lock lock(mutex_);
  auto idle = [this] { return in_flight_ == 0; };
  if (!timeout) {
    idle_cv_.wait(lock, idle);
    return true;
  }
  return idle_cv_.wait_for(lock, *timeout, idle);
}

auto Engine::cancel_in_flight() -> void {
  std::lock_guard lock(mutex_);
  if (in_flight_ > 0) {
    log_.warn("Cancelling {} in-flight firing(s)", in_flight_);
  }
  cancel_source_.cancel();
  cancel_source_ = CancellationSource{};
}

auto Engine::notify() -> void {
  if (wake_fd_.get() >= 0) {
    wake_fd_.notify();
  }
}

}  // namespace cronrunner
