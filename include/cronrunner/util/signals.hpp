#pragma once

#include <atomic>

namespace cronrunner {

extern std::atomic<bool> g_shutdown_requested;

/// SIGINT / SIGTERM request shutdown; SIGPIPE is ignored so a vanished tee
/// target surfaces as a write error instead of killing the runner.
void setup_signal_handlers();
void wait_for_shutdown();

[[nodiscard]] inline auto shutdown_requested() noexcept -> bool {
  return g_shutdown_requested.load(std::memory_order_acquire);
}

}  // namespace cronrunner
