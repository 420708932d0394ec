#pragma once

#include "cronrunner/config/job_config.hpp"
#include "cronrunner/executor/attempt.hpp"
#include "cronrunner/executor/job_executor.hpp"
#include "cronrunner/executor/output_sink.hpp"
#include "cronrunner/executor/process_runner.hpp"
#include "cronrunner/scheduler/engine.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

namespace cronrunner {

namespace log {
class Logger;
}

// Application facade - wires the job executor to the trigger source
class Application {
public:
  explicit Application(Config config);
  Application(Config config, log::Logger& logger);
  Application(Config config, log::Logger& logger,
              std::unique_ptr<IProcessRunner> runner);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  [[nodiscard]] auto config() const noexcept -> const Config& {
    return config_;
  }

  // Lifecycle
  auto start() -> void;
  /// Stops triggering and waits for in-flight firings; past the configured
  /// shutdown timeout they are cancelled.
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  /// One firing on the calling thread
  [[nodiscard]] auto run_once() -> RunOutcome;

  [[nodiscard]] auto upcoming(std::size_t count) const
      -> std::vector<std::chrono::system_clock::time_point>;

  [[nodiscard]] auto engine() -> Engine& {
    return engine_;
  }

private:
  Config config_;
  log::Logger& log_;
  std::unique_ptr<IProcessRunner> runner_;
  OutputSink sink_;
  JobExecutor executor_;
  Engine engine_;
};

}  // namespace cronrunner
