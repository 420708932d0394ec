#include "cronrunner/app/application.hpp"

#include "cronrunner/util/log.hpp"
#include "cronrunner/util/util.hpp"

namespace cronrunner {

Application::Application(Config config)
    : Application(std::move(config), log::logger()) {
}

Application::Application(Config config, log::Logger& logger)
    : Application(std::move(config), logger, create_process_runner(logger)) {
}

Application::Application(Config config, log::Logger& logger,
                         std::unique_ptr<IProcessRunner> runner)
    : config_(std::move(config)),
      log_(logger),
      runner_(std::move(runner)),
      sink_(config_.job.log_path, config_.job.log_mode, log_),
      executor_(config_.job, *runner_, sink_, log_),
      engine_(config_.job.schedule, config_.job.overlap, log_) {
  engine_.set_on_fire([this](const CancellationToken& token) {
    [[maybe_unused]] auto outcome = executor_.run(token);
  });
}

Application::~Application() {
  stop();
}

auto Application::start() -> void {
  engine_.start();
}

auto Application::stop() -> void {
  engine_.stop();

  if (auto n = engine_.in_flight(); n > 0) {
    log_.info("Waiting for {} in-flight firing(s) to finish", n);
  }

  std::optional<std::chrono::nanoseconds> timeout;
  if (config_.runner.shutdown_timeout > std::chrono::nanoseconds::zero()) {
    timeout = config_.runner.shutdown_timeout;
  }
  if (!engine_.wait_idle(timeout)) {
    log_.warn("Shutdown timeout of {} exceeded; killing in-flight firings",
              format_duration(*timeout));
    engine_.cancel_in_flight();
    engine_.wait_idle();
  }
}

auto Application::is_running() const noexcept -> bool {
  return engine_.is_running();
}

auto Application::run_once() -> RunOutcome {
  return executor_.run();
}

auto Application::upcoming(std::size_t count) const
    -> std::vector<std::chrono::system_clock::time_point> {
  return config_.job.schedule.next_n(std::chrono::system_clock::now(), count);
}

}  // namespace cronrunner
