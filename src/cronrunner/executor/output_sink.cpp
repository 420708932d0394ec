#include "cronrunner/executor/output_sink.hpp"

#include "cronrunner/util/log.hpp"
#include "cronrunner/util/util.hpp"

#include <fmt/core.h>

namespace cronrunner {

AttemptOutput::AttemptOutput(std::shared_ptr<io::Fd> file,
                             std::string firing_id, log::Logger& logger)
    : file_(std::move(file)),
      firing_id_(std::move(firing_id)),
      log_(&logger),
      targets_(OutputTargets::standard()),
      started_(std::chrono::steady_clock::now()) {
  if (!file_) {
    return;
  }
  targets_.out.push_back(file_->get());
  targets_.err.push_back(file_->get());

  auto marker = fmt::format("===== RUN START {} =====\n",
                            format_rfc3339(std::chrono::system_clock::now()));
  if (auto r = io::write_all(file_->get(), marker); !r) {
    log_->warn("[{}] Failed to write run start marker: {}", firing_id_,
               r.error().message());
  }
}

AttemptOutput::~AttemptOutput() {
  if (file_) {
    write_end(-1, std::chrono::steady_clock::now() - started_, false);
  }
}

auto AttemptOutput::finish(const RunAttempt& attempt) -> void {
  if (!file_) {
    return;
  }
  write_end(attempt.exit_code, attempt.duration, attempt.killed_by_timeout);
}

auto AttemptOutput::write_end(int exit_code, std::chrono::nanoseconds duration,
                              bool timed_out) -> void {
  auto marker = fmt::format(
      "===== RUN END {} exit={} duration={}{} =====\n\n",
      format_rfc3339(std::chrono::system_clock::now()), exit_code,
      format_duration(duration), timed_out ? " timeout=true" : "");
  if (auto r = io::write_all(file_->get(), marker); !r) {
    log_->warn("[{}] Failed to write run end marker: {}", firing_id_,
               r.error().message());
  }
  // Per-attempt files close here; the persistent handle lives on in the sink
  file_.reset();
}

OutputSink::OutputSink(std::optional<std::filesystem::path> path, LogMode mode,
                       log::Logger& logger)
    : path_(std::move(path)), mode_(mode), log_(logger) {
}

auto OutputSink::begin_attempt(std::string_view firing_id) -> AttemptOutput {
  return AttemptOutput{open_file(firing_id), std::string(firing_id), log_};
}

auto OutputSink::open_file(std::string_view firing_id)
    -> std::shared_ptr<io::Fd> {
  if (!path_) {
    return nullptr;
  }

  std::unique_lock lock(mutex_, std::defer_lock);
  if (mode_ == LogMode::Persistent) {
    lock.lock();
    if (persistent_) {
      return persistent_;
    }
  }

  auto fd = io::open_append(*path_);
  if (!fd) {
    log_.warn("[{}] Failed to open log file {}: {}; continuing without it",
              firing_id, path_->string(), fd.error().message());
    return nullptr;
  }

  auto file = std::make_shared<io::Fd>(std::move(*fd));
  if (mode_ == LogMode::Persistent) {
    persistent_ = file;
  }
  return file;
}

}  // namespace cronrunner
