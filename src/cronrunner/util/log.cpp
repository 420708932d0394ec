#include "cronrunner/util/log.hpp"

#include "cronrunner/util/util.hpp"

#include <chrono>
#include <functional>
#include <thread>

#include <unistd.h>

namespace cronrunner::log {

auto parse_level(std::string_view name) noexcept -> std::optional<Level> {
  if (iequals(name, "trace"))
    return Level::Trace;
  if (iequals(name, "debug"))
    return Level::Debug;
  if (iequals(name, "info"))
    return Level::Info;
  if (iequals(name, "warn") || iequals(name, "warning"))
    return Level::Warn;
  if (iequals(name, "error"))
    return Level::Error;
  return std::nullopt;
}

StreamSink::StreamSink(std::FILE* stream)
    : stream_(stream), colored_(::isatty(::fileno(stream)) != 0) {
}

auto StreamSink::write(const Record& record) -> void {
  if (colored_) {
    fmt::print(stream_, "[{}] [{}{}\033[0m] [{}] {}\n", record.time,
               level_color(record.level), level_name(record.level),
               record.thread, record.message);
  } else {
    fmt::print(stream_, "[{}] [{}] [{}] {}\n", record.time,
               level_name(record.level), record.thread, record.message);
  }
  std::fflush(stream_);
}

auto FileSink::open(const std::filesystem::path& path)
    -> Result<std::shared_ptr<FileSink>> {
  auto fd = io::open_append(path);
  if (!fd) {
    return fail(fd.error());
  }
  return std::shared_ptr<FileSink>(new FileSink(std::move(*fd)));
}

auto FileSink::write(const Record& record) -> void {
  auto line = fmt::format("[{}] [{}] [{}] {}\n", record.time,
                          level_name(record.level), record.thread,
                          record.message);
  // Nowhere left to report a failing diagnostic file; the stream sink still
  // carries the line.
  [[maybe_unused]] auto r = io::write_all(fd_.get(), line);
}

auto Logger::write(Level level, std::string_view message) -> void {
  auto time = format_log_time(std::chrono::system_clock::now());
  auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
  Record record{level, time, tid, message};

  std::lock_guard lock(mutex_);
  for (const auto& sink : sinks_) {
    sink->write(record);
  }
}

auto logger() -> Logger& {
  static Logger instance{std::make_shared<StreamSink>(stderr)};
  return instance;
}

}  // namespace cronrunner::log
