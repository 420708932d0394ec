#pragma once

#include "cronrunner/core/error.hpp"
#include "cronrunner/io/fd.hpp"

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cronrunner::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] auto parse_level(std::string_view name) noexcept
    -> std::optional<Level>;

struct Record {
  Level level;
  std::string_view time;
  std::size_t thread;
  std::string_view message;
};

// Destination for diagnostic records. The sink decides the final layout.
class Sink {
public:
  virtual ~Sink() = default;

  virtual auto write(const Record& record) -> void = 0;
};

class StreamSink : public Sink {
public:
  explicit StreamSink(std::FILE* stream);

  auto write(const Record& record) -> void override;

private:
  std::FILE* stream_;
  bool colored_;
};

class FileSink : public Sink {
public:
  [[nodiscard]] static auto open(const std::filesystem::path& path)
      -> Result<std::shared_ptr<FileSink>>;

  auto write(const Record& record) -> void override;

private:
  explicit FileSink(io::Fd fd) : fd_(std::move(fd)) {
  }

  io::Fd fd_;
};

// Logger handed to every component that reports diagnostics. Lines from
// concurrent firings never interleave: each line is written to all sinks
// under one lock.
class Logger {
public:
  Logger() = default;
  explicit Logger(std::shared_ptr<Sink> sink) {
    sinks_.push_back(std::move(sink));
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto add_sink(std::shared_ptr<Sink> sink) -> void {
    std::lock_guard lock(mutex_);
    sinks_.push_back(std::move(sink));
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, fmt::format_string<Args...> format_str, Args&&... args)
      -> void {
    if (!enabled(level))
      return;
    write(level, fmt::format(format_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  auto trace(fmt::format_string<Args...> format_str, Args&&... args) -> void {
    log(Level::Trace, format_str, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto debug(fmt::format_string<Args...> format_str, Args&&... args) -> void {
    log(Level::Debug, format_str, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto info(fmt::format_string<Args...> format_str, Args&&... args) -> void {
    log(Level::Info, format_str, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto warn(fmt::format_string<Args...> format_str, Args&&... args) -> void {
    log(Level::Warn, format_str, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto error(fmt::format_string<Args...> format_str, Args&&... args) -> void {
    log(Level::Error, format_str, std::forward<Args>(args)...);
  }

private:
  auto write(Level level, std::string_view message) -> void;

  std::atomic<Level> level_{Level::Info};
  std::mutex mutex_;
  std::vector<std::shared_ptr<Sink>> sinks_;
};

// Process-wide logger for startup and shutdown code; writes to stderr.
// The execution engine takes its Logger by reference instead.
auto logger() -> Logger&;

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

template <typename... Args>
auto trace(fmt::format_string<Args...> format_str, Args&&... args) -> void {
  logger().log(Level::Trace, format_str, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(fmt::format_string<Args...> format_str, Args&&... args) -> void {
  logger().log(Level::Debug, format_str, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(fmt::format_string<Args...> format_str, Args&&... args) -> void {
  logger().log(Level::Info, format_str, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(fmt::format_string<Args...> format_str, Args&&... args) -> void {
  logger().log(Level::Warn, format_str, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(fmt::format_string<Args...> format_str, Args&&... args) -> void {
  logger().log(Level::Error, format_str, std::forward<Args>(args)...);
}

}  // namespace cronrunner::log
