#pragma once

#include "cronrunner/config/config.hpp"
#include "cronrunner/util/log.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace cronrunner::test {

// Captures diagnostic lines as "<level> <message>"
class MemorySink : public log::Sink {
public:
  auto write(const log::Record& record) -> void override {
    std::lock_guard lock(mutex_);
    lines_.push_back(std::string(log::level_name(record.level)) + " " +
                     std::string(record.message));
  }

  [[nodiscard]] auto lines() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    return lines_;
  }

  [[nodiscard]] auto count(std::string_view needle) const -> std::size_t {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& line : lines_) {
      if (line.find(needle) != std::string::npos)
        ++n;
    }
    return n;
  }

  [[nodiscard]] auto contains(std::string_view needle) const -> bool {
    return count(needle) > 0;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
};

// Logger that records into a MemorySink; tests inspect sink()
class CapturingLogger {
public:
  CapturingLogger() : sink_(std::make_shared<MemorySink>()), logger_(sink_) {
    logger_.set_level(log::Level::Trace);
  }

  [[nodiscard]] auto logger() -> log::Logger& {
    return logger_;
  }

  [[nodiscard]] auto sink() const -> const MemorySink& {
    return *sink_;
  }

private:
  std::shared_ptr<MemorySink> sink_;
  log::Logger logger_;
};

class TempDir {
public:
  TempDir() {
    std::string templ =
        (std::filesystem::temp_directory_path() / "cronrunner_test_XXXXXX")
            .string();
    if (::mkdtemp(templ.data()) != nullptr) {
      path_ = templ;
    }
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  auto operator=(const TempDir&) -> TempDir& = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path& {
    return path_;
  }

  [[nodiscard]] auto file(std::string_view name) const
      -> std::filesystem::path {
    return path_ / std::string(name);
  }

private:
  std::filesystem::path path_;
};

[[nodiscard]] inline auto read_file(const std::filesystem::path& path)
    -> std::string {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

[[nodiscard]] inline auto count_occurrences(std::string_view haystack,
                                            std::string_view needle)
    -> std::size_t {
  std::size_t n = 0;
  for (auto pos = haystack.find(needle); pos != std::string_view::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

// Environment made of a fixed map instead of the process environment
[[nodiscard]] inline auto env_from(std::map<std::string, std::string> vars)
    -> EnvLookup {
  return [vars = std::move(vars)](
             std::string_view name) -> std::optional<std::string> {
    auto it = vars.find(std::string(name));
    if (it == vars.end() || it->second.empty()) {
      return std::nullopt;
    }
    return it->second;
  };
}

template <typename T>
class BlockingQueue {
public:
  void push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(value));
    cv_.notify_one();
  }

  template <typename Rep, typename Period>
  [[nodiscard]] auto try_pop_for(const std::chrono::duration<Rep, Period>& timeout)
      -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      T value = std::move(queue_.front());
      queue_.pop();
      return value;
    }
    return std::nullopt;
  }

private:
  std::queue<T> queue_;
  std::mutex mutex_;
  std::condition_variable cv_;
};

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

}  // namespace cronrunner::test
