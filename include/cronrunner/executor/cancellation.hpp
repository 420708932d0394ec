#pragma once

#include "cronrunner/io/fd.hpp"

#include <atomic>
#include <memory>

namespace cronrunner {

class CancellationToken;

// Cancellation that a blocking poll loop can wait on: cancel() flips the
// flag and signals an eventfd the holder of a token can add to its pollfds.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
    if (auto fd = io::EventFd::create()) {
      state_->wakeup = std::move(*fd);
    }
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  auto cancel() noexcept -> void {
    if (!state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
      if (state_->wakeup.get() >= 0) {
        state_->wakeup.notify();
      }
    }
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
    io::EventFd wakeup;
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  /// False for none(): such a token never fires
  [[nodiscard]] auto can_be_cancelled() const noexcept -> bool {
    return state_ != nullptr;
  }

  /// Readable once cancelled; -1 when there is nothing to poll
  [[nodiscard]] auto wait_fd() const noexcept -> int {
    return state_ ? state_->wakeup.get() : -1;
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace cronrunner
