#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace cronrunner {

// Hard kill deadline of one firing. Computed once when the firing starts and
// shared by every attempt; retries consume the same budget.
struct Deadline {
  std::chrono::steady_clock::time_point at;
  std::chrono::system_clock::time_point wall;
  std::chrono::nanoseconds limit;

  [[nodiscard]] static auto after(
      std::chrono::nanoseconds limit,
      std::chrono::steady_clock::time_point start,
      std::chrono::system_clock::time_point wall_start) noexcept -> Deadline {
    return Deadline{start + limit, wall_start + limit, limit};
  }
};

class TimeoutGate {
public:
  enum class Verdict : std::uint8_t {
    Unbounded,  // no deadline configured
    Remaining,  // positive budget left
    Expired,    // no budget left; do not start another attempt
  };

  struct Decision {
    Verdict verdict{Verdict::Unbounded};
    std::chrono::nanoseconds remaining{0};

    [[nodiscard]] auto allows_attempt() const noexcept -> bool {
      return verdict != Verdict::Expired;
    }

    /// Budget for the attempt; nullopt means run to natural completion
    [[nodiscard]] auto budget() const noexcept
        -> std::optional<std::chrono::nanoseconds> {
      if (verdict == Verdict::Remaining) {
        return remaining;
      }
      return std::nullopt;
    }
  };

  [[nodiscard]] static auto check(const std::optional<Deadline>& deadline,
                                  std::chrono::steady_clock::time_point now) noexcept
      -> Decision;
};

}  // namespace cronrunner
