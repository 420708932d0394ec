#pragma once

#include "cronrunner/core/error.hpp"

#include <bitset>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cronrunner {

// Cron schedule: five fields (minute hour dom month dow) or six with a
// leading seconds field, the @yearly/@daily/... macros, and "@every <dur>".
class CronExpr {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  enum class Zone : std::uint8_t {
    Utc,
    Local,  // process time zone, i.e. TZ
  };

  CronExpr() = default;

  [[nodiscard]] static auto parse(std::string_view expr, Zone zone = Zone::Local)
      -> Result<CronExpr>;

  /// First firing strictly after `after`; TimePoint::max() if none within
  /// five years.
  [[nodiscard]] auto next_after(TimePoint after) const -> TimePoint;

  /// Up to `count` consecutive firings after `after`
  [[nodiscard]] auto next_n(TimePoint after, std::size_t count) const
      -> std::vector<TimePoint>;

  [[nodiscard]] auto raw() const noexcept -> std::string_view {
    return raw_;
  }

  [[nodiscard]] auto zone() const noexcept -> Zone {
    return zone_;
  }

  [[nodiscard]] auto interval() const noexcept
      -> std::optional<std::chrono::seconds> {
    return every_;
  }

private:
  using SecSet = std::bitset<60>;
  using MinSet = std::bitset<60>;
  using HourSet = std::bitset<24>;
  using DomSet = std::bitset<32>;
  using MonSet = std::bitset<13>;
  using DowSet = std::bitset<8>;

  struct Fields {
    SecSet second;
    MinSet minute;
    HourSet hour;
    DomSet dom;
    MonSet month;
    DowSet dow;
    bool dom_restricted{false};
    bool dow_restricted{false};
  };

  CronExpr(std::string raw, Zone zone, Fields fields);
  CronExpr(std::string raw, Zone zone, std::chrono::seconds every);

  std::string raw_;
  Zone zone_{Zone::Local};
  Fields fields_;
  std::optional<std::chrono::seconds> every_;
};

}  // namespace cronrunner
