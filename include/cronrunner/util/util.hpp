#pragma once

#include "cronrunner/core/error.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace cronrunner {

/// 8 hex digits, enough to tell overlapping firings apart in the log
[[nodiscard]] auto generate_firing_id() -> std::string;

/// RFC 3339 in the process-local zone, e.g. 2024-05-01T12:00:00+02:00
[[nodiscard]] auto format_rfc3339(std::chrono::system_clock::time_point tp)
    -> std::string;

/// Local time with milliseconds, used as the diagnostic line prefix
[[nodiscard]] auto format_log_time(std::chrono::system_clock::time_point tp)
    -> std::string;

/// Human readable duration: 850ms, 12.034s, 3m5.2s, 1h2m3s
[[nodiscard]] auto format_duration(std::chrono::nanoseconds d) -> std::string;

/// Parses Go-style durations: "90s", "1h30m", "250ms", "1.5h".
/// A bare integer is rejected; every number needs a unit.
[[nodiscard]] auto parse_duration(std::string_view s)
    -> Result<std::chrono::nanoseconds>;

[[nodiscard]] auto trim(std::string_view s) -> std::string_view;

[[nodiscard]] auto iequals(std::string_view a, std::string_view b) noexcept
    -> bool;

[[nodiscard]] auto to_lower(std::string_view s) -> std::string;

/// Splits on any run of whitespace, dropping empty tokens
[[nodiscard]] auto split_fields(std::string_view s) -> std::vector<std::string>;

}  // namespace cronrunner
