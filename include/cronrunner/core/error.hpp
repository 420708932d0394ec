#pragma once

#include <cerrno>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace cronrunner {

enum class Error : int {
  Success,
  MissingVariable,
  DecodeError,
  ParseError,
  InvalidArgument,
  InvalidTimezone,
  FileNotFound,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "required variable is not set",
      "failed to decode value",
      "parse error",
      "invalid argument",
      "unknown time zone",
      "file not found",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "cronrunner";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

// errno at the call site as a system error_code
[[nodiscard]] inline auto last_system_error() -> std::error_code {
  return {errno, std::system_category()};
}

}  // namespace cronrunner

template <>
struct std::is_error_code_enum<cronrunner::Error> : std::true_type {};
