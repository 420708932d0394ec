#include "cronrunner/util/util.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <random>

namespace cronrunner {
namespace {

constexpr auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

auto local_tm(std::chrono::system_clock::time_point tp) -> std::tm {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}

// Fixed precision without trailing zeros: 12.500 -> 12.5, 3.000 -> 3
auto trim_float(double value, int precision) -> std::string {
  auto s = fmt::format("{:.{}f}", value, precision);
  if (s.find('.') != std::string::npos) {
    while (s.back() == '0') {
      s.pop_back();
    }
    if (s.back() == '.') {
      s.pop_back();
    }
  }
  return s;
}

struct Unit {
  std::string_view name;
  std::int64_t nanos;
};

constexpr Unit kUnits[] = {
    {"ns", 1},
    {"us", 1'000},
    {"\xc2\xb5s", 1'000},  // µs
    {"ms", 1'000'000},
    {"s", 1'000'000'000},
    {"m", 60'000'000'000},
    {"h", 3'600'000'000'000},
};

}  // namespace

auto generate_firing_id() -> std::string {
  thread_local std::mt19937 gen(std::random_device{}());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return fmt::format("{:08x}", dis(gen));
}

auto format_rfc3339(std::chrono::system_clock::time_point tp) -> std::string {
  auto tm = local_tm(tp);
  auto out = fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}",
                         tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                         tm.tm_hour, tm.tm_min, tm.tm_sec);
  long offset = tm.tm_gmtoff;
  if (offset == 0) {
    out += 'Z';
    return out;
  }
  char sign = offset < 0 ? '-' : '+';
  offset = std::labs(offset);
  out += fmt::format("{}{:02d}:{:02d}", sign, offset / 3600,
                     (offset % 3600) / 60);
  return out;
}

auto format_log_time(std::chrono::system_clock::time_point tp) -> std::string {
  auto tm = local_tm(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch())
                .count() %
            1000;
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, ms);
}

auto format_duration(std::chrono::nanoseconds d) -> std::string {
  using namespace std::chrono;

  if (d < nanoseconds::zero()) {
    return "-" + format_duration(-d);
  }
  if (d == nanoseconds::zero()) {
    return "0s";
  }
  if (d < microseconds(1)) {
    return fmt::format("{}ns", d.count());
  }
  if (d < milliseconds(1)) {
    return trim_float(duration<double, std::micro>(d).count(), 3) + "us";
  }
  if (d < seconds(1)) {
    return trim_float(duration<double, std::milli>(d).count(), 3) + "ms";
  }

  auto h = duration_cast<hours>(d);
  d -= h;
  auto m = duration_cast<minutes>(d);
  d -= m;
  auto s = trim_float(duration<double>(d).count(), 3) + "s";

  if (h.count() > 0) {
    return fmt::format("{}h{}m{}", h.count(), m.count(), s);
  }
  if (m.count() > 0) {
    return fmt::format("{}m{}", m.count(), s);
  }
  return s;
}

auto parse_duration(std::string_view s) -> Result<std::chrono::nanoseconds> {
  s = trim(s);
  if (s.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (s == "0") {
    return std::chrono::nanoseconds::zero();
  }

  double total = 0;
  while (!s.empty()) {
    double value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || value < 0) {
      return fail(Error::ParseError);
    }
    s.remove_prefix(static_cast<std::size_t>(ptr - s.data()));

    auto end = std::find_if(s.begin(), s.end(), [](char c) {
      return std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.';
    });
    std::string_view unit_name = s.substr(0, static_cast<std::size_t>(end - s.begin()));
    s.remove_prefix(unit_name.size());

    auto unit = std::find_if(std::begin(kUnits), std::end(kUnits),
                             [&](const Unit& u) { return u.name == unit_name; });
    if (unit == std::end(kUnits)) {
      return fail(Error::ParseError);
    }
    total += value * static_cast<double>(unit->nanos);
  }

  if (total > static_cast<double>(std::chrono::nanoseconds::max().count())) {
    return fail(Error::InvalidArgument);
  }
  return std::chrono::nanoseconds(static_cast<std::int64_t>(std::llround(total)));
}

auto trim(std::string_view s) -> std::string_view {
  auto start = std::find_if_not(s.begin(), s.end(), is_space);
  auto end = std::find_if_not(s.rbegin(), s.rend(), is_space);
  if (start == s.end())
    return {};
  return {start, end.base()};
}

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
  if (a.size() != b.size())
    return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto split_fields(std::string_view s) -> std::vector<std::string> {
  std::vector<std::string> fields;
  auto it = s.begin();
  while (it != s.end()) {
    it = std::find_if_not(it, s.end(), is_space);
    if (it == s.end())
      break;
    auto end = std::find_if(it, s.end(), is_space);
    fields.emplace_back(it, end);
    it = end;
  }
  return fields;
}

}  // namespace cronrunner
