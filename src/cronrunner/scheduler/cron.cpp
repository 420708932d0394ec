#include "cronrunner/scheduler/cron.hpp"

#include "cronrunner/util/util.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <ctime>

namespace cronrunner {
namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 7> kMacros{{
    {"@yearly", "0 0 0 1 1 *"},
    {"@annually", "0 0 0 1 1 *"},
    {"@monthly", "0 0 0 1 * *"},
    {"@weekly", "0 0 0 * * 0"},
    {"@daily", "0 0 0 * * *"},
    {"@midnight", "0 0 0 * * *"},
    {"@hourly", "0 0 * * * *"},
}};

constexpr std::string_view kEveryPrefix = "@every ";

constexpr std::array<std::string_view, 12> kMonthNames{
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};

constexpr std::array<std::string_view, 7> kDowNames{"sun", "mon", "tue", "wed",
                                                    "thu", "fri", "sat"};

auto split(std::string_view s, char delim) -> std::vector<std::string_view> {
  std::vector<std::string_view> result;
  std::size_t start = 0;
  while (start <= s.size()) {
    std::size_t end = s.find(delim, start);
    if (end == std::string_view::npos)
      end = s.size();
    result.push_back(s.substr(start, end - start));
    start = end + 1;
  }
  return result;
}

auto parse_int(std::string_view s) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec == std::errc{} && ptr == s.data() + s.size()) {
    return value;
  }
  return std::nullopt;
}

template <std::size_t N>
auto parse_name(std::string_view s, const std::array<std::string_view, N>& names,
                int base) -> std::optional<int> {
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (iequals(s, names[i])) {
      return static_cast<int>(i) + base;
    }
  }
  return std::nullopt;
}

enum class FieldKind : std::uint8_t { Plain, Month, Dow };

// Parses one comma separated field into `bs`. `is_restricted` is cleared for
// a bare "*" (or "?"), which matters for the dom/dow OR rule.
template <std::size_t N>
auto parse_field(std::string_view field, std::bitset<N>& bs, int min_val,
                 int max_val, bool& is_restricted,
                 FieldKind kind = FieldKind::Plain) -> bool {
  bs.reset();
  is_restricted = true;

  auto parse_value = [&](std::string_view s) -> std::optional<int> {
    if (auto v = parse_int(s))
      return *v;
    if (kind == FieldKind::Month)
      return parse_name(s, kMonthNames, 1);
    if (kind == FieldKind::Dow)
      return parse_name(s, kDowNames, 0);
    return std::nullopt;
  };

  for (auto part : split(field, ',')) {
    part = trim(part);
    if (part.empty())
      return false;

    int step = 1;
    bool has_step = false;
    if (auto slash = part.find('/'); slash != std::string_view::npos) {
      auto step_opt = parse_int(part.substr(slash + 1));
      if (!step_opt || *step_opt <= 0)
        return false;
      step = *step_opt;
      has_step = true;
      part = part.substr(0, slash);
    }

    int start, end;
    if (part == "*" || part == "?") {
      start = min_val;
      end = max_val;
      if (step == 1)
        is_restricted = false;
    } else if (auto dash = part.find('-'); dash != std::string_view::npos) {
      auto a = parse_value(trim(part.substr(0, dash)));
      auto b = parse_value(trim(part.substr(dash + 1)));
      if (!a || !b)
        return false;
      start = *a;
      end = *b;
    } else {
      auto v = parse_value(part);
      if (!v)
        return false;
      start = *v;
      // "5/15" means 5-max stepping by 15
      end = has_step ? max_val : *v;
    }

    // Sunday may be written as 7
    int upper = (kind == FieldKind::Dow) ? 7 : max_val;
    if (start < min_val || end > upper || start > end)
      return false;
    for (int v = start; v <= end; v += step) {
      int slot = (kind == FieldKind::Dow && v == 7) ? 0 : v;
      bs.set(static_cast<std::size_t>(slot));
    }
  }
  return bs.any();
}

constexpr auto days_in_month(int year, int month) -> int {
  constexpr std::array<int, 12> days{31, 28, 31, 30, 31, 30,
                                     31, 31, 30, 31, 30, 31};
  int d = days[static_cast<std::size_t>(month - 1)];
  if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0)) {
    d = 29;
  }
  return d;
}

auto to_tm(std::chrono::system_clock::time_point tp, CronExpr::Zone zone)
    -> std::tm {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  if (zone == CronExpr::Zone::Utc) {
    gmtime_r(&t, &tm);
  } else {
    localtime_r(&t, &tm);
  }
  return tm;
}

auto from_tm(std::tm tm, CronExpr::Zone zone)
    -> std::chrono::system_clock::time_point {
  if (zone == CronExpr::Zone::Utc) {
    tm.tm_isdst = 0;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
  }
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(mktime(&tm));
}

template <std::size_t N>
auto next_set(const std::bitset<N>& bs, int from, int max_val)
    -> std::optional<int> {
  for (int v = from; v <= max_val; ++v) {
    if (v >= 0 && bs.test(static_cast<std::size_t>(v)))
      return v;
  }
  return std::nullopt;
}

template <std::size_t N>
auto first_set(const std::bitset<N>& bs, int min_val, int max_val) -> int {
  return next_set(bs, min_val, max_val).value_or(min_val);
}

}  // namespace

CronExpr::CronExpr(std::string raw, Zone zone, Fields fields)
    : raw_(std::move(raw)), zone_(zone), fields_(std::move(fields)) {
}

CronExpr::CronExpr(std::string raw, Zone zone, std::chrono::seconds every)
    : raw_(std::move(raw)), zone_(zone), every_(every) {
}

auto CronExpr::parse(std::string_view expr, Zone zone) -> Result<CronExpr> {
  auto trimmed = trim(expr);
  if (trimmed.empty())
    return fail(Error::InvalidArgument);

  std::string_view to_parse = trimmed;
  if (trimmed[0] == '@') {
    if (trimmed.size() > kEveryPrefix.size() &&
        iequals(trimmed.substr(0, kEveryPrefix.size()), kEveryPrefix)) {
      auto d = parse_duration(trimmed.substr(kEveryPrefix.size()));
      if (!d)
        return fail(Error::ParseError);
      auto every = std::max(std::chrono::duration_cast<std::chrono::seconds>(*d),
                            std::chrono::seconds(1));
      return ok(CronExpr(std::string(trimmed), zone, every));
    }

    auto macro = std::find_if(kMacros.begin(), kMacros.end(), [&](const auto& m) {
      return iequals(trimmed, m.first);
    });
    if (macro == kMacros.end())
      return fail(Error::ParseError);
    to_parse = macro->second;
  }

  auto tokens = split_fields(to_parse);
  if (tokens.size() == 5)
    tokens.insert(tokens.begin(), "0");
  if (tokens.size() != 6)
    return fail(Error::ParseError);

  Fields f{};
  bool dummy;
  if (!parse_field(tokens[0], f.second, 0, 59, dummy))
    return fail(Error::ParseError);
  if (!parse_field(tokens[1], f.minute, 0, 59, dummy))
    return fail(Error::ParseError);
  if (!parse_field(tokens[2], f.hour, 0, 23, dummy))
    return fail(Error::ParseError);
  if (!parse_field(tokens[3], f.dom, 1, 31, f.dom_restricted))
    return fail(Error::ParseError);
  if (!parse_field(tokens[4], f.month, 1, 12, dummy, FieldKind::Month))
    return fail(Error::ParseError);
  if (!parse_field(tokens[5], f.dow, 0, 6, f.dow_restricted, FieldKind::Dow))
    return fail(Error::ParseError);

  return ok(CronExpr(std::string(trimmed), zone, std::move(f)));
}

auto CronExpr::next_after(TimePoint after) const -> TimePoint {
  using namespace std::chrono;

  auto base = floor<seconds>(after) + seconds(1);
  if (every_) {
    return base - seconds(1) + *every_;
  }

  auto tm = to_tm(base, zone_);
  const int max_year = tm.tm_year + 1900 + 5;

  auto normalize = [this](std::tm& t) { t = to_tm(from_tm(t, zone_), zone_); };

  auto day_ok = [this](const std::tm& t) {
    bool dom_ok = fields_.dom.test(static_cast<std::size_t>(t.tm_mday));
    bool dow_ok = fields_.dow.test(static_cast<std::size_t>(t.tm_wday));
    if (fields_.dom_restricted && fields_.dow_restricted)
      return dom_ok || dow_ok;
    return dom_ok && dow_ok;
  };

  while (tm.tm_year + 1900 <= max_year) {
    if (auto m = next_set(fields_.month, tm.tm_mon + 1, 12)) {
      if (*m != tm.tm_mon + 1) {
        tm.tm_mon = *m - 1;
        tm.tm_mday = 1;
        tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
      }
    } else {
      ++tm.tm_year;
      tm.tm_mon = first_set(fields_.month, 1, 12) - 1;
      tm.tm_mday = 1;
      tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
      continue;
    }

    if (tm.tm_mday > days_in_month(tm.tm_year + 1900, tm.tm_mon + 1)) {
      ++tm.tm_mon;
      tm.tm_mday = 1;
      tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
      continue;
    }

    normalize(tm);
    if (!day_ok(tm)) {
      ++tm.tm_mday;
      tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
      normalize(tm);
      continue;
    }

    if (auto h = next_set(fields_.hour, tm.tm_hour, 23)) {
      if (*h != tm.tm_hour) {
        tm.tm_hour = *h;
        tm.tm_min = tm.tm_sec = 0;
      }
    } else {
      ++tm.tm_mday;
      tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
      normalize(tm);
      continue;
    }

    if (auto m = next_set(fields_.minute, tm.tm_min, 59)) {
      if (*m != tm.tm_min) {
        tm.tm_min = *m;
        tm.tm_sec = 0;
      }
    } else {
      ++tm.tm_hour;
      tm.tm_min = tm.tm_sec = 0;
      normalize(tm);
      continue;
    }

    if (auto s = next_set(fields_.second, tm.tm_sec, 59)) {
      tm.tm_sec = *s;
    } else {
      ++tm.tm_min;
      tm.tm_sec = 0;
      normalize(tm);
      continue;
    }

    auto candidate = from_tm(tm, zone_);
    auto check = to_tm(candidate, zone_);
    if (check.tm_hour == tm.tm_hour && check.tm_min == tm.tm_min &&
        check.tm_sec == tm.tm_sec && check.tm_mday == tm.tm_mday) {
      return candidate;
    }
    // Wall time fell into a DST gap; resume from where the clock jumped to
    tm = check;
  }

  return TimePoint::max();
}

auto CronExpr::next_n(TimePoint after, std::size_t count) const
    -> std::vector<TimePoint> {
  std::vector<TimePoint> result;
  result.reserve(count);

  auto current = after;
  while (result.size() < count) {
    current = next_after(current);
    if (current == TimePoint::max())
      break;
    result.push_back(current);
  }
  return result;
}

}  // namespace cronrunner
