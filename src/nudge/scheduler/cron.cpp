#include "nudge/scheduler/cron.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <optional>
#include <ranges>
#include <span>
#include <vector>

namespace nudge {
namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kMacros{{
    {"@yearly", "0 0 1 1 *"},
    {"@annually", "0 0 1 1 *"},
    {"@monthly", "0 0 1 * *"},
    {"@weekly", "0 0 * * 0"},
    {"@daily", "0 0 * * *"},
    {"@hourly", "0 * * * *"},
}};

constexpr std::array<std::string_view, 12> kMonthNames{
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};

constexpr std::array<std::string_view, 7> kDowNames{"sun", "mon", "tue", "wed",
                                                    "thu", "fri", "sat"};

struct FieldSpec {
  int min;
  int max;
  std::span<const std::string_view> names{};
  int name_base{0};
};

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

auto tokenize(std::string_view s, char delim) -> std::vector<std::string_view> {
  std::vector<std::string_view> out;
  for (auto part : std::views::split(s, delim)) {
    std::string_view sv(part.begin(), part.end());
    if (!sv.empty())
      out.push_back(sv);
  }
  return out;
}

auto parse_value(std::string_view s, const FieldSpec& range)
    -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec == std::errc{} && ptr == s.data() + s.size())
    return value;
  for (auto [i, name] : std::views::enumerate(range.names)) {
    if (iequals(s, name))
      return static_cast<int>(i) + range.name_base;
  }
  return std::nullopt;
}

// Parses one field into `bits`. `any` is left true only for a bare `*`.
template <std::size_t N>
auto parse_field(std::string_view field, const FieldSpec& range,
                 std::bitset<N>& bits, bool& any) -> bool {
  bits.reset();
  any = (field == "*" || field == "?");

  for (auto item : tokenize(field, ',')) {
    int step = 1;
    if (auto slash = item.find('/'); slash != std::string_view::npos) {
      auto s = parse_value(item.substr(slash + 1), FieldSpec{1, 0});
      if (!s || *s <= 0)
        return false;
      step = *s;
      item = item.substr(0, slash);
    }

    int lo = range.min;
    int hi = range.max;
    if (item != "*" && item != "?") {
      auto dash = item.find('-');
      auto a = parse_value(item.substr(0, dash), range);
      if (!a)
        return false;
      lo = *a;
      hi = *a;
      if (dash != std::string_view::npos) {
        auto b = parse_value(item.substr(dash + 1), range);
        if (!b)
          return false;
        hi = *b;
      } else if (step != 1) {
        hi = range.max;
      }
    }
    if (lo < range.min || hi > range.max || lo > hi)
      return false;
    for (int v = lo; v <= hi; v += step) {
      bits.set(static_cast<std::size_t>(v % static_cast<int>(N)));
    }
  }
  return bits.any();
}

template <std::size_t N>
auto next_set(const std::bitset<N>& bits, int from, int max_val)
    -> std::optional<int> {
  for (int v = from; v <= max_val; ++v) {
    if (bits.test(static_cast<std::size_t>(v)))
      return v;
  }
  return std::nullopt;
}

}  // namespace

CronExpr::CronExpr(std::string raw, Fields fields)
    : raw_(std::move(raw)), fields_(std::move(fields)) {
}

auto CronExpr::parse(std::string_view expr) -> Result<CronExpr> {
  auto first = expr.find_first_not_of(" \t");
  if (first == std::string_view::npos)
    return fail(Error::InvalidArgument);
  auto trimmed = expr.substr(first, expr.find_last_not_of(" \t") - first + 1);

  std::string_view body = trimmed;
  if (trimmed.front() == '@') {
    auto it = std::ranges::find_if(
        kMacros, [&](const auto& m) { return iequals(trimmed, m.first); });
    if (it == kMacros.end())
      return fail(Error::ParseError);
    body = it->second;
  }

  auto tokens = tokenize(body, ' ');
  if (tokens.size() != 5)
    return fail(Error::ParseError);

  Fields f{};
  bool unused = false;
  // Day-of-week accepts 0-7 with both 0 and 7 meaning Sunday.
  if (!parse_field(tokens[0], {0, 59}, f.minute, unused) ||
      !parse_field(tokens[1], {0, 23}, f.hour, unused) ||
      !parse_field(tokens[2], {1, 31}, f.dom, f.dom_any) ||
      !parse_field(tokens[3], {1, 12, kMonthNames, 1}, f.month, unused) ||
      !parse_field(tokens[4], {0, 7, kDowNames, 0}, f.dow, f.dow_any)) {
    return fail(Error::ParseError);
  }

  return ok(CronExpr(std::string(trimmed), std::move(f)));
}

auto CronExpr::day_matches(std::chrono::sys_days day) const -> bool {
  std::chrono::year_month_day ymd{day};
  if (!fields_.month.test(static_cast<unsigned>(ymd.month())))
    return false;

  bool dom_ok = fields_.dom.test(static_cast<unsigned>(ymd.day()));
  bool dow_ok =
      fields_.dow.test(std::chrono::weekday{day}.c_encoding());
  // Standard cron: when both day fields are restricted either may match.
  if (fields_.dom_any && fields_.dow_any)
    return true;
  if (fields_.dom_any)
    return dow_ok;
  if (fields_.dow_any)
    return dom_ok;
  return dom_ok || dow_ok;
}

auto CronExpr::next_after(TimePoint after, std::chrono::minutes utc_offset) const
    -> TimePoint {
  using namespace std::chrono;

  if (fields_.minute.none() || fields_.hour.none())
    return TimePoint::max();

  auto t = floor<minutes>(after + utc_offset) + minutes(1);
  const auto limit = t + days(5 * 366);

  while (t < limit) {
    auto day = floor<days>(t);
    if (!day_matches(day)) {
      t = day + days(1);
      continue;
    }

    hh_mm_ss hms{t - day};
    int h = static_cast<int>(hms.hours().count());
    int m = static_cast<int>(hms.minutes().count());

    if (!fields_.hour.test(static_cast<std::size_t>(h))) {
      if (auto nh = next_set(fields_.hour, h + 1, 23)) {
        t = day + hours(*nh);
      } else {
        t = day + days(1);
      }
      continue;
    }
    if (!fields_.minute.test(static_cast<std::size_t>(m))) {
      if (auto nm = next_set(fields_.minute, m + 1, 59)) {
        t = day + hours(h) + minutes(*nm);
      } else {
        t = day + hours(h + 1);
      }
      continue;
    }
    return TimePoint{t - utc_offset};
  }
  return TimePoint::max();
}

}  // namespace nudge
