#include "oikos/timeutil.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>

namespace oikos::timeutil {

namespace {

using std::chrono::days;
using std::chrono::sys_days;
using std::chrono::year_month_day;

year_month_day ymd_from_index(int64_t day_index) {
  return year_month_day{sys_days{days{day_index}}};
}

int64_t index_from_ymd(const year_month_day& ymd) {
  return sys_days{ymd}.time_since_epoch().count();
}

bool read_digits(const std::string& s, size_t& i, size_t n, int& out) {
  if (i + n > s.size()) return false;
  int v = 0;
  for (size_t k = 0; k < n; ++k) {
    const char c = s[i + k];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  i += n;
  return true;
}

bool expect_char(const std::string& s, size_t& i, char c) {
  if (i >= s.size() || s[i] != c) return false;
  ++i;
  return true;
}

}  // namespace

Clock system_clock() {
  return [] { return now_ms(); };
}

int64_t now_ms() {
  return static_cast<int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

int64_t floor_div(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

LocalTime to_local(int64_t ts_ms, int utc_offset_minutes) {
  const int64_t local_ms = ts_ms + static_cast<int64_t>(utc_offset_minutes) * kMsPerMinute;
  const int64_t day_index = floor_div(local_ms, kMsPerDay);
  const int64_t ms_of_day = local_ms - day_index * kMsPerDay;
  const auto ymd = ymd_from_index(day_index);

  LocalTime lt;
  lt.year   = static_cast<int>(ymd.year());
  lt.month  = static_cast<unsigned>(ymd.month());
  lt.day    = static_cast<unsigned>(ymd.day());
  lt.hour   = static_cast<unsigned>(ms_of_day / kMsPerHour);
  lt.minute = static_cast<unsigned>((ms_of_day % kMsPerHour) / kMsPerMinute);
  return lt;
}

int64_t local_day_index(int64_t ts_ms, int utc_offset_minutes) {
  return floor_div(ts_ms + static_cast<int64_t>(utc_offset_minutes) * kMsPerMinute, kMsPerDay);
}

int64_t start_of_local_day(int64_t ts_ms, int utc_offset_minutes) {
  return local_day_index(ts_ms, utc_offset_minutes) * kMsPerDay -
         static_cast<int64_t>(utc_offset_minutes) * kMsPerMinute;
}

int64_t start_of_local_month(int64_t ts_ms, int utc_offset_minutes) {
  const auto ymd = ymd_from_index(local_day_index(ts_ms, utc_offset_minutes));
  const year_month_day first{ymd.year(), ymd.month(), std::chrono::day{1}};
  return index_from_ymd(first) * kMsPerDay -
         static_cast<int64_t>(utc_offset_minutes) * kMsPerMinute;
}

unsigned days_in_local_month(int64_t ts_ms, int utc_offset_minutes) {
  const auto ymd = ymd_from_index(local_day_index(ts_ms, utc_offset_minutes));
  const std::chrono::year_month_day_last last{ymd.year(), std::chrono::month_day_last{ymd.month()}};
  return static_cast<unsigned>(last.day());
}

std::optional<int64_t> parse_rfc3339(const std::string& text) {
  size_t i = 0;
  int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
  if (!read_digits(text, i, 4, y) || !expect_char(text, i, '-') ||
      !read_digits(text, i, 2, mo) || !expect_char(text, i, '-') ||
      !read_digits(text, i, 2, d)) {
    return std::nullopt;
  }
  if (i >= text.size() || (text[i] != 'T' && text[i] != 't' && text[i] != ' ')) return std::nullopt;
  ++i;
  if (!read_digits(text, i, 2, h) || !expect_char(text, i, ':') ||
      !read_digits(text, i, 2, mi) || !expect_char(text, i, ':') ||
      !read_digits(text, i, 2, sec)) {
    return std::nullopt;
  }

  int64_t frac_ms = 0;
  if (i < text.size() && text[i] == '.') {
    ++i;
    size_t digits = 0;
    int64_t scale = 100;
    while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
      if (digits < 3) {
        frac_ms += (text[i] - '0') * scale;
        scale /= 10;
      }
      ++digits;
      ++i;
    }
    if (digits == 0) return std::nullopt;
  }

  int offset_min = 0;
  if (i >= text.size()) return std::nullopt;  // zone designator required
  if (text[i] == 'Z' || text[i] == 'z') {
    ++i;
  } else if (text[i] == '+' || text[i] == '-') {
    const int sign = text[i] == '-' ? -1 : 1;
    ++i;
    int oh = 0, om = 0;
    if (!read_digits(text, i, 2, oh) || !expect_char(text, i, ':') || !read_digits(text, i, 2, om)) {
      return std::nullopt;
    }
    if (oh > 23 || om > 59) return std::nullopt;
    offset_min = sign * (oh * 60 + om);
  } else {
    return std::nullopt;
  }
  if (i != text.size()) return std::nullopt;

  const year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(mo)},
                           std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok() || h > 23 || mi > 59 || sec > 60) return std::nullopt;
  if (sec == 60) sec = 59;  // leap second folds onto :59

  const int64_t local_ms = index_from_ymd(ymd) * kMsPerDay + h * kMsPerHour +
                           mi * kMsPerMinute + sec * kMsPerSecond + frac_ms;
  return local_ms - static_cast<int64_t>(offset_min) * kMsPerMinute;
}

std::string format_rfc3339(int64_t ts_ms, int utc_offset_minutes) {
  const int64_t local_ms = ts_ms + static_cast<int64_t>(utc_offset_minutes) * kMsPerMinute;
  const int64_t day_index = floor_div(local_ms, kMsPerDay);
  const int64_t ms_of_day = local_ms - day_index * kMsPerDay;
  const auto ymd = ymd_from_index(day_index);

  const int hh = static_cast<int>(ms_of_day / kMsPerHour);
  const int mm = static_cast<int>((ms_of_day % kMsPerHour) / kMsPerMinute);
  const int ss = static_cast<int>((ms_of_day % kMsPerMinute) / kMsPerSecond);
  const int ms = static_cast<int>(ms_of_day % kMsPerSecond);

  char buf[48];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d",
                        static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                        static_cast<unsigned>(ymd.day()), hh, mm, ss);
  std::string out(buf, static_cast<size_t>(n > 0 ? n : 0));
  if (ms != 0) {
    std::snprintf(buf, sizeof(buf), ".%03d", ms);
    out += buf;
  }
  if (utc_offset_minutes == 0) {
    out += 'Z';
  } else {
    const int a = std::abs(utc_offset_minutes);
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d", utc_offset_minutes < 0 ? '-' : '+', a / 60, a % 60);
    out += buf;
  }
  return out;
}

std::optional<int64_t> parse_date(const std::string& text) {
  size_t i = 0;
  int y = 0, mo = 0, d = 0;
  if (!read_digits(text, i, 4, y) || !expect_char(text, i, '-') ||
      !read_digits(text, i, 2, mo) || !expect_char(text, i, '-') ||
      !read_digits(text, i, 2, d) || i != text.size()) {
    return std::nullopt;
  }
  const year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(mo)},
                           std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return std::nullopt;
  return index_from_ymd(ymd);
}

std::string format_date(int64_t day_index) {
  const auto ymd = ymd_from_index(day_index);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
  return buf;
}

}  // namespace oikos::timeutil
