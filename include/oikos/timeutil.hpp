#pragma once

// oikos/timeutil.hpp — Instants, RFC3339 and local-calendar arithmetic.
//
// Instants are unix milliseconds. Local time is UTC plus a fixed per-home
// offset in minutes; daylight-saving transitions are not modelled (a home that
// observes DST is reconfigured with its new offset).
//
// Day indices are days since 1970-01-01 of the *local* calendar date.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace oikos::timeutil {

constexpr int64_t kMsPerSecond = 1000;
constexpr int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr int64_t kMsPerHour   = 60 * kMsPerMinute;
constexpr int64_t kMsPerDay    = 24 * kMsPerHour;

// Injectable wall clock (unix ms). Components take one so tests can pin time.
using Clock = std::function<int64_t()>;
Clock system_clock();
int64_t now_ms();

// Floor division for possibly-negative instants.
int64_t floor_div(int64_t a, int64_t b);

struct LocalTime {
  int      year{1970};
  unsigned month{1};   // 1..12
  unsigned day{1};     // 1..31
  unsigned hour{0};    // 0..23
  unsigned minute{0};
};

LocalTime to_local(int64_t ts_ms, int utc_offset_minutes);

int64_t local_day_index(int64_t ts_ms, int utc_offset_minutes);
int64_t start_of_local_day(int64_t ts_ms, int utc_offset_minutes);
int64_t start_of_local_month(int64_t ts_ms, int utc_offset_minutes);
unsigned days_in_local_month(int64_t ts_ms, int utc_offset_minutes);

// "2025-07-15T17:05:00Z", "2025-07-15T10:05:00.250-07:00". A zone designator
// is required. nullopt on any syntax or range error.
std::optional<int64_t> parse_rfc3339(const std::string& text);

// Formats with the given offset ("Z" when 0). Milliseconds are emitted only
// when non-zero.
std::string format_rfc3339(int64_t ts_ms, int utc_offset_minutes = 0);

// "YYYY-MM-DD" <-> day index.
std::optional<int64_t> parse_date(const std::string& text);
std::string format_date(int64_t day_index);

}  // namespace oikos::timeutil
