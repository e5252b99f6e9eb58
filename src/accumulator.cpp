#include "oikos/accumulator.hpp"

#include <algorithm>
#include <cmath>

#include "oikos/observability.hpp"

namespace oikos {

namespace {

std::optional<Error> reject(std::string message) {
  return make_error(ErrorCode::validation_error, std::move(message));
}

}  // namespace

double WindowBreakdown::total_kwh() const {
  double total = 0.0;
  for (const auto& b : buckets) total += b.kwh;
  return total;
}

double WindowBreakdown::kwh_for(TouPeriod period) const {
  double total = 0.0;
  for (const auto& b : buckets) {
    if (b.period == period) total += b.kwh;
  }
  return total;
}

EnergyAccumulator::EnergyAccumulator(std::string home_id, int utc_offset_minutes,
                                     std::shared_ptr<const CategorySet> categories,
                                     int64_t future_skew_ms, timeutil::Clock clock,
                                     EngineStats* stats)
    : home_id_(std::move(home_id)),
      utc_offset_minutes_(utc_offset_minutes),
      categories_(std::move(categories)),
      future_skew_ms_(future_skew_ms),
      clock_(std::move(clock)),
      stats_(stats) {}

void EnergyAccumulator::evict_locked(std::deque<Sample>& series, int64_t cutoff_ms) {
  while (!series.empty() && series.front().timestamp_ms < cutoff_ms) {
    series.pop_front();
  }
}

std::optional<Error> EnergyAccumulator::add_reading(const Reading& reading, bool* retained) {
  if (retained) *retained = false;

  if (reading.home_id != home_id_) {
    return reject("reading for home \"" + reading.home_id + "\" routed to " + home_id_);
  }
  if (!categories_ || !categories_->contains(reading.device_category)) {
    return reject("unknown device category \"" + reading.device_category + "\"");
  }
  if (!std::isfinite(reading.power_w) || reading.power_w < 0.0) {
    return reject("power_w must be a non-negative finite number");
  }
  if (reading.energy_wh && (!std::isfinite(*reading.energy_wh) || *reading.energy_wh < 0.0)) {
    return reject("energy_wh must be a non-negative finite number");
  }
  const int64_t now = clock_();
  if (reading.timestamp_ms > now + future_skew_ms_) {
    return reject("timestamp " + timeutil::format_rfc3339(reading.timestamp_ms) +
                  " is more than " + std::to_string(future_skew_ms_ / 1000) + "s in the future");
  }

  const int64_t cutoff = now - retention_ms_;
  const bool keep = reading.timestamp_ms >= cutoff;
  if (keep) {
    const Sample sample{reading.timestamp_ms, reading_energy_wh(reading)};
    std::lock_guard<std::mutex> lock(mu_);
    auto& series = series_[reading.device_category];
    if (series.empty() || series.back().timestamp_ms <= sample.timestamp_ms) {
      series.push_back(sample);
    } else {
      // Late arrival: insert after any sample with the same timestamp. Shifts
      // every later sample, so cost grows with how late the reading is.
      auto pos = std::upper_bound(series.begin(), series.end(), sample.timestamp_ms,
                                  [](int64_t ts, const Sample& s) { return ts < s.timestamp_ms; });
      series.insert(pos, sample);
    }
    evict_locked(series, cutoff);
  } else if (stats_) {
    stats_->readings_stale_persisted.fetch_add(1, std::memory_order_relaxed);
  }

  if (retained) *retained = keep;
  if (persist_hook_) persist_hook_(reading);
  return std::nullopt;
}

WindowBreakdown EnergyAccumulator::window_breakdown(int64_t start_ms, int64_t end_ms,
                                                    const TouSchedule& schedule) {
  WindowBreakdown out;
  if (end_ms <= start_ms) return out;

  const int64_t offset_ms = static_cast<int64_t>(utc_offset_minutes_) * timeutil::kMsPerMinute;
  // Local clock hour start (as a UTC instant) -> Wh.
  std::map<int64_t, double> hourly_wh;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const int64_t cutoff = clock_() - retention_ms_;
    const int64_t lo = std::max(start_ms, cutoff);
    for (auto& [category, series] : series_) {
      evict_locked(series, cutoff);
      auto it = std::lower_bound(series.begin(), series.end(), lo,
                                 [](const Sample& s, int64_t ts) { return s.timestamp_ms < ts; });
      for (; it != series.end() && it->timestamp_ms < end_ms; ++it) {
        const int64_t hour_start =
            timeutil::floor_div(it->timestamp_ms + offset_ms, timeutil::kMsPerHour) * timeutil::kMsPerHour -
            offset_ms;
        hourly_wh[hour_start] += it->energy_wh;
      }
    }
  }

  for (const auto& [hour_start, wh] : hourly_wh) {
    const timeutil::LocalTime local = timeutil::to_local(hour_start, utc_offset_minutes_);
    const Season season = schedule.season_for_month(local.month);
    const TouPeriod period = schedule.period_for_hour(local.hour);
    const int64_t bucket_start = std::max(hour_start, start_ms);
    const int64_t bucket_end = std::min(hour_start + timeutil::kMsPerHour, end_ms);

    if (!out.buckets.empty()) {
      PeriodBucket& prev = out.buckets.back();
      if (prev.end_ms == bucket_start && prev.season == season && prev.period == period) {
        prev.end_ms = bucket_end;
        prev.kwh += wh / 1000.0;
        continue;
      }
    }
    out.buckets.push_back(PeriodBucket{bucket_start, bucket_end, season, period, wh / 1000.0});
  }
  return out;
}

std::size_t EnergyAccumulator::sample_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t n = 0;
  for (const auto& [category, series] : series_) n += series.size();
  return n;
}

}  // namespace oikos
