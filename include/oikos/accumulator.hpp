#pragma once

// oikos/accumulator.hpp — Per-home windowed energy accumulation.
//
// DESIGN:
//   Each home owns one EnergyAccumulator: device category -> time-ordered
//   samples within the trailing retention window (24h). Many ingest threads
//   call add_reading(); one periodic consumer calls window_breakdown().
//   A single per-home mutex guards the in-memory series; it is held only for
//   the mutation or scan itself, never across I/O.
//
// INVARIANTS:
//   - No sample older than now - retention contributes to any breakdown.
//   - Eviction is lazy: the touched category is trimmed on insert (amortized
//     O(1)), every category is trimmed before a scan.
//   - In-order appends are O(1). A late arrival is inserted in place, which is
//     linear in the number of samples after its insertion point.
//   - Breakdown totals do not depend on reading arrival order.
//
// PERSISTENCE:
//   Accepted readings are handed to the persist hook after the lock is
//   released. Readings already older than the window are persisted but not
//   retained: the durable store stays the system of record for month-to-date.

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "oikos/tariff.hpp"
#include "oikos/timeutil.hpp"
#include "oikos/types.hpp"

namespace oikos {

class EngineStats;

constexpr int64_t kRetentionWindowMs = 24 * timeutil::kMsPerHour;

using CategorySet = std::set<std::string>;

// One chronological run of consumption in a single (season, period).
struct PeriodBucket {
  int64_t   start_ms{0};
  int64_t   end_ms{0};
  Season    season{Season::winter};
  TouPeriod period{TouPeriod::off_peak};
  double    kwh{0.0};
};

struct WindowBreakdown {
  std::vector<PeriodBucket> buckets;  // chronological

  double total_kwh() const;
  double kwh_for(TouPeriod period) const;
};

class EnergyAccumulator {
 public:
  using PersistHook = std::function<void(const Reading&)>;

  EnergyAccumulator(std::string home_id, int utc_offset_minutes,
                    std::shared_ptr<const CategorySet> categories,
                    int64_t future_skew_ms, timeutil::Clock clock,
                    EngineStats* stats = nullptr);

  EnergyAccumulator(const EnergyAccumulator&) = delete;
  EnergyAccumulator& operator=(const EnergyAccumulator&) = delete;

  // Must be installed before concurrent use.
  void set_persist_hook(PersistHook hook) { persist_hook_ = std::move(hook); }

  // validation_error for a foreign home, unknown category, timestamp beyond
  // the future skew, or negative / non-finite power or energy. *retained is
  // false when the reading was accepted but is older than the window.
  std::optional<Error> add_reading(const Reading& reading, bool* retained = nullptr);

  // Energy in [start_ms, end_ms) bucketed by local hour and merged into
  // chronological (season, period) runs.
  WindowBreakdown window_breakdown(int64_t start_ms, int64_t end_ms, const TouSchedule& schedule);

  std::size_t sample_count() const;
  const std::string& home_id() const { return home_id_; }
  int utc_offset_minutes() const { return utc_offset_minutes_; }

 private:
  struct Sample {
    int64_t timestamp_ms;
    double  energy_wh;
  };

  void evict_locked(std::deque<Sample>& series, int64_t cutoff_ms);

  std::string home_id_;
  int utc_offset_minutes_;
  std::shared_ptr<const CategorySet> categories_;
  int64_t future_skew_ms_;
  int64_t retention_ms_{kRetentionWindowMs};
  timeutil::Clock clock_;
  EngineStats* stats_;
  PersistHook persist_hook_;

  mutable std::mutex mu_;
  std::map<std::string, std::deque<Sample>> series_;
};

}  // namespace oikos
