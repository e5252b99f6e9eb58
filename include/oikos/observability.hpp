#pragma once

// oikos/observability.hpp — Structured engine events and counters.
//
// DESIGN:
//   EngineEvent is the canonical observable unit. Every rejected reading, tick
//   outcome, rollover, retry and pool drop emits one, which is:
//     - JSONL-appended to the file named by OIKOS_EVENT_LOG (opened once and
//       held across events), or to stderr;
//     - or handed to a registered hook instead (tests, external exporters).
//   Emission never throws and never blocks on more than one short append.
//
// EngineStats is the aggregated view. One instance is created by the
// embedder and passed to each component; there is no global instance.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "oikos/types.hpp"

namespace oikos {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& name);

// ---------------------------------------------------------------------------
// EngineEvent — one structured log line
// ---------------------------------------------------------------------------
struct EngineEvent {
  int64_t     ts_ms{0};                  // filled by emit_event() when 0
  LogLevel    level{LogLevel::info};
  std::string component;                 // "ingest", "publisher", "store", ...
  std::string event;                     // "reading_rejected", "tick_skipped", ...
  std::string home_id;
  std::string detail;
  ErrorCode   error_code{ErrorCode::none};
};

std::string event_to_json(const EngineEvent& ev);

// Threshold below which events are discarded. Initialised from
// OIKOS_LOG_LEVEL on first use (default info).
void set_log_level(LogLevel level);
LogLevel log_level();

// Hook registration. A registered hook receives every event at or above the
// threshold and replaces the JSONL sink. nullptr restores the sink.
using EngineEventHook = void (*)(const EngineEvent&);
void set_event_hook(EngineEventHook hook);

void emit_event(const EngineEvent& ev);

inline void log_event(LogLevel level, std::string component, std::string event,
                      std::string home_id = {}, std::string detail = {},
                      ErrorCode code = ErrorCode::none) {
  EngineEvent ev;
  ev.level      = level;
  ev.component  = std::move(component);
  ev.event      = std::move(event);
  ev.home_id    = std::move(home_id);
  ev.detail     = std::move(detail);
  ev.error_code = code;
  emit_event(ev);
}

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// Bucket boundaries are fixed; readers of /engine/stats depend on them.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile, p in [0.0, 1.0]. Microseconds; 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------
// Thread-safe; all counters are atomic and updated with relaxed ordering.
// Exposed via GET /engine/stats and `oikosd health`.
class EngineStats {
 public:
  std::string to_json() const;

  // Maps a compute failure onto the per-category counters.
  void record_failure(ErrorCode code);
  void sample_queue_depth(std::size_t depth);

  // --- Ingest ---
  alignas(64) std::atomic<uint64_t> readings_accepted{0};
  alignas(64) std::atomic<uint64_t> readings_rejected{0};
  alignas(64) std::atomic<uint64_t> readings_stale_persisted{0};  // older than the window

  // --- Ticks ---
  alignas(64) std::atomic<uint64_t> ticks_ok{0};
  alignas(64) std::atomic<uint64_t> ticks_failed{0};
  alignas(64) std::atomic<uint64_t> ticks_skipped{0};             // previous compute in flight
  alignas(64) std::atomic<uint64_t> rollovers{0};

  // --- Failure categories ---
  alignas(64) std::atomic<uint64_t> lookup_failures{0};
  alignas(64) std::atomic<uint64_t> config_failures{0};
  alignas(64) std::atomic<uint64_t> dependency_failures{0};

  // --- Output ---
  alignas(64) std::atomic<uint64_t> publish_failures{0};
  alignas(64) std::atomic<uint64_t> persist_ok{0};
  alignas(64) std::atomic<uint64_t> persist_retries{0};
  alignas(64) std::atomic<uint64_t> persist_exhausted{0};

  // --- Worker pools ---
  alignas(64) std::atomic<uint64_t> tasks_dropped{0};    // drop_oldest evictions
  alignas(64) std::atomic<uint64_t> tasks_rejected{0};   // reject policy / shutting down
  alignas(64) std::atomic<uint64_t> tasks_abandoned{0};  // left after shutdown grace
  alignas(64) std::atomic<uint64_t> queue_depth_samples{0};
  alignas(64) std::atomic<uint64_t> queue_depth_count{0};
  alignas(64) std::atomic<uint64_t> queue_depth_max{0};

  LatencyHistogram compute_latency;
};

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace oikos
