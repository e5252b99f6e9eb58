#include "oikos/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

#include "oikos/jsonlite.hpp"
#include "oikos/timeutil.hpp"

namespace oikos {

namespace {

// bit_width gives the bucket index directly: floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_counter(std::string& out, const char* key, const std::atomic<uint64_t>& v, bool first = false) {
  if (!first) out += ',';
  out += '"';
  out += key;
  out += "\":";
  out += std::to_string(v.load(std::memory_order_relaxed));
}

LogLevel level_from_env() {
  const char* v = std::getenv("OIKOS_LOG_LEVEL");
  if (!v || !v[0]) return LogLevel::info;
  return parse_log_level(v).value_or(LogLevel::info);
}

std::atomic<EngineEventHook> g_event_hook{nullptr};
std::atomic<int> g_log_level{-1};  // -1 = not yet read from the environment
std::mutex g_sink_mu;

// Event log file, opened once and kept until OIKOS_EVENT_LOG names another
// path. Guarded by g_sink_mu.
struct EventLogFile {
  std::string path;
  FILE* file{nullptr};

  ~EventLogFile() {
    if (file) std::fclose(file);
  }

  FILE* get(const char* wanted) {
    if (file && path == wanted) return file;
    if (file) std::fclose(file);
    path = wanted;
    file = std::fopen(wanted, "a");
    return file;
  }
};

EventLogFile g_event_log;

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info:  return "info";
    case LogLevel::warn:  return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
  if (name == "debug") return LogLevel::debug;
  if (name == "info") return LogLevel::info;
  if (name == "warn" || name == "warning") return LogLevel::warn;
  if (name == "error") return LogLevel::error;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  const size_t b = bucket_for_us(us);
  buckets_[b].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      // Midpoint of bucket i; bucket 0 covers [0,1)us.
      const double bucket_lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double bucket_hi = static_cast<double>(1ULL << i);
      return (bucket_lo + bucket_hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(256);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_failure(ErrorCode code) {
  switch (code) {
    case ErrorCode::lookup_error:
      lookup_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case ErrorCode::config_error:
      config_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    default:
      dependency_failures.fetch_add(1, std::memory_order_relaxed);
      break;
  }
}

void EngineStats::sample_queue_depth(std::size_t depth) {
  queue_depth_samples.fetch_add(depth, std::memory_order_relaxed);
  queue_depth_count.fetch_add(1, std::memory_order_relaxed);
  uint64_t prev = queue_depth_max.load(std::memory_order_relaxed);
  while (depth > prev &&
         !queue_depth_max.compare_exchange_weak(prev, depth, std::memory_order_relaxed)) {
  }
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(1024);
  char buf[64];

  out += "{\"ingest\":{";
  append_counter(out, "readings_accepted", readings_accepted, true);
  append_counter(out, "readings_rejected", readings_rejected);
  append_counter(out, "readings_stale_persisted", readings_stale_persisted);
  out += "},\"ticks\":{";
  append_counter(out, "ok", ticks_ok, true);
  append_counter(out, "failed", ticks_failed);
  append_counter(out, "skipped", ticks_skipped);
  append_counter(out, "rollovers", rollovers);
  out += "},\"failure_categories\":{";
  append_counter(out, "lookup_error", lookup_failures, true);
  append_counter(out, "config_error", config_failures);
  append_counter(out, "dependency_error", dependency_failures);
  out += "},\"output\":{";
  append_counter(out, "publish_failures", publish_failures, true);
  append_counter(out, "persist_ok", persist_ok);
  append_counter(out, "persist_retries", persist_retries);
  append_counter(out, "persist_exhausted", persist_exhausted);
  out += "},\"pools\":{";
  append_counter(out, "tasks_dropped", tasks_dropped, true);
  append_counter(out, "tasks_rejected", tasks_rejected);
  append_counter(out, "tasks_abandoned", tasks_abandoned);

  const uint64_t qd_count = queue_depth_count.load(std::memory_order_relaxed);
  const double avg_queue_depth = (qd_count > 0)
      ? (static_cast<double>(queue_depth_samples.load(std::memory_order_relaxed)) /
         static_cast<double>(qd_count))
      : 0.0;
  out += ",\"avg_queue_depth\":";
  std::snprintf(buf, sizeof(buf), "%.2f", avg_queue_depth);
  out += buf;
  append_counter(out, "max_queue_depth", queue_depth_max);
  out += "},\"compute_latency\":";
  out += compute_latency.to_json();
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Event emission
// ---------------------------------------------------------------------------

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  int v = g_log_level.load(std::memory_order_relaxed);
  if (v < 0) {
    v = static_cast<int>(level_from_env());
    g_log_level.store(v, std::memory_order_relaxed);
  }
  return static_cast<LogLevel>(v);
}

void set_event_hook(EngineEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

std::string event_to_json(const EngineEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"ts\":\"";
  line += timeutil::format_rfc3339(ev.ts_ms);
  line += "\",\"level\":\"";
  line += to_string(ev.level);
  line += "\",\"component\":\"";
  line += jsonlite::escape(ev.component);
  line += "\",\"event\":\"";
  line += jsonlite::escape(ev.event);
  line += '"';
  if (!ev.home_id.empty()) {
    line += ",\"home_id\":\"";
    line += jsonlite::escape(ev.home_id);
    line += '"';
  }
  if (ev.error_code != ErrorCode::none) {
    line += ",\"error_code\":\"";
    line += to_string(ev.error_code);
    line += '"';
  }
  if (!ev.detail.empty()) {
    line += ",\"detail\":\"";
    line += jsonlite::escape(ev.detail);
    line += '"';
  }
  line += '}';
  return line;
}

void emit_event(const EngineEvent& ev) {
  if (static_cast<int>(ev.level) < static_cast<int>(log_level())) return;

  EngineEvent stamped = ev;
  if (stamped.ts_ms == 0) stamped.ts_ms = timeutil::now_ms();

  EngineEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(stamped);
    return;
  }

  // Activation: OIKOS_EVENT_LOG=/path/to/events.jsonl, otherwise stderr.
  std::string line = event_to_json(stamped);
  line += '\n';
  std::lock_guard<std::mutex> lk(g_sink_mu);
  const char* log_path = std::getenv("OIKOS_EVENT_LOG");
  if (log_path && log_path[0]) {
    if (FILE* f = g_event_log.get(log_path)) {
      std::fwrite(line.data(), 1, line.size(), f);
      std::fflush(f);
      return;
    }
  }
  std::fwrite(line.data(), 1, line.size(), stderr);
}

}  // namespace oikos
