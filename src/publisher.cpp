#include "oikos/publisher.hpp"

#include <algorithm>
#include <sstream>

#include "oikos/jsonlite.hpp"
#include "oikos/observability.hpp"

namespace oikos {

std::string billing_topic(const std::string& home_id) {
  return "home/" + home_id + "/billing/today_cost";
}

std::string billing_payload_json(const BillingSnapshot& s) {
  std::ostringstream o;
  o << "{\"timestamp\":\"" << timeutil::format_rfc3339(s.timestamp_ms) << "\""
    << ",\"cost_today\":" << jsonlite::format_double(s.cost_today)
    << ",\"energy_today_kwh\":" << jsonlite::format_double(s.energy_today_kwh)
    << ",\"projected_month\":" << jsonlite::format_double(s.projected_month)
    << ",\"co2_today_kg\":" << jsonlite::format_double(s.co2_today_kg)
    << ",\"current_rate\":" << jsonlite::format_double(s.current_rate)
    << "}";
  return o.str();
}

SnapshotPublisher::SnapshotPublisher(const HomeRegistry& homes, BillingCalculator& calculator,
                                     ITransport& transport, ISnapshotStore& snapshots,
                                     WorkerPool& compute_pool, WorkerPool& persist_pool, EngineStats* stats,
                                     PublisherOptions options, timeutil::Clock clock)
    : homes_(homes),
      calculator_(calculator),
      transport_(transport),
      snapshots_(snapshots),
      compute_pool_(compute_pool),
      persist_pool_(persist_pool),
      stats_(stats),
      options_(options),
      clock_(std::move(clock)) {}

SnapshotPublisher::~SnapshotPublisher() { stop(); }

int64_t SnapshotPublisher::align_tick(int64_t now_ms) const {
  const int64_t interval_ms = std::max<int64_t>(options_.tick_interval.count(), 1) * timeutil::kMsPerSecond;
  return timeutil::floor_div(now_ms, interval_ms) * interval_ms;
}

void SnapshotPublisher::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (timer_.joinable()) return;
  stopping_ = false;
  timer_ = std::thread([this] { timer_loop(); });
}

void SnapshotPublisher::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (timer_.joinable()) timer_.join();
}

void SnapshotPublisher::timer_loop() {
  // First tick immediately, so the latest snapshot is available right after startup.
  tick_once(clock_());
  const int64_t interval_ms = std::max<int64_t>(options_.tick_interval.count(), 1) * timeutil::kMsPerSecond;
  while (true) {
    const int64_t now = clock_();
    const int64_t next = align_tick(now) + interval_ms;
    {
      std::unique_lock<std::mutex> lock(mu_);
      if (cv_.wait_for(lock, std::chrono::milliseconds(next - now), [this] { return stopping_; })) return;
    }
    tick_once(std::max(clock_(), next));
  }
}

void SnapshotPublisher::note_skip(const HomeContext& home, int64_t tick_ms) {
  if (stats_) stats_->ticks_skipped.fetch_add(1, std::memory_order_relaxed);
  log_event(LogLevel::warn, "publisher", "tick_skipped", home.id(),
            "previous computation still in flight at " + timeutil::format_rfc3339(tick_ms));
}

std::size_t SnapshotPublisher::tick_once(int64_t now_ms) {
  const int64_t tick = align_tick(now_ms);
  std::size_t dispatched = 0;
  for (HomeContext* home : homes_.homes()) {
    if (!home->try_begin_compute()) {
      note_skip(*home, tick);
      continue;
    }
    auto e = compute_pool_.submit([this, home, tick] {
      run_home(*home, tick);
      home->end_compute();
    });
    if (e) {
      home->end_compute();
      if (stats_) stats_->ticks_failed.fetch_add(1, std::memory_order_relaxed);
      log_event(LogLevel::warn, "publisher", "tick_not_dispatched", home->id(), e->message, e->code);
      continue;
    }
    ++dispatched;
  }
  return dispatched;
}

bool SnapshotPublisher::process_home(HomeContext& home, int64_t tick_ms) {
  if (!home.try_begin_compute()) {
    note_skip(home, tick_ms);
    return false;
  }
  run_home(home, tick_ms);
  home.end_compute();
  return true;
}

void SnapshotPublisher::run_home(HomeContext& home, int64_t tick_ms) {
  const int offset = home.config().utc_offset_minutes;
  const int64_t day = timeutil::local_day_index(tick_ms, offset);
  if (auto prev = home.exchange_tick_day(day); prev && *prev < day) {
    if (stats_) stats_->rollovers.fetch_add(1, std::memory_order_relaxed);
    log_event(LogLevel::info, "publisher", "day_rollover", home.id(),
              timeutil::format_date(*prev) + " -> " + timeutil::format_date(day));
  }

  std::optional<Error> error;
  std::optional<BillingSnapshot> snapshot;
  uint64_t elapsed_ns = 0;
  {
    ScopeTimer timer(elapsed_ns);
    snapshot = calculator_.compute(home.id(), tick_ms, &error);
  }
  if (stats_) stats_->compute_latency.record(elapsed_ns);

  if (!snapshot) {
    if (stats_) {
      stats_->ticks_failed.fetch_add(1, std::memory_order_relaxed);
      stats_->record_failure(error && error->cause != ErrorCode::none ? error->cause : ErrorCode::dependency_error);
    }
    log_event(LogLevel::error, "publisher", "compute_failed", home.id(),
              error ? error->message : std::string("unknown failure"),
              error ? error->code : ErrorCode::dependency_error);
    return;
  }
  if (stats_) stats_->ticks_ok.fetch_add(1, std::memory_order_relaxed);

  publish_snapshot(*snapshot);
  persist_snapshot(*snapshot);
}

void SnapshotPublisher::publish_snapshot(const BillingSnapshot& snapshot) {
  if (auto e = transport_.publish(billing_topic(snapshot.home_id), billing_payload_json(snapshot))) {
    if (stats_) stats_->publish_failures.fetch_add(1, std::memory_order_relaxed);
    log_event(LogLevel::warn, "publisher", "publish_failed", snapshot.home_id, e->message, e->code);
  }
}

void SnapshotPublisher::persist_snapshot(const BillingSnapshot& snapshot) {
  auto e = persist_pool_.submit([this, snapshot] {
    uint32_t attempts = 0;
    bool duplicate = false;
    auto err = persist_pool_.run_with_retry(
        options_.retry, [&] { return snapshots_.append(snapshot, &duplicate); }, &attempts);
    if (err) {
      if (stats_) stats_->persist_exhausted.fetch_add(1, std::memory_order_relaxed);
      log_event(LogLevel::error, "publisher", "persist_failed", snapshot.home_id,
                err->message + " after " + std::to_string(attempts) + " attempt(s)", err->code);
      return;
    }
    if (stats_) stats_->persist_ok.fetch_add(1, std::memory_order_relaxed);
    if (duplicate) {
      log_event(LogLevel::debug, "publisher", "snapshot_duplicate", snapshot.home_id,
                timeutil::format_rfc3339(snapshot.timestamp_ms));
    }
  });
  if (e) {
    log_event(LogLevel::warn, "publisher", "persist_not_queued", snapshot.home_id, e->message, e->code);
  }
}

}  // namespace oikos
