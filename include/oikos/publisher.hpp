#pragma once

// oikos/publisher.hpp — Periodic snapshot driver.
//
// DESIGN:
//   A timer thread fires at instants aligned to the tick interval
//   (floor(now / interval) * interval). Each tick dispatches every home to
//   the compute pool; homes run in parallel. A successful snapshot is
//   published best-effort to home/{id}/billing/today_cost and, separately,
//   handed to the persistence pool with bounded retry. Publish and persist
//   failures never affect each other.
//
// INVARIANTS:
//   - At most one computation per home is in flight. A tick that finds the
//     previous one still running skips that home; it is never queued.
//   - Re-producing the same aligned tick yields the same idempotency key, so
//     a restart or retry cannot duplicate history.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "oikos/billing.hpp"
#include "oikos/home.hpp"
#include "oikos/store.hpp"
#include "oikos/timeutil.hpp"
#include "oikos/transport.hpp"
#include "oikos/worker_pool.hpp"

namespace oikos {

class EngineStats;

std::string billing_topic(const std::string& home_id);
std::string billing_payload_json(const BillingSnapshot& snapshot);

struct PublisherOptions {
  std::chrono::seconds tick_interval{300};
  RetryPolicy retry;
};

class SnapshotPublisher {
 public:
  SnapshotPublisher(const HomeRegistry& homes, BillingCalculator& calculator, ITransport& transport,
                    ISnapshotStore& snapshots, WorkerPool& compute_pool, WorkerPool& persist_pool,
                    EngineStats* stats, PublisherOptions options, timeutil::Clock clock);
  ~SnapshotPublisher();

  SnapshotPublisher(const SnapshotPublisher&) = delete;
  SnapshotPublisher& operator=(const SnapshotPublisher&) = delete;

  void start();
  void stop();

  int64_t align_tick(int64_t now_ms) const;

  // Dispatches every home for the aligned tick containing now_ms to the
  // compute pool. Returns the number of homes dispatched.
  std::size_t tick_once(int64_t now_ms);

  // Computes, publishes and persists one home inline. Returns false when the
  // home was skipped because a computation was already in flight.
  bool process_home(HomeContext& home, int64_t tick_ms);

 private:
  void run_home(HomeContext& home, int64_t tick_ms);
  void note_skip(const HomeContext& home, int64_t tick_ms);
  void publish_snapshot(const BillingSnapshot& snapshot);
  void persist_snapshot(const BillingSnapshot& snapshot);
  void timer_loop();

  const HomeRegistry& homes_;
  BillingCalculator& calculator_;
  ITransport& transport_;
  ISnapshotStore& snapshots_;
  WorkerPool& compute_pool_;
  WorkerPool& persist_pool_;
  EngineStats* stats_;
  PublisherOptions options_;
  timeutil::Clock clock_;

  std::thread timer_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_{false};
};

}  // namespace oikos
