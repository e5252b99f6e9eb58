#pragma once

// oikos/worker_pool.hpp — Bounded task queue with explicit backpressure.
//
// DESIGN:
//   A fixed set of threads drains one bounded FIFO. When the queue is full,
//   submit() follows the pool's BackpressurePolicy:
//     block        caller waits for capacity (or shutdown)
//     drop_oldest  the oldest queued task is discarded to make room
//     reject       the new task is refused with queue_full
//   Drops and rejections are logged and counted, never silent.
//
// SHUTDOWN:
//   shutdown(grace) stops accepting work, lets workers drain the queue until
//   the grace deadline, then abandons what is left with a logged warning and
//   joins. Retry backoff sleeps wake immediately once shutdown begins and no
//   further attempt is made.
//
// INVARIANT: only pool workers perform blocking I/O on behalf of the engine.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "oikos/types.hpp"

namespace oikos {

class EngineStats;

enum class BackpressurePolicy { block, drop_oldest, reject };

std::string to_string(BackpressurePolicy policy);
std::optional<BackpressurePolicy> parse_backpressure_policy(const std::string& name);

// Bounded exponential backoff: attempt n (1-based) waits
// min(base * 2^(n-1), max) before attempt n+1.
struct RetryPolicy {
  uint32_t max_attempts{5};
  std::chrono::milliseconds base_delay{100};
  std::chrono::milliseconds max_delay{5000};

  std::chrono::milliseconds delay_after(uint32_t attempt) const;
};

class WorkerPool {
 public:
  using Task = std::function<void()>;

  WorkerPool(std::string name, std::size_t threads, std::size_t max_queue,
             BackpressurePolicy policy, EngineStats* stats = nullptr);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // nullopt when queued. queue_full under reject, shutting_down after
  // shutdown() began.
  std::optional<Error> submit(Task task);

  // Runs op until it succeeds, fails with anything but transient_error, the
  // attempts are exhausted, or shutdown begins. Returns the last error.
  // Intended to be called from inside a task.
  std::optional<Error> run_with_retry(const RetryPolicy& policy,
                                      const std::function<std::optional<Error>()>& op,
                                      uint32_t* attempts_made = nullptr);

  // Blocks until the queue is empty and no task is running, or timeout.
  bool wait_idle(std::chrono::milliseconds timeout);

  // Returns the number of abandoned tasks. Idempotent.
  std::size_t shutdown(std::chrono::milliseconds grace);

  std::size_t queue_depth() const;
  std::size_t active_tasks() const;
  const std::string& name() const { return name_; }

 private:
  void worker_loop();

  std::string name_;
  std::size_t max_queue_;
  BackpressurePolicy policy_;
  EngineStats* stats_;

  std::vector<std::thread> threads_;
  mutable std::mutex mu_;
  std::condition_variable cv_;           // work available / stopping
  std::condition_variable cv_capacity_;  // room in queue / shutting down
  std::condition_variable cv_idle_;      // queue drained and no active task
  std::condition_variable cv_shutdown_;  // wakes retry sleeps
  std::deque<Task> queue_;
  std::size_t active_{0};
  bool shutting_down_{false};  // no new work, no new retries
  bool stopping_{false};       // workers exit
  bool joined_{false};
};

}  // namespace oikos
