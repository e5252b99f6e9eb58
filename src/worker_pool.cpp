#include "oikos/worker_pool.hpp"

#include <algorithm>

#include "oikos/observability.hpp"

namespace oikos {

std::string to_string(BackpressurePolicy policy) {
  switch (policy) {
    case BackpressurePolicy::block:       return "block";
    case BackpressurePolicy::drop_oldest: return "drop_oldest";
    case BackpressurePolicy::reject:      return "reject";
  }
  return "block";
}

std::optional<BackpressurePolicy> parse_backpressure_policy(const std::string& name) {
  if (name == "block") return BackpressurePolicy::block;
  if (name == "drop_oldest") return BackpressurePolicy::drop_oldest;
  if (name == "reject") return BackpressurePolicy::reject;
  return std::nullopt;
}

std::chrono::milliseconds RetryPolicy::delay_after(uint32_t attempt) const {
  if (attempt == 0) return std::chrono::milliseconds(0);
  // Cap the shift: beyond 2^20 every realistic base exceeds max_delay anyway.
  const uint32_t shift = std::min<uint32_t>(attempt - 1, 20);
  const int64_t raw = base_delay.count() * (int64_t{1} << shift);
  return std::chrono::milliseconds(std::min<int64_t>(raw, max_delay.count()));
}

WorkerPool::WorkerPool(std::string name, std::size_t threads, std::size_t max_queue,
                       BackpressurePolicy policy, EngineStats* stats)
    : name_(std::move(name)),
      max_queue_(max_queue),
      policy_(policy),
      stats_(stats) {
  const std::size_t n = std::max<std::size_t>(threads, 1);
  threads_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    threads_.emplace_back([this] { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() { shutdown(std::chrono::milliseconds(0)); }

std::optional<Error> WorkerPool::submit(Task task) {
  std::unique_lock<std::mutex> lock(mu_);
  if (shutting_down_) {
    if (stats_) stats_->tasks_rejected.fetch_add(1, std::memory_order_relaxed);
    return make_error(ErrorCode::shutting_down, "pool " + name_ + " is shutting down");
  }
  if (max_queue_ > 0 && queue_.size() >= max_queue_) {
    switch (policy_) {
      case BackpressurePolicy::block:
        cv_capacity_.wait(lock, [this] { return shutting_down_ || queue_.size() < max_queue_; });
        if (shutting_down_) {
          if (stats_) stats_->tasks_rejected.fetch_add(1, std::memory_order_relaxed);
          return make_error(ErrorCode::shutting_down, "pool " + name_ + " is shutting down");
        }
        break;
      case BackpressurePolicy::drop_oldest:
        queue_.pop_front();
        if (stats_) stats_->tasks_dropped.fetch_add(1, std::memory_order_relaxed);
        log_event(LogLevel::warn, "worker_pool", "task_dropped", {},
                  "pool=" + name_ + " policy=drop_oldest", ErrorCode::queue_full);
        break;
      case BackpressurePolicy::reject:
        if (stats_) stats_->tasks_rejected.fetch_add(1, std::memory_order_relaxed);
        log_event(LogLevel::warn, "worker_pool", "task_rejected", {},
                  "pool=" + name_ + " policy=reject", ErrorCode::queue_full);
        return make_error(ErrorCode::queue_full, "pool " + name_ + " queue is full");
    }
  }
  queue_.push_back(std::move(task));
  if (stats_) stats_->sample_queue_depth(queue_.size());
  lock.unlock();
  cv_.notify_one();
  return std::nullopt;
}

std::optional<Error> WorkerPool::run_with_retry(const RetryPolicy& policy,
                                                const std::function<std::optional<Error>()>& op,
                                                uint32_t* attempts_made) {
  const uint32_t max_attempts = std::max<uint32_t>(policy.max_attempts, 1);
  std::optional<Error> last;
  uint32_t attempt = 0;
  while (attempt < max_attempts) {
    ++attempt;
    last = op();
    if (!last || last->code != ErrorCode::transient_error) break;
    if (attempt >= max_attempts) break;

    if (stats_) stats_->persist_retries.fetch_add(1, std::memory_order_relaxed);
    std::unique_lock<std::mutex> lock(mu_);
    if (cv_shutdown_.wait_for(lock, policy.delay_after(attempt), [this] { return shutting_down_; })) {
      break;
    }
  }
  if (attempts_made) *attempts_made = attempt;
  return last;
}

bool WorkerPool::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_idle_.wait_for(lock, timeout, [this] { return queue_.empty() && active_ == 0; });
}

std::size_t WorkerPool::shutdown(std::chrono::milliseconds grace) {
  std::size_t abandoned = 0;
  {
    std::unique_lock<std::mutex> lock(mu_);
    if (joined_) return 0;
    shutting_down_ = true;
    cv_capacity_.notify_all();
    cv_shutdown_.notify_all();

    cv_idle_.wait_for(lock, grace, [this] { return queue_.empty() && active_ == 0; });

    abandoned = queue_.size();
    queue_.clear();
    stopping_ = true;
    joined_ = true;
  }
  cv_.notify_all();

  if (abandoned > 0) {
    if (stats_) stats_->tasks_abandoned.fetch_add(abandoned, std::memory_order_relaxed);
    log_event(LogLevel::warn, "worker_pool", "tasks_abandoned", {},
              "pool=" + name_ + " count=" + std::to_string(abandoned), ErrorCode::shutting_down);
  }
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  return abandoned;
}

std::size_t WorkerPool::queue_depth() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

std::size_t WorkerPool::active_tasks() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_;
}

void WorkerPool::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_) return;
      task = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
      if (max_queue_ > 0) cv_capacity_.notify_one();
    }
    task();
    {
      std::lock_guard<std::mutex> lock(mu_);
      --active_;
      if (queue_.empty() && active_ == 0) cv_idle_.notify_all();
    }
  }
}

}  // namespace oikos
