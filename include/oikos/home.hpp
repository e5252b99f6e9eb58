#pragma once

// oikos/home.hpp — Per-home runtime context and the immutable home registry.
//
// The registry is built once at startup and never mutated afterwards, so
// lookups need no lock. Each HomeContext carries its own mutex; nothing on
// the ingest or compute path takes a lock that spans homes.

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "oikos/accumulator.hpp"
#include "oikos/timeutil.hpp"
#include "oikos/types.hpp"

namespace oikos {

class EngineStats;

struct HomeConfig {
  std::string id;
  std::string name;
  std::string tariff_name;
  int         utc_offset_minutes{0};
};

class HomeContext {
 public:
  HomeContext(HomeConfig config, std::shared_ptr<const CategorySet> categories,
              int64_t future_skew_ms, timeutil::Clock clock, EngineStats* stats);

  const HomeConfig& config() const { return config_; }
  const std::string& id() const { return config_.id; }
  EnergyAccumulator& accumulator() { return accumulator_; }
  const EnergyAccumulator& accumulator() const { return accumulator_; }

  std::optional<BillingSnapshot> latest() const;
  void set_latest(BillingSnapshot snapshot);

  // Publisher guard: true while a computation for this home is in flight.
  // Returns false when one already was.
  bool try_begin_compute() { return !in_flight_.exchange(true, std::memory_order_acq_rel); }
  void end_compute() { in_flight_.store(false, std::memory_order_release); }
  bool compute_in_flight() const { return in_flight_.load(std::memory_order_acquire); }

  // Records the local day of a tick and returns the previous one.
  std::optional<int64_t> exchange_tick_day(int64_t local_day);

 private:
  HomeConfig config_;
  EnergyAccumulator accumulator_;
  std::atomic<bool> in_flight_{false};

  mutable std::mutex mu_;
  std::optional<BillingSnapshot> latest_;
  std::optional<int64_t> last_tick_day_;
};

class HomeRegistry {
 public:
  HomeRegistry() = default;

  // config_error on invalid or duplicate ids, offsets that are not a multiple
  // of 15 minutes within +/-14h, or an empty category set.
  static HomeRegistry build(const std::vector<HomeConfig>& homes, CategorySet categories,
                            int64_t future_skew_ms, timeutil::Clock clock, EngineStats* stats,
                            std::optional<Error>* error);

  // nullptr with lookup_error for an unknown id.
  HomeContext* find(const std::string& home_id, std::optional<Error>* error = nullptr) const;

  const std::vector<HomeContext*>& homes() const { return order_; }
  const std::string& default_home_id() const;
  const CategorySet& categories() const;
  std::size_t size() const { return order_.size(); }

 private:
  std::map<std::string, std::unique_ptr<HomeContext>> by_id_;
  std::vector<HomeContext*> order_;  // configuration order
  std::shared_ptr<const CategorySet> categories_;
};

std::optional<Error> validate_home_config(const HomeConfig& home);

}  // namespace oikos
