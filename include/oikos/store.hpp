#pragma once

// oikos/store.hpp — Durable system of record for readings and snapshots.
//
// DESIGN:
//   IReadingStore and ISnapshotStore are the seams the engine depends on.
//   The file adapters keep everything as append-only NDJSON under one data
//   directory whose layout version is recorded in <data>/layout.json and
//   checked on open (see version.hpp).
//
//   readings/<home>/<YYYY-MM-DD>.ndjson       one UTC day per partition
//   readings/<home>/<YYYY-MM-DD>.ndjson.zst   compacted partition (zstd builds)
//   snapshots/<home>.ndjson                   append-only snapshot history
//
// ERRORS:
//   I/O failures are transient_error (the persistence pool retries them);
//   unreadable layout or rows from a newer format are dependency_error.
//   Nothing throws.
//
// THREAD SAFETY:
//   Each adapter keeps one shard per home: a mutex plus that home's cached
//   state. I/O for one home never waits on another home's lock; the
//   store-wide mutex only guards the shard map itself. Only worker-pool
//   threads are expected to call append().

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "oikos/types.hpp"

namespace oikos {

class IReadingStore {
 public:
  virtual ~IReadingStore() = default;

  virtual std::optional<Error> append(const Reading& reading) = 0;

  // Total energy of persisted readings with start_ms <= ts < end_ms, in kWh.
  virtual double energy_kwh_between(const std::string& home_id, int64_t start_ms, int64_t end_ms,
                                    std::optional<Error>* error) = 0;
};

class ISnapshotStore {
 public:
  virtual ~ISnapshotStore() = default;

  // Appends unless a row with the same idempotency key exists, in which case
  // this is a successful no-op. *duplicate reports which one happened.
  virtual std::optional<Error> append(const BillingSnapshot& snapshot, bool* duplicate = nullptr) = 0;

  // Snapshots of home_id with from_ms <= timestamp <= to_ms, oldest first.
  virtual std::vector<BillingSnapshot> range(const std::string& home_id, int64_t from_ms, int64_t to_ms,
                                             std::optional<Error>* error) = 0;
};

// Creates the directory skeleton and layout.json, or validates an existing
// layout.json against version::check_compatibility().
std::optional<Error> prepare_data_dir(const std::string& data_dir);

// Row codecs (exposed for tests and the CLI).
std::string reading_row_to_json(const Reading& reading);
std::string snapshot_row_to_json(const BillingSnapshot& snapshot, const std::string& key);
std::optional<BillingSnapshot> snapshot_row_from_json(const std::string& line, uint32_t* row_version);

// ---------------------------------------------------------------------------
// FileReadingStore
// ---------------------------------------------------------------------------
class FileReadingStore : public IReadingStore {
 public:
  static constexpr int64_t kIndexBucketMs = 15 * 60 * 1000;
  static constexpr std::size_t kBucketsPerDay = 96;

  explicit FileReadingStore(std::string data_dir);

  std::optional<Error> append(const Reading& reading) override;
  double energy_kwh_between(const std::string& home_id, int64_t start_ms, int64_t end_ms,
                            std::optional<Error>* error) override;

  // Compresses partitions of UTC days strictly before (today - older_than_days).
  // Returns the number of partitions compacted; 0 without zstd support.
  //
  // The compressed partition starts with a provenance line recording the
  // length and BLAKE3 of the plain bytes merged into it. If a crash leaves
  // the plain file behind, readers and the next compaction skip that prefix,
  // so no row is ever counted twice.
  std::size_t compact(int64_t now_ms, int older_than_days, std::optional<Error>* error);

  static bool compression_available();

  uint64_t corrupt_rows() const;

 private:
  using BucketIndex = std::array<double, kBucketsPerDay>;  // Wh per 15 minutes

  struct HomeShard {
    std::mutex mu;
    std::map<int64_t, BucketIndex> index;  // by UTC day
  };

  HomeShard& shard(const std::string& home_id);
  std::string partition_path(const std::string& home_id, int64_t day) const;
  // Calls fn(ts_ms, energy_wh) for every readable row of the partition.
  // Caller holds the home's shard mutex.
  template <typename Fn>
  std::optional<Error> scan_partition_locked(const std::string& home_id, int64_t day, Fn&& fn);
  const BucketIndex* index_locked(HomeShard& shard, const std::string& home_id, int64_t day,
                                  std::optional<Error>* error);

  std::string root_;
  std::mutex shards_mu_;
  std::map<std::string, std::unique_ptr<HomeShard>> shards_;
  std::atomic<uint64_t> corrupt_rows_{0};
};

// ---------------------------------------------------------------------------
// FileSnapshotStore
// ---------------------------------------------------------------------------
//
// Idempotency keys are cached only for ticks within kKeyWindowMs of the
// newest persisted tick. An append older than that window is checked against
// the history file instead, so memory stays bounded on a long-running daemon
// without weakening dedup.
class FileSnapshotStore : public ISnapshotStore {
 public:
  static constexpr int64_t kKeyWindowMs = 24LL * 60 * 60 * 1000;

  explicit FileSnapshotStore(std::string data_dir);

  std::optional<Error> append(const BillingSnapshot& snapshot, bool* duplicate = nullptr) override;
  std::vector<BillingSnapshot> range(const std::string& home_id, int64_t from_ms, int64_t to_ms,
                                     std::optional<Error>* error) override;

  uint64_t corrupt_rows() const;

  // Number of idempotency keys currently held in memory for home_id.
  std::size_t cached_key_count(const std::string& home_id);

 private:
  struct HomeShard {
    std::mutex mu;
    bool loaded{false};
    int64_t newest_ms{0};
    std::map<int64_t, std::set<std::string>> recent_keys;  // by tick timestamp
  };

  HomeShard& shard(const std::string& home_id);
  std::string history_path(const std::string& home_id) const;
  // Caller holds the home's shard mutex.
  std::optional<Error> load_keys_locked(HomeShard& shard, const std::string& home_id);
  std::optional<Error> key_on_disk_locked(const std::string& home_id, const std::string& key, bool* found);
  void remember_key_locked(HomeShard& shard, int64_t tick_ms, const std::string& key);

  std::string root_;
  std::mutex shards_mu_;
  std::map<std::string, std::unique_ptr<HomeShard>> shards_;
  std::atomic<uint64_t> corrupt_rows_{0};
};

}  // namespace oikos
