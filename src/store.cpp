#include "oikos/store.hpp"

// Append-only NDJSON adapters.
//
// CRASH SAFETY:
//   Appends are single fwrite() calls followed by fflush() and, for
//   snapshots, fsync(). A crash can leave a partial last line; readers skip
//   unparsable rows (counted as corrupt) and the next append starts on a new
//   line so it is never glued to the fragment.
//
//   Compaction writes the compressed partition with tmp + rename and only
//   then removes the plain file. The compressed text opens with a provenance
//   line {"compacted":1,"plain_bytes":N,"plain_blake3":"..."} naming the
//   plain bytes it absorbed. A crash before the remove leaves both files;
//   while the plain file still begins with those N bytes, readers and the
//   next compaction skip them and only take rows appended after.

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <unistd.h>

#if defined(OIKOS_WITH_ZSTD)
#include <zstd.h>
#endif

#include "oikos/hash.hpp"
#include "oikos/jsonlite.hpp"
#include "oikos/observability.hpp"
#include "oikos/timeutil.hpp"
#include "oikos/version.hpp"

namespace fs = std::filesystem;

namespace oikos {

namespace {

constexpr const char* kReadingsDir   = "readings";
constexpr const char* kSnapshotsDir  = "snapshots";
constexpr const char* kLayoutFile    = "layout.json";
constexpr const char* kPartitionExt  = ".ndjson";
constexpr const char* kCompressedExt = ".ndjson.zst";

std::optional<Error> transient(std::string message) {
  return make_error(ErrorCode::transient_error, std::move(message));
}

std::optional<Error> dependency(std::string message) {
  return make_error(ErrorCode::dependency_error, std::move(message));
}

#if defined(OIKOS_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data) {
  const unsigned long long size = ZSTD_getFrameContentSize(data.data(), data.size());
  if (size == ZSTD_CONTENTSIZE_ERROR || size == ZSTD_CONTENTSIZE_UNKNOWN) return std::nullopt;
  std::string out;
  out.resize(static_cast<std::size_t>(size));
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

// Unique temporary name so concurrent writers never collide.
std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Write to a temp file, then rename into place (atomic within a filesystem).
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_whole(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

std::optional<Error> append_line(const fs::path& path, const std::string& line, bool sync) {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) return transient("cannot create " + path.parent_path().string() + ": " + ec.message());

  FILE* f = std::fopen(path.c_str(), "a+b");
  if (!f) return transient("cannot open " + path.string());

  std::string payload;
  if (std::fseek(f, 0, SEEK_END) != 0) {
    std::fclose(f);
    return transient("cannot seek " + path.string());
  }
  if (std::ftell(f) > 0) {
    if (std::fseek(f, -1, SEEK_END) != 0) {
      std::fclose(f);
      return transient("cannot seek " + path.string());
    }
    if (std::fgetc(f) != '\n') payload += '\n';
    if (std::fseek(f, 0, SEEK_END) != 0) {
      std::fclose(f);
      return transient("cannot seek " + path.string());
    }
  }
  payload += line;
  payload += '\n';

  bool ok = std::fwrite(payload.data(), 1, payload.size(), f) == payload.size();
  ok = ok && std::fflush(f) == 0;
  if (ok && sync) ok = ::fsync(::fileno(f)) == 0;
  if (std::fclose(f) != 0) ok = false;
  if (!ok) return transient("write failed: " + path.string());
  return std::nullopt;
}

template <typename Fn>
void for_each_line(const std::string& text, Fn&& fn) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t nl = text.find('\n', pos);
    if (nl == std::string::npos) nl = text.size();
    if (nl > pos) fn(text.substr(pos, nl - pos));
    pos = nl + 1;
  }
}

bool parse_reading_row(const std::string& line, int64_t* ts_ms, double* energy_wh) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(line, &err);
  if (err) return false;
  const uint64_t v = jsonlite::get_u64(obj, "v", 0);
  if (v == 0 || v > version::READING_ROW_VERSION) return false;
  const jsonlite::Value* ts = jsonlite::find(obj, "ts");
  const jsonlite::Value* e = jsonlite::find(obj, "e");
  if (!ts || !e) return false;
  auto ts_num = jsonlite::as_double(*ts);
  auto e_num = jsonlite::as_double(*e);
  if (!ts_num || !e_num) return false;
  *ts_ms = static_cast<int64_t>(*ts_num);
  *energy_wh = *e_num;
  return true;
}

#if defined(OIKOS_WITH_ZSTD)
// Plain bytes already absorbed by a compressed partition.
struct MergedPrefix {
  uint64_t plain_bytes{0};
  std::string plain_blake3;
};

std::string merged_prefix_line(const std::string& plain_text) {
  std::string out = "{\"compacted\":1,\"plain_bytes\":";
  out += std::to_string(plain_text.size());
  out += ",\"plain_blake3\":\"";
  out += blake3_hex(plain_text);
  out += "\"}\n";
  return out;
}

// Strips the provenance line from decompressed partition text. Partitions
// compacted before provenance was recorded have none.
std::optional<MergedPrefix> take_merged_prefix(std::string* text) {
  const std::size_t nl = text->find('\n');
  const std::string first = text->substr(0, nl);
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(first, &err);
  if (err || !jsonlite::find(obj, "compacted")) return std::nullopt;
  MergedPrefix p;
  p.plain_bytes = jsonlite::get_u64(obj, "plain_bytes", 0);
  p.plain_blake3 = jsonlite::get_string(obj, "plain_blake3");
  text->erase(0, nl == std::string::npos ? text->size() : nl + 1);
  return p;
}

// Bytes at the front of plain_text that the compressed partition already holds.
std::size_t already_merged(const std::optional<MergedPrefix>& prefix, const std::string& plain_text) {
  if (!prefix || prefix->plain_bytes == 0 || prefix->plain_bytes > plain_text.size()) return 0;
  const auto n = static_cast<std::size_t>(prefix->plain_bytes);
  if (blake3_hex(std::string_view(plain_text).substr(0, n)) != prefix->plain_blake3) return 0;
  return n;
}
#endif

}  // namespace

// ---------------------------------------------------------------------------
// Layout and row codecs
// ---------------------------------------------------------------------------

std::optional<Error> prepare_data_dir(const std::string& data_dir) {
  const fs::path root(data_dir);
  std::error_code ec;
  fs::create_directories(root / kReadingsDir, ec);
  if (!ec) fs::create_directories(root / kSnapshotsDir, ec);
  if (ec) return dependency("cannot create data directory " + data_dir + ": " + ec.message());

  const fs::path layout = root / kLayoutFile;
  if (fs::exists(layout, ec)) {
    auto text = read_whole(layout);
    if (!text) return dependency("cannot read " + layout.string());
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(*text, &err);
    if (err) return dependency(layout.string() + ": " + err->message);
    const auto stored = static_cast<uint32_t>(jsonlite::get_u64(obj, "data_layout", 0));
    auto compat = version::check_compatibility(stored);
    if (!compat.ok) return dependency(compat.error_code + ": " + compat.description);
    return std::nullopt;
  }
  if (!atomic_write(layout, version::manifest_to_json(version::current_manifest(PROJECT_VERSION)) + "\n")) {
    return dependency("cannot write " + layout.string());
  }
  return std::nullopt;
}

std::string reading_row_to_json(const Reading& r) {
  std::string out;
  out.reserve(96);
  out += "{\"v\":";
  out += std::to_string(version::READING_ROW_VERSION);
  out += ",\"ts\":";
  out += std::to_string(r.timestamp_ms);
  out += ",\"cat\":\"";
  out += jsonlite::escape(r.device_category);
  out += "\",\"p\":";
  out += jsonlite::format_double(r.power_w);
  out += ",\"e\":";
  out += jsonlite::format_double(reading_energy_wh(r));
  out += '}';
  return out;
}

std::string snapshot_row_to_json(const BillingSnapshot& s, const std::string& key) {
  std::ostringstream o;
  o << "{\"v\":" << version::SNAPSHOT_ROW_VERSION
    << ",\"key\":\"" << key << "\""
    << ",\"timestamp\":\"" << timeutil::format_rfc3339(s.timestamp_ms) << "\""
    << ",\"ts_ms\":" << s.timestamp_ms
    << ",\"home_id\":\"" << jsonlite::escape(s.home_id) << "\""
    << ",\"cost_today\":" << jsonlite::format_double(s.cost_today)
    << ",\"energy_today_kwh\":" << jsonlite::format_double(s.energy_today_kwh)
    << ",\"projected_month\":" << jsonlite::format_double(s.projected_month)
    << ",\"co2_today_kg\":" << jsonlite::format_double(s.co2_today_kg)
    << ",\"current_rate\":" << jsonlite::format_double(s.current_rate)
    << ",\"tariff_id\":" << s.tariff_id
    << ",\"tariff_name\":\"" << jsonlite::escape(s.tariff_name) << "\""
    << "}";
  return o.str();
}

std::optional<BillingSnapshot> snapshot_row_from_json(const std::string& line, uint32_t* row_version) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(line, &err);
  if (err) return std::nullopt;
  const uint64_t v = jsonlite::get_u64(obj, "v", 0);
  if (row_version) *row_version = static_cast<uint32_t>(v);
  if (v == 0 || v > version::SNAPSHOT_ROW_VERSION) return std::nullopt;

  const jsonlite::Value* ts = jsonlite::find(obj, "ts_ms");
  auto ts_num = ts ? jsonlite::as_double(*ts) : std::nullopt;
  BillingSnapshot s;
  s.home_id = jsonlite::get_string(obj, "home_id");
  if (!ts_num || s.home_id.empty()) return std::nullopt;
  for (const char* field : {"cost_today", "energy_today_kwh", "projected_month", "co2_today_kg", "current_rate"}) {
    const jsonlite::Value* f = jsonlite::find(obj, field);
    if (!f || !jsonlite::is_number(*f)) return std::nullopt;
  }
  s.timestamp_ms     = static_cast<int64_t>(*ts_num);
  s.cost_today       = jsonlite::get_double(obj, "cost_today");
  s.energy_today_kwh = jsonlite::get_double(obj, "energy_today_kwh");
  s.projected_month  = jsonlite::get_double(obj, "projected_month");
  s.co2_today_kg     = jsonlite::get_double(obj, "co2_today_kg");
  s.current_rate     = jsonlite::get_double(obj, "current_rate");
  s.tariff_id        = static_cast<int64_t>(jsonlite::get_u64(obj, "tariff_id", 0));
  s.tariff_name      = jsonlite::get_string(obj, "tariff_name");
  return s;
}

// ---------------------------------------------------------------------------
// FileReadingStore
// ---------------------------------------------------------------------------

FileReadingStore::FileReadingStore(std::string data_dir) : root_(std::move(data_dir)) {}

bool FileReadingStore::compression_available() {
#if defined(OIKOS_WITH_ZSTD)
  return true;
#else
  return false;
#endif
}

uint64_t FileReadingStore::corrupt_rows() const { return corrupt_rows_.load(); }

FileReadingStore::HomeShard& FileReadingStore::shard(const std::string& home_id) {
  std::lock_guard<std::mutex> lock(shards_mu_);
  auto& slot = shards_[home_id];
  if (!slot) slot = std::make_unique<HomeShard>();
  return *slot;
}

std::string FileReadingStore::partition_path(const std::string& home_id, int64_t day) const {
  return (fs::path(root_) / kReadingsDir / home_id / (timeutil::format_date(day) + kPartitionExt)).string();
}

template <typename Fn>
std::optional<Error> FileReadingStore::scan_partition_locked(const std::string& home_id, int64_t day, Fn&& fn) {
  const std::string plain = partition_path(home_id, day);
  const std::string packed = (fs::path(root_) / kReadingsDir / home_id /
                              (timeutil::format_date(day) + kCompressedExt)).string();
  auto visit = [&](const std::string& text) {
    for_each_line(text, [&](const std::string& line) {
      int64_t ts = 0;
      double wh = 0.0;
      if (!parse_reading_row(line, &ts, &wh)) {
        ++corrupt_rows_;
        return;
      }
      fn(ts, wh);
    });
  };

  std::size_t skip = 0;
  std::error_code ec;
  const bool has_packed = fs::exists(packed, ec);
  const bool has_plain = fs::exists(plain, ec);
  std::optional<std::string> plain_text;
  if (has_plain) {
    plain_text = read_whole(plain);
    if (!plain_text) return transient("cannot read " + plain);
  }
  if (has_packed) {
#if defined(OIKOS_WITH_ZSTD)
    auto raw = read_whole(packed);
    if (!raw) return transient("cannot read " + packed);
    auto text = decompress_zstd(*raw);
    if (!text) return dependency("corrupt compressed partition " + packed);
    auto prefix = take_merged_prefix(&*text);
    if (plain_text) skip = already_merged(prefix, *plain_text);
    visit(*text);
#else
    return dependency("partition " + packed + " is zstd-compressed; rebuild with OIKOS_WITH_ZSTD");
#endif
  }
  if (plain_text) visit(plain_text->substr(skip));
  return std::nullopt;
}

const FileReadingStore::BucketIndex* FileReadingStore::index_locked(HomeShard& shard, const std::string& home_id,
                                                                   int64_t day, std::optional<Error>* error) {
  auto it = shard.index.find(day);
  if (it != shard.index.end()) return &it->second;

  BucketIndex idx{};
  const int64_t day_start = day * timeutil::kMsPerDay;
  auto e = scan_partition_locked(home_id, day, [&](int64_t ts, double wh) {
    const int64_t offset = ts - day_start;
    if (offset < 0 || offset >= timeutil::kMsPerDay) return;  // misfiled row
    idx[static_cast<std::size_t>(offset / kIndexBucketMs)] += wh;
  });
  if (e) {
    *error = e;
    return nullptr;
  }
  return &shard.index.emplace(day, idx).first->second;
}

std::optional<Error> FileReadingStore::append(const Reading& reading) {
  const int64_t day = timeutil::floor_div(reading.timestamp_ms, timeutil::kMsPerDay);
  HomeShard& home = shard(reading.home_id);
  std::lock_guard<std::mutex> lock(home.mu);
  if (auto e = append_line(partition_path(reading.home_id, day), reading_row_to_json(reading), false)) {
    return e;
  }
  auto it = home.index.find(day);
  if (it != home.index.end()) {
    const int64_t offset = reading.timestamp_ms - day * timeutil::kMsPerDay;
    it->second[static_cast<std::size_t>(offset / kIndexBucketMs)] += reading_energy_wh(reading);
  }
  return std::nullopt;
}

double FileReadingStore::energy_kwh_between(const std::string& home_id, int64_t start_ms, int64_t end_ms,
                                            std::optional<Error>* error) {
  if (end_ms <= start_ms) return 0.0;
  HomeShard& home = shard(home_id);
  std::lock_guard<std::mutex> lock(home.mu);

  double wh = 0.0;
  const int64_t first_day = timeutil::floor_div(start_ms, timeutil::kMsPerDay);
  const int64_t last_day = timeutil::floor_div(end_ms - 1, timeutil::kMsPerDay);
  for (int64_t day = first_day; day <= last_day; ++day) {
    const int64_t day_start = day * timeutil::kMsPerDay;
    const BucketIndex* idx = index_locked(home, home_id, day, error);
    if (!idx) return 0.0;

    bool partial = false;
    for (std::size_t b = 0; b < kBucketsPerDay; ++b) {
      const int64_t bs = day_start + static_cast<int64_t>(b) * kIndexBucketMs;
      const int64_t be = bs + kIndexBucketMs;
      if (be <= start_ms || bs >= end_ms) continue;
      if (bs >= start_ms && be <= end_ms) {
        wh += (*idx)[b];
      } else {
        partial = true;
      }
    }
    // Unaligned range edges fall back to a row scan of this partition.
    if (partial) {
      auto e = scan_partition_locked(home_id, day, [&](int64_t ts, double row_wh) {
        if (ts < start_ms || ts >= end_ms) return;
        const int64_t bs = day_start + timeutil::floor_div(ts - day_start, kIndexBucketMs) * kIndexBucketMs;
        if (bs >= start_ms && bs + kIndexBucketMs <= end_ms) return;  // already counted
        wh += row_wh;
      });
      if (e) {
        *error = e;
        return 0.0;
      }
    }
  }
  return wh / 1000.0;
}

std::size_t FileReadingStore::compact(int64_t now_ms, int older_than_days, std::optional<Error>* error) {
#if !defined(OIKOS_WITH_ZSTD)
  (void)now_ms;
  (void)older_than_days;
  (void)error;
  log_event(LogLevel::info, "store", "compaction_unavailable", {}, "built without OIKOS_WITH_ZSTD");
  return 0;
#else
  const int64_t cutoff_day = timeutil::floor_div(now_ms, timeutil::kMsPerDay) - older_than_days;
  const fs::path readings = fs::path(root_) / kReadingsDir;

  std::error_code ec;
  if (!fs::exists(readings, ec)) return 0;

  std::size_t compacted = 0;
  for (const auto& home_dir : fs::directory_iterator(readings, ec)) {
    if (!home_dir.is_directory(ec)) continue;
    const std::string home_id = home_dir.path().filename().string();
    HomeShard& home = shard(home_id);
    std::lock_guard<std::mutex> lock(home.mu);

    std::vector<fs::path> candidates;
    for (const auto& entry : fs::directory_iterator(home_dir.path(), ec)) {
      const std::string name = entry.path().filename().string();
      if (name.size() != 10 + std::string(kPartitionExt).size()) continue;
      if (name.substr(10) != kPartitionExt) continue;
      auto day = timeutil::parse_date(name.substr(0, 10));
      if (day && *day < cutoff_day) candidates.push_back(entry.path());
    }
    std::sort(candidates.begin(), candidates.end());

    for (const auto& plain : candidates) {
      const fs::path packed = fs::path(plain.string() + ".zst");
      auto text = read_whole(plain);
      if (!text) {
        *error = transient("cannot read " + plain.string());
        return compacted;
      }
      std::string body;
      std::size_t skip = 0;
      if (fs::exists(packed, ec)) {
        auto raw = read_whole(packed);
        auto old = raw ? decompress_zstd(*raw) : std::nullopt;
        if (!old) {
          *error = dependency("corrupt compressed partition " + packed.string());
          return compacted;
        }
        skip = already_merged(take_merged_prefix(&*old), *text);
        body = std::move(*old);
        if (!body.empty() && body.back() != '\n') body += '\n';
      }
      body.append(*text, skip, std::string::npos);

      const std::string packed_bytes = compress_zstd(merged_prefix_line(*text) + body);
      if (packed_bytes.empty() || !atomic_write(packed, packed_bytes)) {
        *error = transient("cannot write " + packed.string());
        return compacted;
      }
      fs::remove(plain, ec);
      if (ec) {
        *error = transient("cannot remove " + plain.string() + ": " + ec.message());
        return compacted;
      }
      ++compacted;
      log_event(LogLevel::info, "store", "partition_compacted", home_id, plain.filename().string());
    }
  }
  return compacted;
#endif
}

// ---------------------------------------------------------------------------
// FileSnapshotStore
// ---------------------------------------------------------------------------

namespace {

// Key and tick of a persisted snapshot row; false for torn or foreign rows.
bool parse_snapshot_key(const std::string& line, std::string* key, int64_t* tick_ms) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(line, &err);
  if (err) return false;
  *key = jsonlite::get_string(obj, "key");
  const jsonlite::Value* ts = jsonlite::find(obj, "ts_ms");
  auto ts_num = ts ? jsonlite::as_double(*ts) : std::nullopt;
  if (key->empty() || !ts_num) return false;
  *tick_ms = static_cast<int64_t>(*ts_num);
  return true;
}

// Streams the history file line by line; false if it exists but cannot be opened.
template <typename Fn>
bool for_each_history_line(const std::string& path, Fn&& fn) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) fn(line);
  }
  return true;
}

}  // namespace

FileSnapshotStore::FileSnapshotStore(std::string data_dir) : root_(std::move(data_dir)) {}

uint64_t FileSnapshotStore::corrupt_rows() const { return corrupt_rows_.load(); }

FileSnapshotStore::HomeShard& FileSnapshotStore::shard(const std::string& home_id) {
  std::lock_guard<std::mutex> lock(shards_mu_);
  auto& slot = shards_[home_id];
  if (!slot) slot = std::make_unique<HomeShard>();
  return *slot;
}

std::size_t FileSnapshotStore::cached_key_count(const std::string& home_id) {
  HomeShard& home = shard(home_id);
  std::lock_guard<std::mutex> lock(home.mu);
  std::size_t n = 0;
  for (const auto& entry : home.recent_keys) n += entry.second.size();
  return n;
}

std::string FileSnapshotStore::history_path(const std::string& home_id) const {
  return (fs::path(root_) / kSnapshotsDir / (home_id + kPartitionExt)).string();
}

void FileSnapshotStore::remember_key_locked(HomeShard& home, int64_t tick_ms, const std::string& key) {
  home.newest_ms = std::max(home.newest_ms, tick_ms);
  const int64_t floor_ms = home.newest_ms - kKeyWindowMs;
  if (tick_ms >= floor_ms) home.recent_keys[tick_ms].insert(key);
  home.recent_keys.erase(home.recent_keys.begin(), home.recent_keys.lower_bound(floor_ms));
}

std::optional<Error> FileSnapshotStore::load_keys_locked(HomeShard& home, const std::string& home_id) {
  if (home.loaded) return std::nullopt;
  const std::string path = history_path(home_id);
  const bool ok = for_each_history_line(path, [&](const std::string& line) {
    std::string key;
    int64_t tick = 0;
    if (parse_snapshot_key(line, &key, &tick)) remember_key_locked(home, tick, key);
  });
  if (!ok) {
    home.recent_keys.clear();
    home.newest_ms = 0;
    return transient("cannot read " + path);
  }
  home.loaded = true;
  return std::nullopt;
}

std::optional<Error> FileSnapshotStore::key_on_disk_locked(const std::string& home_id, const std::string& key,
                                                           bool* found) {
  *found = false;
  const std::string path = history_path(home_id);
  const bool ok = for_each_history_line(path, [&](const std::string& line) {
    std::string row_key;
    int64_t tick = 0;
    if (!*found && parse_snapshot_key(line, &row_key, &tick) && row_key == key) *found = true;
  });
  if (!ok) return transient("cannot read " + path);
  return std::nullopt;
}

std::optional<Error> FileSnapshotStore::append(const BillingSnapshot& snapshot, bool* duplicate) {
  if (duplicate) *duplicate = false;
  const std::string key = snapshot_idempotency_key(snapshot.home_id, snapshot.timestamp_ms, snapshot.tariff_id);

  HomeShard& home = shard(snapshot.home_id);
  std::lock_guard<std::mutex> lock(home.mu);
  if (auto e = load_keys_locked(home, snapshot.home_id)) return e;

  bool seen = false;
  if (snapshot.timestamp_ms >= home.newest_ms - kKeyWindowMs) {
    auto it = home.recent_keys.find(snapshot.timestamp_ms);
    seen = it != home.recent_keys.end() && it->second.contains(key);
  } else if (auto e = key_on_disk_locked(snapshot.home_id, key, &seen)) {
    return e;
  }
  if (seen) {
    if (duplicate) *duplicate = true;
    return std::nullopt;
  }
  if (auto e = append_line(history_path(snapshot.home_id), snapshot_row_to_json(snapshot, key), true)) {
    return e;
  }
  remember_key_locked(home, snapshot.timestamp_ms, key);
  return std::nullopt;
}

std::vector<BillingSnapshot> FileSnapshotStore::range(const std::string& home_id, int64_t from_ms, int64_t to_ms,
                                                      std::optional<Error>* error) {
  std::vector<BillingSnapshot> out;
  const std::string path = history_path(home_id);

  HomeShard& home = shard(home_id);
  std::lock_guard<std::mutex> lock(home.mu);
  bool too_new = false;
  uint32_t newest = 0;
  const bool ok = for_each_history_line(path, [&](const std::string& line) {
    uint32_t v = 0;
    auto s = snapshot_row_from_json(line, &v);
    if (!s) {
      if (v > version::SNAPSHOT_ROW_VERSION) {
        too_new = true;
        newest = std::max(newest, v);
      } else {
        ++corrupt_rows_;
      }
      return;
    }
    if (s->timestamp_ms >= from_ms && s->timestamp_ms <= to_ms) out.push_back(std::move(*s));
  });
  if (!ok) {
    *error = transient("cannot read " + path);
    return {};
  }
  if (too_new) {
    *error = dependency("snapshot history for " + home_id + " contains row version " + std::to_string(newest) +
                        ", newer than supported version " + std::to_string(version::SNAPSHOT_ROW_VERSION));
    return {};
  }

  std::stable_sort(out.begin(), out.end(), [](const BillingSnapshot& a, const BillingSnapshot& b) {
    return a.timestamp_ms < b.timestamp_ms;
  });
  return out;
}

}  // namespace oikos
