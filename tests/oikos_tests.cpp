#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

#include "oikos/accumulator.hpp"
#include "oikos/billing.hpp"
#include "oikos/config.hpp"
#include "oikos/hash.hpp"
#include "oikos/home.hpp"
#include "oikos/ingest.hpp"
#include "oikos/jsonlite.hpp"
#include "oikos/observability.hpp"
#include "oikos/publisher.hpp"
#include "oikos/status_api.hpp"
#include "oikos/status_server.hpp"
#include "oikos/store.hpp"
#include "oikos/tariff.hpp"
#include "oikos/timeutil.hpp"
#include "oikos/transport.hpp"
#include "oikos/version.hpp"
#include "oikos/worker_pool.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

int64_t at(const std::string& rfc3339) {
  auto ts = oikos::timeutil::parse_rfc3339(rfc3339);
  expect(ts.has_value(), "test timestamp must parse: " + rfc3339);
  return *ts;
}

fs::path temp_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() /
      ("oikos_test_" + name + "_" + std::to_string(oikos::timeutil::now_ms()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

// Captured engine events (see set_event_hook).
std::mutex g_events_mu;
std::vector<oikos::EngineEvent> g_events;

void capture_event(const oikos::EngineEvent& ev) {
  std::lock_guard<std::mutex> lock(g_events_mu);
  g_events.push_back(ev);
}

std::size_t count_events(const std::string& event) {
  std::lock_guard<std::mutex> lock(g_events_mu);
  std::size_t n = 0;
  for (const auto& ev : g_events) {
    if (ev.event == event) ++n;
  }
  return n;
}

void clear_events() {
  std::lock_guard<std::mutex> lock(g_events_mu);
  g_events.clear();
}

// Settable clock shared by a test and the components it builds.
struct TestClock {
  std::shared_ptr<std::atomic<int64_t>> now = std::make_shared<std::atomic<int64_t>>(0);
  oikos::timeutil::Clock fn() const {
    auto p = now;
    return [p] { return p->load(); };
  }
  void set(int64_t ms) { now->store(ms); }
};

// One-shot latch that blocks pool workers until opened.
class Gate {
 public:
  void wait() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return open_; });
  }
  void open() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool open_{false};
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

// In-memory reading store: the durable month-to-date source for billing tests.
class MemoryReadingStore : public oikos::IReadingStore {
 public:
  std::optional<oikos::Error> append(const oikos::Reading& reading) override {
    std::lock_guard<std::mutex> lock(mu_);
    rows_.push_back(reading);
    return std::nullopt;
  }
  double energy_kwh_between(const std::string& home_id, int64_t start_ms, int64_t end_ms,
                            std::optional<oikos::Error>* error) override {
    if (fail) {
      *error = oikos::make_error(oikos::ErrorCode::transient_error, "memory store offline");
      return 0.0;
    }
    std::lock_guard<std::mutex> lock(mu_);
    double wh = 0.0;
    for (const auto& r : rows_) {
      if (r.home_id == home_id && r.timestamp_ms >= start_ms && r.timestamp_ms < end_ms) {
        wh += oikos::reading_energy_wh(r);
      }
    }
    return wh / 1000.0;
  }

  bool fail{false};

 private:
  std::mutex mu_;
  std::vector<oikos::Reading> rows_;
};

// In-memory snapshot store with injectable transient failures.
class MemorySnapshotStore : public oikos::ISnapshotStore {
 public:
  std::optional<oikos::Error> append(const oikos::BillingSnapshot& s, bool* duplicate) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++attempts;
    if (duplicate) *duplicate = false;
    if (always_fail || fail_next > 0) {
      if (fail_next > 0) --fail_next;
      return oikos::make_error(oikos::ErrorCode::transient_error, "memory store busy");
    }
    const std::string key = oikos::snapshot_idempotency_key(s.home_id, s.timestamp_ms, s.tariff_id);
    if (!keys_.insert(key).second) {
      if (duplicate) *duplicate = true;
      return std::nullopt;
    }
    rows_.push_back(s);
    return std::nullopt;
  }
  std::vector<oikos::BillingSnapshot> range(const std::string& home_id, int64_t from_ms, int64_t to_ms,
                                            std::optional<oikos::Error>*) override {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<oikos::BillingSnapshot> out;
    for (const auto& s : rows_) {
      if (s.home_id == home_id && s.timestamp_ms >= from_ms && s.timestamp_ms <= to_ms) out.push_back(s);
    }
    return out;
  }
  std::size_t size() {
    std::lock_guard<std::mutex> lock(mu_);
    return rows_.size();
  }

  int attempts{0};
  int fail_next{0};
  bool always_fail{false};

 private:
  std::mutex mu_;
  std::set<std::string> keys_;
  std::vector<oikos::BillingSnapshot> rows_;
};

// PG&E E-6 style two-tier TOU tariff.
const char* kE6Tariffs = R"({"tariffs":[{
  "id": 1, "name": "pge_e6_2025", "utility": "PG&E",
  "effective_date": "2025-01-01", "end_date": null, "co2_factor_kg_per_kwh": 0.42,
  "structure": {
    "fixed_charge_monthly": 10.0,
    "energy_charges": [
      {"tier": 1, "limit_kwh": 400,
       "summer": {"off_peak": 0.25, "partial_peak": 0.30, "peak": 0.45},
       "winter": {"off_peak": 0.23, "partial_peak": 0.27, "peak": 0.35}},
      {"tier": 2, "limit_kwh": null,
       "summer": {"off_peak": 0.35, "partial_peak": 0.40, "peak": 0.55},
       "winter": {"off_peak": 0.33, "partial_peak": 0.37, "peak": 0.45}}
    ],
    "tou_schedule": {
      "summer_months": [6, 7, 8, 9],
      "peak_hours": [16, 17, 18, 19, 20],
      "partial_peak_hours": [7, 8, 9, 10, 11, 12, 13, 14, 15, 21, 22],
      "off_peak_hours": [0, 1, 2, 3, 4, 5, 6, 23]
    }
  }
}]})";

constexpr int kPacific = -420;  // PDT, fixed

oikos::TariffDefinition e6_tariff() {
  std::optional<oikos::Error> error;
  auto rows = oikos::parse_tariff_file(kE6Tariffs, &error);
  expect(!error && rows.size() == 1, "E-6 fixture must parse");
  return rows.front();
}

oikos::TariffRegistry e6_registry() {
  std::optional<oikos::Error> error;
  auto registry = oikos::TariffRegistry::build({e6_tariff()}, &error);
  expect(!error, "E-6 registry must build");
  return registry;
}

oikos::HomeRegistry one_home(const TestClock& clock, oikos::EngineStats* stats,
                             const std::string& tariff = "pge_e6_2025") {
  std::optional<oikos::Error> error;
  auto homes = oikos::HomeRegistry::build({oikos::HomeConfig{"home_001", "Default Home", tariff, kPacific}},
                                          oikos::default_device_categories(), 60 * 1000, clock.fn(), stats,
                                          &error);
  expect(!error, "home registry must build");
  return homes;
}

oikos::Reading reading(const std::string& ts, const std::string& category, double power_w,
                       std::optional<double> energy_wh) {
  oikos::Reading r;
  r.timestamp_ms = at(ts);
  r.home_id = "home_001";
  r.device_category = category;
  r.power_w = power_w;
  r.energy_wh = energy_wh;
  return r;
}

// ============================================================================
// Phase 1: Time, JSON, hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(oikos::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(oikos::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_idempotency_key() {
  const auto k1 = oikos::snapshot_idempotency_key("home_001", 1000, 1);
  expect(k1.size() == 64, "key is 64 hex chars");
  expect(k1 == oikos::snapshot_idempotency_key("home_001", 1000, 1), "key is deterministic");
  expect(k1 != oikos::snapshot_idempotency_key("home_001", 1000, 2), "tariff id changes the key");
  expect(k1 != oikos::snapshot_idempotency_key("home_001", 2000, 1), "tick changes the key");
  expect(k1 != oikos::hash_domain("tariff:", "home_001|1000|1"), "domains are separated");
}

void test_rfc3339_parse_and_format() {
  const int64_t a = at("2025-07-15T17:30:00-07:00");
  expect(a == at("2025-07-16T00:30:00Z"), "offset and Z forms agree");
  expect(oikos::timeutil::format_rfc3339(a) == "2025-07-16T00:30:00Z", "UTC format");
  expect(oikos::timeutil::format_rfc3339(a, kPacific) == "2025-07-15T17:30:00-07:00", "local format");
  expect(at("2025-07-16T00:30:00.250Z") == a + 250, "milliseconds parsed");
  expect(!oikos::timeutil::parse_rfc3339("2025-07-16T00:30:00"), "zone designator required");
  expect(!oikos::timeutil::parse_rfc3339("2025-02-30T00:00:00Z"), "invalid date rejected");
  expect(!oikos::timeutil::parse_rfc3339("2025-07-16T24:00:00Z"), "hour 24 rejected");
}

void test_local_calendar() {
  const int64_t t = at("2025-07-15T17:30:00-07:00");
  expect(oikos::timeutil::start_of_local_day(t, kPacific) == at("2025-07-15T00:00:00-07:00"), "local midnight");
  expect(oikos::timeutil::start_of_local_month(t, kPacific) == at("2025-07-01T00:00:00-07:00"), "local month");
  expect(oikos::timeutil::days_in_local_month(t, kPacific) == 31, "July has 31 days");
  expect(oikos::timeutil::days_in_local_month(at("2024-02-10T12:00:00Z"), 0) == 29, "leap February");
  const auto local = oikos::timeutil::to_local(t, kPacific);
  expect(local.day == 15 && local.hour == 17 && local.minute == 30, "to_local fields");
  auto day = oikos::timeutil::parse_date("2025-07-15");
  expect(day && oikos::timeutil::format_date(*day) == "2025-07-15", "date index round trip");
  expect(*day == oikos::timeutil::local_day_index(t, kPacific), "local day index");
}

void test_json_strictness() {
  std::optional<oikos::jsonlite::JsonError> err;
  oikos::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");
  err.reset();
  oikos::jsonlite::parse(R"({"a":)", &err);
  expect(err && err->code == "json_parse_error", "truncated JSON rejected");
  err.reset();
  auto obj = oikos::jsonlite::parse(R"({"n":-420,"x":1.5,"s":"v"})", &err);
  expect(!err, "valid object parses");
  auto n = oikos::jsonlite::as_double(*oikos::jsonlite::find(obj, "n"));
  expect(n && *n == -420.0, "negative numbers read as double");
}

// ============================================================================
// Phase 2: Tariffs
// ============================================================================

void test_tariff_file_loads() {
  const auto t = e6_tariff();
  expect(t.id == 1 && t.name == "pge_e6_2025" && t.utility == "PG&E", "identity fields");
  expect(t.tiers.size() == 2, "two tiers");
  expect(t.tiers[0].limit_kwh && *t.tiers[0].limit_kwh == 400.0, "tier 1 limit");
  expect(!t.tiers[1].limit_kwh, "tier 2 unbounded");
  expect(near(t.tiers[0].rate(oikos::Season::summer, oikos::TouPeriod::peak), 0.45), "summer peak rate");
  expect(near(t.co2_factor_kg_per_kwh, 0.42), "co2 factor");
  expect(t.schedule.season_for_month(7) == oikos::Season::summer, "July is summer");
  expect(t.schedule.season_for_month(12) == oikos::Season::winter, "December is winter");
  expect(!oikos::validate_tariff(t), "fixture validates");
}

void test_tou_partition_rejects_gaps_and_overlaps() {
  auto t = e6_tariff();
  auto gap = t.schedule;
  gap.off_peak_hours->reset(3);
  auto e = oikos::validate_schedule(gap);
  expect(e && e->code == oikos::ErrorCode::config_error, "hour 3 uncovered is rejected");

  auto overlap = t.schedule;
  overlap.partial_peak_hours.set(17);
  e = oikos::validate_schedule(overlap);
  expect(e && e->code == oikos::ErrorCode::config_error, "peak/partial overlap is rejected");

  auto implicit = t.schedule;
  implicit.off_peak_hours.reset();
  expect(!oikos::validate_schedule(implicit), "omitted off_peak means the complement");
  expect(implicit.period_for_hour(3) == oikos::TouPeriod::off_peak, "complement hour is off-peak");

  std::string broken = kE6Tariffs;
  broken.replace(broken.find("[0, 1, 2, 3,"), 12, "[0, 1, 2,   ");
  std::optional<oikos::Error> error;
  oikos::parse_tariff_file(broken, &error);
  expect(error && error->code == oikos::ErrorCode::config_error, "file with a gap fails to load");
}

void test_tariff_rejects_malformed_rows() {
  std::optional<oikos::Error> error;
  std::string bad_tier = kE6Tariffs;
  bad_tier.replace(bad_tier.find("\"tier\": 2"), 9, "\"tier\": 3");
  oikos::parse_tariff_file(bad_tier, &error);
  expect(error && error->code == oikos::ErrorCode::config_error, "tier numbering must be sequential");

  error.reset();
  std::string no_co2 = kE6Tariffs;
  no_co2.replace(no_co2.find("\"co2_factor_kg_per_kwh\": 0.42,"), 30, "");
  oikos::parse_tariff_file(no_co2, &error);
  expect(error && error->code == oikos::ErrorCode::config_error, "co2 factor is required");

  error.reset();
  oikos::parse_tariff_file("{\"tariffs\":[", &error);
  expect(error && error->code == oikos::ErrorCode::config_error, "malformed JSON is a config error");
}

void test_resolve_rate() {
  const auto t = e6_tariff();
  std::optional<oikos::Error> error;
  auto r = oikos::resolve(at("2025-07-15T17:30:00-07:00"), kPacific, t, 0.0, &error);
  expect(!error, "resolve succeeds");
  expect(r.season == oikos::Season::summer && r.period == oikos::TouPeriod::peak, "summer peak");
  expect(r.tier_index == 0 && near(r.rate, 0.45), "tier 1 peak rate");

  r = oikos::resolve(at("2025-07-15T17:30:00-07:00"), kPacific, t, 450.0, &error);
  expect(r.tier_index == 1 && near(r.rate, 0.55), "tier 2 above 400 kWh");

  r = oikos::resolve(at("2025-01-15T11:00:00Z"), kPacific, t, 0.0, &error);
  expect(r.season == oikos::Season::winter && r.period == oikos::TouPeriod::off_peak, "04:00 local winter");
  expect(near(r.rate, 0.23), "winter off-peak rate");

  r = oikos::resolve(at("2025-07-15T21:59:59-07:00"), kPacific, t, 0.0, &error);
  expect(r.period == oikos::TouPeriod::partial_peak, "21:59 is partial peak");
}

void test_tier_proration() {
  const auto t = e6_tariff();
  const auto parts = oikos::split_across_tiers(t, 395.0, 10.0);
  expect(parts.size() == 2, "split into two tiers");
  expect(parts[0].tier_index == 0 && near(parts[0].kwh, 5.0), "5 kWh at tier 1");
  expect(parts[1].tier_index == 1 && near(parts[1].kwh, 5.0), "5 kWh at tier 2");
  expect(near(oikos::price_energy(t, oikos::Season::summer, oikos::TouPeriod::peak, 395.0, 10.0),
              5 * 0.45 + 5 * 0.55),
         "prorated price");
  expect(oikos::split_across_tiers(t, 500.0, 1.0).front().tier_index == 1, "past the limit stays in tier 2");
  expect(oikos::split_across_tiers(t, 0.0, 0.0).empty(), "zero energy has no portions");
}

void test_registry_effective_dating() {
  auto first = e6_tariff();
  first.end_day = *oikos::timeutil::parse_date("2025-07-01");
  auto second = e6_tariff();
  second.id = 2;
  second.effective_day = *oikos::timeutil::parse_date("2025-07-01");

  std::optional<oikos::Error> error;
  auto registry = oikos::TariffRegistry::build({first, second}, &error);
  expect(!error, "adjacent ranges are fine");
  const auto* t = registry.active_for("pge_e6_2025", *oikos::timeutil::parse_date("2025-06-30"), &error);
  expect(t && t->id == 1, "June uses row 1");
  t = registry.active_for("pge_e6_2025", *oikos::timeutil::parse_date("2025-07-01"), &error);
  expect(t && t->id == 2, "July uses row 2");
  t = registry.active_for("pge_e6_2025", *oikos::timeutil::parse_date("2024-12-31"), &error);
  expect(!t && error && error->code == oikos::ErrorCode::lookup_error, "no row before 2025");
  error.reset();
  t = registry.active_for("nope", *oikos::timeutil::parse_date("2025-07-01"), &error);
  expect(!t && error && error->code == oikos::ErrorCode::lookup_error, "unknown name");

  error.reset();
  auto overlapping = e6_tariff();
  overlapping.id = 3;
  oikos::TariffRegistry::build({e6_tariff(), overlapping}, &error);
  expect(error && error->code == oikos::ErrorCode::config_error, "overlapping ranges rejected");

  error.reset();
  oikos::TariffRegistry::build({first, first}, &error);
  expect(error && error->code == oikos::ErrorCode::config_error, "duplicate ids rejected");
}

// ============================================================================
// Phase 3: Energy accumulator
// ============================================================================

void test_breakdown_sum_order_independent() {
  TestClock clock;
  clock.set(at("2025-07-15T18:00:00-07:00"));
  oikos::EngineStats stats;
  auto a = one_home(clock, &stats);
  auto b = one_home(clock, &stats);

  std::vector<oikos::Reading> readings = {
      reading("2025-07-15T15:10:00-07:00", "hvac", 0, 1000.0),
      reading("2025-07-15T16:05:00-07:00", "hvac", 0, 2000.0),
      reading("2025-07-15T16:40:00-07:00", "kitchen", 3600, std::nullopt),  // 5 Wh
      reading("2025-07-15T17:20:00-07:00", "office", 0, 500.0),
  };
  for (const auto& r : readings) expect(!a.find("home_001")->accumulator().add_reading(r), "in order");
  for (auto it = readings.rbegin(); it != readings.rend(); ++it) {
    expect(!b.find("home_001")->accumulator().add_reading(*it), "reverse order");
  }

  const auto sched = e6_tariff().schedule;
  const int64_t start = at("2025-07-15T00:00:00-07:00");
  const int64_t end = at("2025-07-15T18:00:00-07:00");
  const auto ba = a.find("home_001")->accumulator().window_breakdown(start, end, sched);
  const auto bb = b.find("home_001")->accumulator().window_breakdown(start, end, sched);

  expect(near(ba.total_kwh(), 3.505), "total equals sum of readings");
  expect(near(ba.total_kwh(), bb.total_kwh()), "independent of arrival order");
  expect(ba.buckets.size() == bb.buckets.size(), "same bucket count");
  expect(ba.buckets.size() == 2, "partial-peak run then peak run");
  expect(ba.buckets[0].period == oikos::TouPeriod::partial_peak && near(ba.buckets[0].kwh, 1.0), "15h bucket");
  expect(ba.buckets[1].period == oikos::TouPeriod::peak && near(ba.buckets[1].kwh, 2.505), "16h-17h merged");
  expect(near(ba.kwh_for(oikos::TouPeriod::peak), 2.505), "kwh_for peak");
}

void test_power_integration() {
  oikos::Reading r;
  r.power_w = 1200.0;
  expect(near(oikos::reading_energy_wh(r), 1200.0 * oikos::kNominalSampleSeconds / 3600.0),
         "power integrated over the nominal interval");
  r.energy_wh = 7.0;
  expect(near(oikos::reading_energy_wh(r), 7.0), "reported energy wins");
}

void test_reading_validation() {
  TestClock clock;
  clock.set(at("2025-07-15T17:30:00-07:00"));
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats);
  auto& acc = homes.find("home_001")->accumulator();

  auto expect_invalid = [&](oikos::Reading r, const std::string& what) {
    auto e = acc.add_reading(r);
    expect(e && e->code == oikos::ErrorCode::validation_error, what);
  };
  auto foreign = reading("2025-07-15T17:00:00-07:00", "hvac", 100, std::nullopt);
  foreign.home_id = "home_999";
  expect_invalid(foreign, "foreign home rejected");
  expect_invalid(reading("2025-07-15T17:00:00-07:00", "sauna", 100, std::nullopt), "unknown category");
  expect_invalid(reading("2025-07-15T17:00:00-07:00", "hvac", -1, std::nullopt), "negative power");
  expect_invalid(reading("2025-07-15T17:00:00-07:00", "hvac", std::nan(""), std::nullopt), "NaN power");
  expect_invalid(reading("2025-07-15T17:00:00-07:00", "hvac", 1, -5.0), "negative energy");
  expect_invalid(reading("2025-07-15T17:32:00-07:00", "hvac", 1, std::nullopt), "beyond future skew");
  expect(!acc.add_reading(reading("2025-07-15T17:30:30-07:00", "hvac", 1, std::nullopt)), "within skew ok");
  expect(acc.sample_count() == 1, "only the valid reading is kept");
}

void test_eviction_excludes_old_readings() {
  TestClock clock;
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  clock.set(now);
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats);
  auto& acc = homes.find("home_001")->accumulator();

  std::atomic<int> persisted{0};
  acc.set_persist_hook([&](const oikos::Reading&) { persisted.fetch_add(1); });

  bool retained = true;
  expect(!acc.add_reading(reading("2025-07-14T16:00:00-07:00", "hvac", 0, 4000.0), &retained), "old accepted");
  expect(!retained, "older than 24h is not retained");
  expect(!acc.add_reading(reading("2025-07-15T17:00:00-07:00", "hvac", 0, 1000.0), &retained), "fresh accepted");
  expect(retained, "fresh reading retained");
  expect(persisted.load() == 2, "both handed to persistence");
  expect(stats.readings_stale_persisted.load() == 1, "stale reading counted");

  const auto b = acc.window_breakdown(now - 2 * oikos::kRetentionWindowMs, now + 1, e6_tariff().schedule);
  expect(near(b.total_kwh(), 1.0), "evicted reading excluded");

  // Retained readings age out as the clock advances.
  clock.set(now + oikos::kRetentionWindowMs);
  const auto later = acc.window_breakdown(now - oikos::kRetentionWindowMs, now + oikos::kRetentionWindowMs,
                                          e6_tariff().schedule);
  expect(near(later.total_kwh(), 0.0), "reading aged out after 24h");
  expect(acc.sample_count() == 0, "series trimmed");
}

void test_late_arrivals_age_out_in_order() {
  TestClock clock;
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  clock.set(now);
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats);
  auto& acc = homes.find("home_001")->accumulator();

  expect(!acc.add_reading(reading("2025-07-15T17:00:00-07:00", "hvac", 0, 1000.0)), "newest first");
  expect(!acc.add_reading(reading("2025-07-14T18:00:00-07:00", "hvac", 0, 500.0)), "late, near the window edge");
  expect(!acc.add_reading(reading("2025-07-15T09:00:00-07:00", "hvac", 0, 250.0)), "late, mid-window");
  expect(acc.sample_count() == 3, "all three retained");

  const auto sched = e6_tariff().schedule;
  const int64_t from = now - 2 * oikos::kRetentionWindowMs;
  expect(near(acc.window_breakdown(from, now + 1, sched).total_kwh(), 1.75), "late samples counted");

  // The oldest sample leaves the front of the series first even though it
  // arrived after a newer one.
  clock.set(now + oikos::timeutil::kMsPerHour);
  expect(near(acc.window_breakdown(from, now + oikos::timeutil::kMsPerHour, sched).total_kwh(), 1.25),
         "only the aged-out sample evicted");
  expect(acc.sample_count() == 2, "series trimmed from the front");
}

// ============================================================================
// Phase 4: Billing calculator
// ============================================================================

void test_billing_example() {
  TestClock clock;
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  clock.set(now);
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats);
  auto tariffs = e6_registry();
  MemoryReadingStore store;
  oikos::BillingCalculator calc(homes, tariffs, store);

  expect(!homes.find("home_001")->accumulator().add_reading(
             reading("2025-07-15T17:10:00-07:00", "ev_charger", 0, 5000.0)),
         "reading accepted");

  std::optional<oikos::Error> error;
  auto s = calc.compute("home_001", now, &error);
  expect(s.has_value() && !error, "compute succeeds");
  expect(near(s->cost_today, 2.25), "5 kWh x 0.45 = 2.25");
  expect(near(s->energy_today_kwh, 5.0), "energy today");
  expect(near(s->co2_today_kg, 5.0 * 0.42), "co2 today");
  expect(near(s->current_rate, 0.45), "current rate");
  expect(near(s->projected_month, 2.25 / 15.0 * 31.0), "projection over 31 days");
  expect(s->tariff_id == 1 && s->tariff_name == "pge_e6_2025", "tariff identity");
  expect(s->timestamp_ms == now, "snapshot instant");

  auto latest = calc.latest("home_001");
  expect(latest && near(latest->cost_today, 2.25), "latest snapshot stored");
}

void test_compute_idempotent() {
  TestClock clock;
  const int64_t now = at("2025-07-15T20:00:00-07:00");
  clock.set(now);
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats);
  auto tariffs = e6_registry();
  MemoryReadingStore store;
  oikos::BillingCalculator calc(homes, tariffs, store);

  auto& acc = homes.find("home_001")->accumulator();
  expect(!acc.add_reading(reading("2025-07-15T03:00:00-07:00", "base_load", 0, 300.0)), "off-peak");
  expect(!acc.add_reading(reading("2025-07-15T09:30:00-07:00", "office", 0, 1200.0)), "partial");
  expect(!acc.add_reading(reading("2025-07-15T18:45:00-07:00", "hvac", 0, 2500.0)), "peak");

  std::optional<oikos::Error> error;
  auto first = calc.compute("home_001", now, &error);
  auto second = calc.compute("home_001", now, &error);
  expect(first && second && !error, "both computes succeed");
  expect(first->cost_today == second->cost_today, "cost identical");
  expect(first->energy_today_kwh == second->energy_today_kwh, "energy identical");
  expect(first->co2_today_kg == second->co2_today_kg, "co2 identical");
  expect(near(first->cost_today, 0.3 * 0.25 + 1.2 * 0.30 + 2.5 * 0.45), "mixed period cost");
}

void test_month_to_date_tier_crossing() {
  TestClock clock;
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  clock.set(now);
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats);
  auto tariffs = e6_registry();
  MemoryReadingStore store;
  oikos::BillingCalculator calc(homes, tariffs, store);

  expect(!store.append(reading("2025-07-03T12:00:00-07:00", "ev_charger", 0, 395000.0)), "history row");
  expect(!store.append(reading("2025-06-30T12:00:00-07:00", "ev_charger", 0, 999000.0)), "last month row");
  expect(!homes.find("home_001")->accumulator().add_reading(
             reading("2025-07-15T17:10:00-07:00", "ev_charger", 0, 10000.0)),
         "today reading");

  std::optional<oikos::Error> error;
  auto s = calc.compute("home_001", now, &error);
  expect(s.has_value(), "compute succeeds");
  expect(near(s->cost_today, 5 * 0.45 + 5 * 0.55), "10 kWh split 5/5 across tiers");
  expect(near(s->current_rate, 0.55), "current rate is tier 2");

  store.fail = true;
  error.reset();
  auto failed = calc.compute("home_001", now, &error);
  expect(!failed && error && error->code == oikos::ErrorCode::dependency_error, "store failure aborts");
  expect(error->cause == oikos::ErrorCode::transient_error, "cause preserved");
}

void test_compute_failure_produces_no_snapshot() {
  TestClock clock;
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  clock.set(now);
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats, "missing_tariff");
  auto tariffs = e6_registry();
  MemoryReadingStore store;
  oikos::BillingCalculator calc(homes, tariffs, store);

  std::optional<oikos::Error> error;
  auto s = calc.compute("home_001", now, &error);
  expect(!s && error, "no snapshot");
  expect(error->code == oikos::ErrorCode::dependency_error, "wrapped as dependency_error");
  expect(error->cause == oikos::ErrorCode::lookup_error, "caused by lookup_error");
  expect(!calc.latest("home_001"), "latest untouched");

  error.reset();
  expect(!calc.compute("home_404", now, &error) && error->cause == oikos::ErrorCode::lookup_error,
         "unknown home");
}

void test_day_rollover() {
  TestClock clock;
  clock.set(at("2025-07-15T17:10:00-07:00"));
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats);
  auto tariffs = e6_registry();
  MemoryReadingStore readings;
  MemorySnapshotStore snapshots;
  oikos::BillingCalculator calc(homes, tariffs, readings);
  oikos::LoopbackTransport transport;
  oikos::WorkerPool compute("compute", 1, 8, oikos::BackpressurePolicy::reject, &stats);
  oikos::WorkerPool persist("persist", 1, 8, oikos::BackpressurePolicy::block, &stats);
  oikos::PublisherOptions options;
  options.retry.base_delay = 1ms;
  oikos::SnapshotPublisher publisher(homes, calc, transport, snapshots, compute, persist, &stats, options,
                                     clock.fn());

  auto& home = *homes.find("home_001");
  home.accumulator().set_persist_hook(
      [&](const oikos::Reading& r) { expect(!readings.append(r), "reading persisted"); });
  expect(!home.accumulator().add_reading(reading("2025-07-15T17:10:00-07:00", "hvac", 0, 5000.0)), "day 1");

  const int64_t day1_tick = at("2025-07-15T23:55:00-07:00");
  clock.set(day1_tick);
  expect(publisher.process_home(home, day1_tick), "day 1 tick runs");
  const int64_t day2_tick = at("2025-07-16T00:05:00-07:00");
  clock.set(day2_tick);
  expect(publisher.process_home(home, day2_tick), "day 2 tick runs");
  expect(persist.wait_idle(2000ms), "persistence drained");

  expect(stats.rollovers.load() == 1, "rollover detected once");
  auto latest = home.latest();
  expect(latest && latest->timestamp_ms == day2_tick, "latest is day 2");
  expect(near(latest->energy_today_kwh, 0.0), "energy restarts at local midnight");

  std::optional<oikos::Error> error;
  auto day1 = snapshots.range("home_001", at("2025-07-15T00:00:00-07:00"), at("2025-07-15T23:59:59-07:00"),
                              &error);
  expect(day1.size() == 1, "day 1 snapshot still queryable");
  expect(near(day1[0].energy_today_kwh, 5.0) && near(day1[0].cost_today, 2.25), "day 1 snapshot unchanged");
}

// ============================================================================
// Phase 5: Transport and ingest
// ============================================================================

void test_topic_matching() {
  expect(oikos::topic_matches("home/+/device/+/power", "home/h1/device/hvac/power"), "+ wildcards");
  expect(!oikos::topic_matches("home/+/device/+/power", "home/h1/device/hvac/energy"), "literal mismatch");
  expect(!oikos::topic_matches("home/+/device/+/power", "home/h1/device/power"), "level count");
  expect(oikos::topic_matches("home/#", "home/h1/billing/today_cost"), "# matches the rest");
  expect(oikos::topic_matches("#", "a/b"), "bare #");
  expect(!oikos::topic_matches("home/+", "home/a/b"), "+ is one level");
  expect(oikos::split_topic("a//b").size() == 3, "empty levels kept");
}

void test_ingest_gateway() {
  TestClock clock;
  clock.set(at("2025-07-15T17:30:00-07:00"));
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats);
  oikos::LoopbackTransport transport;
  oikos::IngestGateway gateway(homes, &stats);
  expect(!gateway.attach(transport), "attach");

  clear_events();
  oikos::set_log_level(oikos::LogLevel::warn);
  oikos::set_event_hook(capture_event);

  const std::string topic = "home/home_001/device/hvac/power";
  expect(transport.inject(topic, R"({"timestamp":"2025-07-15T17:10:00-07:00","power_w":1200,"energy_wh":100})") == 1,
         "delivered to the gateway");
  transport.inject(topic, R"({"timestamp":"2025-07-15T17:10:00-07:00","power_w":800,"device_category":"hvac"})");
  transport.inject(topic, R"({"timestamp":"2025-07-15 17:10","power_w":1})");
  transport.inject(topic, R"({"timestamp":"2025-07-15T17:10:00Z","power_w":"high"})");
  transport.inject(topic, R"({"timestamp":"2025-07-15T17:10:00Z","power_w":1,"device_category":"office"})");
  transport.inject(topic, R"({"timestamp":)");
  transport.inject("home/home_404/device/hvac/power", R"({"timestamp":"2025-07-15T17:10:00Z","power_w":1})");
  transport.inject(topic, R"({"timestamp":"2025-07-15T17:10:00Z","power_w":-3})");

  oikos::set_event_hook(nullptr);
  oikos::set_log_level(oikos::LogLevel::error);

  expect(stats.readings_accepted.load() == 2, "two readings accepted");
  expect(stats.readings_rejected.load() == 6, "six readings rejected");
  expect(count_events("reading_rejected") == 6, "each rejection logged");
  expect(homes.find("home_001")->accumulator().sample_count() == 2, "accepted readings accumulated");

  std::optional<oikos::Error> error;
  auto r = oikos::parse_reading_message(topic, R"({"timestamp":"2025-07-15T17:10:00Z","power_w":50})", &error);
  expect(r && r->home_id == "home_001" && r->device_category == "hvac" && !r->energy_wh, "parsed fields");
}

void test_stream_transport() {
  std::istringstream in(
      "home/home_001/device/hvac/power {\"timestamp\":\"2025-07-15T17:10:00Z\",\"power_w\":5}\n"
      "no-separator\n"
      "\n"
      "home/home_001/device/office/power {\"timestamp\":\"2025-07-15T17:11:00Z\",\"power_w\":6}\r\n");
  std::ostringstream out;
  oikos::StreamTransport transport(in, out);
  std::vector<std::string> payloads;
  expect(!transport.subscribe("home/+/device/+/power",
                              [&](const std::string&, const std::string& p) { payloads.push_back(p); }),
         "subscribe");
  expect(transport.pump() == 2, "two well-formed lines dispatched");
  expect(payloads.size() == 2 && payloads[1].back() == '}', "CR stripped");

  expect(!transport.publish("home/home_001/billing/today_cost", "{\"cost_today\":1.0}"), "publish");
  expect(out.str() == "home/home_001/billing/today_cost {\"cost_today\":1.0}\n", "publication line format");
}

// ============================================================================
// Phase 6: Worker pool
// ============================================================================

void test_pool_reject_policy() {
  oikos::EngineStats stats;
  oikos::WorkerPool pool("test", 1, 1, oikos::BackpressurePolicy::reject, &stats);
  Gate gate;
  expect(!pool.submit([&] { gate.wait(); }), "first task accepted");
  expect(eventually([&] { return pool.active_tasks() == 1; }), "first task running");
  expect(!pool.submit([] {}), "second task queued");
  expect(pool.queue_depth() == 1, "one task waiting");
  auto e = pool.submit([] {});
  expect(e && e->code == oikos::ErrorCode::queue_full, "third task rejected");
  expect(stats.tasks_rejected.load() == 1, "rejection counted");
  gate.open();
  expect(pool.wait_idle(2000ms), "pool drains");
}

void test_pool_drop_oldest_policy() {
  oikos::EngineStats stats;
  oikos::WorkerPool pool("test", 1, 1, oikos::BackpressurePolicy::drop_oldest, &stats);
  Gate gate;
  std::atomic<bool> b_ran{false}, c_ran{false};
  expect(!pool.submit([&] { gate.wait(); }), "blocker accepted");
  expect(eventually([&] { return pool.active_tasks() == 1; }), "blocker running");
  expect(!pool.submit([&] { b_ran = true; }), "B queued");
  expect(!pool.submit([&] { c_ran = true; }), "C replaces B");
  gate.open();
  expect(pool.wait_idle(2000ms), "pool drains");
  expect(!b_ran.load() && c_ran.load(), "oldest queued task dropped");
  expect(stats.tasks_dropped.load() == 1, "drop counted");
}

void test_pool_block_policy() {
  oikos::EngineStats stats;
  oikos::WorkerPool pool("test", 1, 1, oikos::BackpressurePolicy::block, &stats);
  Gate gate;
  std::atomic<int> ran{0};
  expect(!pool.submit([&] { gate.wait(); }), "blocker accepted");
  expect(eventually([&] { return pool.active_tasks() == 1; }), "blocker running");
  expect(!pool.submit([&] { ran++; }), "queue filled");

  std::atomic<bool> returned{false};
  std::optional<oikos::Error> result;
  std::thread submitter([&] {
    result = pool.submit([&] { ran++; });
    returned = true;
  });
  std::this_thread::sleep_for(100ms);
  expect(!returned.load(), "submit waits while the queue is full");
  gate.open();
  submitter.join();
  expect(!result, "waiting submit accepted once a slot frees");
  expect(pool.wait_idle(2000ms) && ran.load() == 2, "queued and waiting tasks both ran");
  expect(stats.tasks_rejected.load() == 0 && stats.tasks_dropped.load() == 0, "nothing rejected or dropped");

  // A caller still waiting for capacity when shutdown begins is released
  // with shutting_down rather than left hanging.
  oikos::EngineStats closing_stats;
  oikos::WorkerPool closing("test", 1, 1, oikos::BackpressurePolicy::block, &closing_stats);
  Gate hold;
  expect(!closing.submit([&] { hold.wait(); }), "blocker accepted");
  expect(eventually([&] { return closing.active_tasks() == 1; }), "blocker running");
  expect(!closing.submit([] {}), "queue filled");
  std::atomic<bool> late_returned{false};
  std::optional<oikos::Error> late;
  std::thread waiting([&] {
    late = closing.submit([] {});
    late_returned = true;
  });
  std::this_thread::sleep_for(50ms);
  expect(!late_returned.load(), "submit parked on a full queue");

  std::thread releaser([&] {
    std::this_thread::sleep_for(300ms);
    hold.open();
  });
  closing.shutdown(10ms);
  waiting.join();
  releaser.join();
  expect(late && late->code == oikos::ErrorCode::shutting_down, "parked submit fails with shutting_down");
}

void test_pool_shutdown_abandons_queue() {
  oikos::EngineStats stats;
  oikos::WorkerPool pool("test", 1, 8, oikos::BackpressurePolicy::block, &stats);
  Gate gate;
  std::atomic<int> ran{0};
  expect(!pool.submit([&] { gate.wait(); }), "blocker accepted");
  expect(eventually([&] { return pool.active_tasks() == 1; }), "blocker running");
  expect(!pool.submit([&] { ran++; }), "queued 1");
  expect(!pool.submit([&] { ran++; }), "queued 2");

  std::thread releaser([&] {
    std::this_thread::sleep_for(300ms);
    gate.open();
  });
  const std::size_t abandoned = pool.shutdown(10ms);
  releaser.join();
  expect(abandoned == 2, "queued tasks abandoned after grace");
  expect(ran.load() == 0, "abandoned tasks never ran");
  expect(stats.tasks_abandoned.load() == 2, "abandon counted");
  auto e = pool.submit([] {});
  expect(e && e->code == oikos::ErrorCode::shutting_down, "no work after shutdown");
  expect(pool.shutdown(10ms) == 0, "shutdown is idempotent");
}

void test_retry_policy() {
  oikos::RetryPolicy p;
  p.max_attempts = 4;
  p.base_delay = 1ms;
  p.max_delay = 3ms;
  expect(p.delay_after(1) == 1ms && p.delay_after(2) == 2ms && p.delay_after(3) == 3ms, "capped backoff");

  oikos::EngineStats stats;
  oikos::WorkerPool pool("retry", 1, 4, oikos::BackpressurePolicy::block, &stats);
  int calls = 0;
  uint32_t attempts = 0;
  auto e = pool.run_with_retry(p, [&]() -> std::optional<oikos::Error> {
    if (++calls < 3) return oikos::make_error(oikos::ErrorCode::transient_error, "busy");
    return std::nullopt;
  }, &attempts);
  expect(!e && attempts == 3, "succeeds on third attempt");
  expect(stats.persist_retries.load() == 2, "two retries counted");

  calls = 0;
  e = pool.run_with_retry(p, [&]() -> std::optional<oikos::Error> {
    ++calls;
    return oikos::make_error(oikos::ErrorCode::config_error, "bad");
  }, &attempts);
  expect(e && calls == 1 && attempts == 1, "non-transient errors are not retried");

  e = pool.run_with_retry(p, [&]() -> std::optional<oikos::Error> {
    return oikos::make_error(oikos::ErrorCode::transient_error, "down");
  }, &attempts);
  expect(e && e->code == oikos::ErrorCode::transient_error && attempts == 4, "attempts bounded");

  pool.shutdown(0ms);
  calls = 0;
  e = pool.run_with_retry(p, [&]() -> std::optional<oikos::Error> {
    ++calls;
    return oikos::make_error(oikos::ErrorCode::transient_error, "down");
  }, &attempts);
  expect(e && calls == 1, "no retries once shutdown began");
}

// ============================================================================
// Phase 7: Durable stores
// ============================================================================

oikos::BillingSnapshot sample_snapshot(int64_t ts, double cost) {
  oikos::BillingSnapshot s;
  s.timestamp_ms = ts;
  s.home_id = "home_001";
  s.cost_today = cost;
  s.energy_today_kwh = 5.0;
  s.projected_month = 4.65;
  s.co2_today_kg = 2.1;
  s.current_rate = 0.45;
  s.tariff_id = 1;
  s.tariff_name = "pge_e6_2025";
  return s;
}

void test_data_dir_layout() {
  const auto dir = temp_dir("layout");
  expect(!oikos::prepare_data_dir(dir.string()), "fresh layout created");
  expect(fs::exists(dir / "layout.json") && fs::is_directory(dir / "snapshots"), "skeleton exists");
  expect(!oikos::prepare_data_dir(dir.string()), "existing layout accepted");

  std::ofstream(dir / "layout.json", std::ios::trunc) << "{\"data_layout\":99}\n";
  auto e = oikos::prepare_data_dir(dir.string());
  expect(e && e->code == oikos::ErrorCode::dependency_error, "newer layout refused");

  const auto compat = oikos::version::check_compatibility(oikos::version::DATA_LAYOUT_VERSION + 1);
  expect(!compat.ok && compat.error_code == "data_layout_too_new", "compatibility verdict");
  fs::remove_all(dir);
}

void test_snapshot_store_dedup() {
  const auto dir = temp_dir("snap_dedup");
  expect(!oikos::prepare_data_dir(dir.string()), "layout");
  oikos::FileSnapshotStore store(dir.string());
  const int64_t t = at("2025-07-16T00:30:00Z");

  bool dup = true;
  expect(!store.append(sample_snapshot(t, 2.25), &dup) && !dup, "first append writes");
  expect(!store.append(sample_snapshot(t, 2.25), &dup) && dup, "same tick is a no-op");
  expect(!store.append(sample_snapshot(t + 300000, 2.5), &dup) && !dup, "next tick writes");

  // A fresh instance reloads keys from disk.
  oikos::FileSnapshotStore reopened(dir.string());
  expect(!reopened.append(sample_snapshot(t, 2.25), &dup) && dup, "dedup survives restart");

  std::optional<oikos::Error> error;
  auto rows = reopened.range("home_001", t, t + 300000, &error);
  expect(!error && rows.size() == 2, "two distinct rows");
  expect(rows[0].timestamp_ms == t && rows[1].timestamp_ms == t + 300000, "oldest first");
  expect(near(rows[0].cost_today, 2.25) && rows[0].tariff_name == "pge_e6_2025", "fields survive");
  expect(reopened.range("home_001", t + 1, t + 299999, &error).empty(), "inclusive bounds");
  expect(reopened.range("home_002", 0, t * 2, &error).empty(), "unknown home is empty");
  fs::remove_all(dir);
}

void test_snapshot_store_truncated_and_newer_rows() {
  const auto dir = temp_dir("snap_trunc");
  expect(!oikos::prepare_data_dir(dir.string()), "layout");
  const int64_t t = at("2025-07-16T00:30:00Z");
  {
    oikos::FileSnapshotStore store(dir.string());
    expect(!store.append(sample_snapshot(t, 1.0)), "row 1");
  }
  const fs::path file = dir / "snapshots" / "home_001.ndjson";
  std::ofstream(file, std::ios::app) << "{\"v\":1,\"key\":\"abc\",\"timestamp\":";  // crash mid-write

  oikos::FileSnapshotStore store(dir.string());
  std::optional<oikos::Error> error;
  auto rows = store.range("home_001", 0, t * 2, &error);
  expect(!error && rows.size() == 1, "truncated row skipped");
  expect(store.corrupt_rows() == 1, "corrupt row counted");

  expect(!store.append(sample_snapshot(t + 300000, 2.0)), "append after a torn line");
  rows = store.range("home_001", 0, t * 2, &error);
  expect(!error && rows.size() == 2, "new row starts on its own line");

  std::ofstream(file, std::ios::app)
      << oikos::snapshot_row_to_json(sample_snapshot(t + 600000, 3.0), "k").replace(0, 6, "{\"v\":2") << "\n";
  rows = store.range("home_001", 0, t * 2, &error);
  expect(error && error->code == oikos::ErrorCode::dependency_error, "newer row version refused");
  fs::remove_all(dir);
}

void test_reading_store_month_to_date() {
  const auto dir = temp_dir("readings");
  expect(!oikos::prepare_data_dir(dir.string()), "layout");
  oikos::FileReadingStore store(dir.string());

  auto r = [](const std::string& ts, double wh) {
    oikos::Reading x;
    x.timestamp_ms = at(ts);
    x.home_id = "home_001";
    x.device_category = "hvac";
    x.energy_wh = wh;
    return x;
  };
  // Warm the index for day 1 before appending, so appends update it in place.
  std::optional<oikos::Error> error;
  expect(near(store.energy_kwh_between("home_001", at("2025-07-01T00:00:00Z"), at("2025-07-02T00:00:00Z"),
                                       &error), 0.0),
         "empty partition");
  expect(!store.append(r("2025-07-01T00:07:00Z", 1000.0)), "row 1");
  expect(!store.append(r("2025-07-01T12:00:00Z", 2000.0)), "row 2");
  expect(!store.append(r("2025-07-02T23:59:00Z", 500.0)), "row 3");

  auto check = [&](oikos::FileReadingStore& s, const std::string& label) {
    std::optional<oikos::Error> e;
    expect(near(s.energy_kwh_between("home_001", at("2025-07-01T00:00:00Z"), at("2025-07-03T00:00:00Z"), &e), 3.5),
           label + ": whole range");
    expect(near(s.energy_kwh_between("home_001", at("2025-07-01T00:10:00Z"), at("2025-07-03T00:00:00Z"), &e), 2.5),
           label + ": unaligned start");
    expect(near(s.energy_kwh_between("home_001", at("2025-07-01T00:00:00Z"), at("2025-07-01T00:07:00Z"), &e), 0.0),
           label + ": end exclusive");
    expect(near(s.energy_kwh_between("home_001", at("2025-07-01T00:07:00Z"), at("2025-07-01T00:07:00.001Z"), &e),
                1.0),
           label + ": start inclusive");
    expect(near(s.energy_kwh_between("home_002", at("2025-07-01T00:00:00Z"), at("2025-08-01T00:00:00Z"), &e), 0.0), label + ": other home");
    expect(!e, label + ": no error");
  };
  check(store, "warm");
  oikos::FileReadingStore cold(dir.string());
  check(cold, "cold");

  const std::size_t compacted = cold.compact(at("2025-07-20T00:00:00Z"), 7, &error);
  expect(!error, "compaction does not fail");
  if (oikos::FileReadingStore::compression_available()) {
    expect(compacted == 2, "both closed partitions compacted");
    oikos::FileReadingStore after(dir.string());
    check(after, "compacted");
  } else {
    expect(compacted == 0, "compaction unavailable without zstd");
  }
  fs::remove_all(dir);
}

void test_compaction_crash_counts_rows_once() {
  const auto dir = temp_dir("compact_crash");
  expect(!oikos::prepare_data_dir(dir.string()), "layout");
  auto row = [](const std::string& ts, double wh) {
    oikos::Reading x;
    x.timestamp_ms = at(ts);
    x.home_id = "home_001";
    x.device_category = "ev_charger";
    x.energy_wh = wh;
    return x;
  };
  auto month = [](oikos::FileReadingStore& s) {
    std::optional<oikos::Error> e;
    const double kwh = s.energy_kwh_between("home_001", at("2025-07-01T00:00:00Z"), at("2025-08-01T00:00:00Z"), &e);
    expect(!e, "month query succeeds");
    return kwh;
  };
  {
    oikos::FileReadingStore store(dir.string());
    expect(!store.append(row("2025-07-01T12:00:00Z", 395000.0)), "history row");
  }
  const fs::path plain = dir / "readings" / "home_001" / "2025-07-01.ndjson";
  const fs::path packed = dir / "readings" / "home_001" / "2025-07-01.ndjson.zst";
  std::ostringstream original;
  original << std::ifstream(plain, std::ios::binary).rdbuf();

  const int64_t now = at("2025-07-20T00:00:00Z");
  std::optional<oikos::Error> error;
  if (!oikos::FileReadingStore::compression_available()) {
    oikos::FileReadingStore store(dir.string());
    expect(store.compact(now, 7, &error) == 0 && !error, "compaction unavailable without zstd");
    fs::remove_all(dir);
    return;
  }
  {
    oikos::FileReadingStore store(dir.string());
    expect(store.compact(now, 7, &error) == 1 && !error, "partition compacted");
    expect(fs::exists(packed) && !fs::exists(plain), "plain partition replaced");
  }

  // Crash after the compressed partition landed but before the plain one was removed.
  std::ofstream(plain, std::ios::binary | std::ios::trunc) << original.str();
  {
    oikos::FileReadingStore store(dir.string());
    expect(near(month(store), 395.0), "both files present: rows counted once");
  }
  {
    oikos::FileReadingStore store(dir.string());
    expect(store.compact(now, 7, &error) == 1 && !error, "leftover plain partition re-merged");
    expect(!fs::exists(plain), "leftover removed");
  }
  {
    oikos::FileReadingStore store(dir.string());
    expect(near(month(store), 395.0), "re-merge does not duplicate rows");
  }

  // Rows appended to a leftover plain file after the crash still count.
  std::ofstream(plain, std::ios::binary | std::ios::trunc) << original.str();
  oikos::FileReadingStore store(dir.string());
  expect(!store.append(row("2025-07-01T13:00:00Z", 5000.0)), "late row after crash");
  expect(near(month(store), 400.0), "only the unmerged tail is added");
  expect(store.compact(now, 7, &error) == 1 && !error, "tail merged");
  oikos::FileReadingStore after(dir.string());
  expect(near(month(after), 400.0), "merged partition holds each row once");
  expect(after.corrupt_rows() == 0, "provenance line is not read as a row");
  fs::remove_all(dir);
}

void test_store_homes_do_not_share_locks() {
  const auto dir = temp_dir("home_shards");
  expect(!oikos::prepare_data_dir(dir.string()), "layout");
  oikos::FileReadingStore readings(dir.string());
  oikos::FileSnapshotStore snapshots(dir.string());

  // home_002's partition and history are FIFOs: reading either parks the
  // caller inside that home's lock until a writer opens the other end.
  fs::create_directories(dir / "readings" / "home_002");
  const fs::path partition = dir / "readings" / "home_002" / "2025-07-01.ndjson";
  const fs::path history = dir / "snapshots" / "home_002.ndjson";
  expect(::mkfifo(partition.c_str(), 0600) == 0 && ::mkfifo(history.c_str(), 0600) == 0, "fifos created");

  const int64_t day = at("2025-07-01T00:00:00Z");
  std::atomic<bool> parked_read_done{false}, parked_range_done{false};
  double parked_kwh = -1.0;
  std::size_t parked_rows = 0;
  std::thread parked_read([&] {
    std::optional<oikos::Error> e;
    parked_kwh = readings.energy_kwh_between("home_002", day, day + oikos::timeutil::kMsPerDay, &e);
    parked_read_done = true;
  });
  std::thread parked_range([&] {
    std::optional<oikos::Error> e;
    parked_rows = snapshots.range("home_002", 0, day * 2, &e).size();
    parked_range_done = true;
  });
  std::this_thread::sleep_for(50ms);

  TestClock clock;
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  clock.set(now);
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats);
  auto tariffs = e6_registry();
  oikos::BillingCalculator calc(homes, tariffs, readings);
  expect(!homes.find("home_001")->accumulator().add_reading(
             reading("2025-07-15T17:10:00-07:00", "ev_charger", 0, 10000.0)),
         "today reading");

  std::atomic<bool> other_done{false};
  bool other_ok = false;
  std::thread other([&] {
    std::optional<oikos::Error> e;
    bool ok = !readings.append(reading("2025-07-03T12:00:00-07:00", "ev_charger", 0, 395000.0));
    auto s = calc.compute("home_001", now, &e);
    ok = ok && s && near(s->current_rate, 0.55);
    bool dup = true;
    ok = ok && s && !snapshots.append(*s, &dup) && !dup;
    ok = ok && snapshots.range("home_001", 0, now, &e).size() == 1 && !e;
    other_ok = ok;
    other_done = true;
  });
  expect(eventually([&] { return other_done.load(); }), "home_001 finishes while home_002 waits on I/O");
  other.join();
  expect(other_ok, "home_001 computed and persisted its snapshot");
  expect(!parked_read_done.load() && !parked_range_done.load(), "home_002 still waiting on its files");

  auto late = reading("2025-07-01T10:00:00Z", "hvac", 0, 1500.0);
  late.home_id = "home_002";
  std::ofstream(partition) << oikos::reading_row_to_json(late) << "\n";
  auto snap = sample_snapshot(day, 1.0);
  snap.home_id = "home_002";
  std::ofstream(history) << oikos::snapshot_row_to_json(snap, "k") << "\n";
  parked_read.join();
  parked_range.join();
  expect(near(parked_kwh, 1.5) && parked_rows == 1, "parked home reads what was written");
  fs::remove_all(dir);
}

void test_snapshot_keys_bounded_window() {
  const auto dir = temp_dir("snap_window");
  expect(!oikos::prepare_data_dir(dir.string()), "layout");
  oikos::FileSnapshotStore store(dir.string());
  const int64_t t0 = at("2025-07-14T00:00:00Z");
  const int64_t tick = 5 * oikos::timeutil::kMsPerMinute;
  const int ticks = 360;  // 30 hours of 5-minute ticks
  for (int i = 0; i < ticks; ++i) {
    expect(!store.append(sample_snapshot(t0 + i * tick, 1.0)), "tick appended");
  }
  const auto window = static_cast<std::size_t>(oikos::FileSnapshotStore::kKeyWindowMs / tick + 1);
  expect(store.cached_key_count("home_001") == window, "only the last 24h of keys cached");

  bool dup = false;
  expect(!store.append(sample_snapshot(t0 + (ticks - 1) * tick, 1.0), &dup) && dup, "recent duplicate rejected");
  dup = false;
  expect(!store.append(sample_snapshot(t0, 1.0), &dup) && dup, "duplicate older than the window rejected");
  expect(!store.append(sample_snapshot(t0 + tick / 2, 1.0), &dup) && !dup, "unseen old tick written");
  expect(store.cached_key_count("home_001") == window, "old ticks do not grow the cache");

  oikos::FileSnapshotStore reopened(dir.string());
  expect(!reopened.append(sample_snapshot(t0 + 300 * tick, 1.0), &dup) && dup, "reload rebuilds the window");
  expect(reopened.cached_key_count("home_001") == window, "reload keeps the cache bounded");
  std::optional<oikos::Error> error;
  expect(reopened.range("home_001", 0, t0 * 2, &error).size() == static_cast<std::size_t>(ticks + 1) && !error, "every row kept on disk");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 8: Configuration
// ============================================================================

void test_engine_config_env() {
  std::map<std::string, std::string> env;
  auto lookup = [&env](const char* name) -> const char* {
    auto it = env.find(name);
    return it == env.end() ? nullptr : it->second.c_str();
  };

  oikos::EngineConfig cfg;
  auto result = oikos::load_engine_config(&cfg, lookup);
  expect(result.ok && result.warnings.empty(), "defaults are valid");
  expect(cfg.tick_interval_s == 300 && cfg.http_port == 8080 && cfg.data_dir == ".oikos", "defaults");
  expect(cfg.persist_policy == oikos::BackpressurePolicy::block, "default policy");

  env = {{"OIKOS_TICK_INTERVAL_S", "60"}, {"OIKOS_PERSIST_POLICY", "reject"}, {"OIKOS_HTTP_PORT", "0"},
         {"OIKOS_RETRY_MAX_ATTEMPTS", "3"}};
  result = oikos::load_engine_config(&cfg, lookup);
  expect(result.ok, "overrides valid");
  expect(cfg.tick_interval_s == 60 && cfg.http_port == 0 && cfg.retry.max_attempts == 3, "overrides applied");
  expect(cfg.persist_policy == oikos::BackpressurePolicy::reject && result.warnings.size() == 1,
         "lossy policy warns");

  oikos::EngineConfig untouched;
  env = {{"OIKOS_TICK_INTERVAL_S", "5m"}, {"OIKOS_HTTP_PORT", "70000"}, {"OIKOS_PERSIST_POLICY", "yolo"}};
  result = oikos::load_engine_config(&untouched, lookup);
  expect(!result.ok && result.errors.size() == 3, "three errors reported");
  expect(untouched.tick_interval_s == 300, "output untouched on failure");
  expect(oikos::config_to_json(cfg).find("\"tick_interval_s\":60") != std::string::npos, "config JSON");
}

void test_homes_file() {
  std::optional<oikos::Error> error;
  auto f = oikos::parse_homes_file(
      R"({"homes":[{"id":"home_001","name":"A","tariff":"pge_e6_2025","utc_offset_minutes":-420}]})", &error);
  expect(!error && f.homes.size() == 1, "homes parsed");
  expect(f.categories.size() == 7 && f.categories.contains("ev_charger"), "default categories");
  expect(f.homes[0].utc_offset_minutes == -420, "offset parsed");

  error.reset();
  oikos::parse_homes_file(R"({"homes":[{"id":"h","tariff":"t","utc_offset_minutes":-421}]})", &error);
  expect(error && error->code == oikos::ErrorCode::config_error, "offset must be a multiple of 15");
  error.reset();
  oikos::parse_homes_file(R"({"homes":[{"id":"bad id","tariff":"t"}]})", &error);
  expect(error && error->code == oikos::ErrorCode::config_error, "id charset enforced");
  error.reset();
  oikos::parse_homes_file(R"({"homes":[]})", &error);
  expect(error && error->code == oikos::ErrorCode::config_error, "at least one home");

  TestClock clock;
  error.reset();
  oikos::HomeRegistry::build({oikos::HomeConfig{"a", "A", "t", 0}, oikos::HomeConfig{"a", "B", "t", 0}},
                             oikos::default_device_categories(), 0, clock.fn(), nullptr, &error);
  expect(error && error->code == oikos::ErrorCode::config_error, "duplicate home ids rejected");
}

// ============================================================================
// Phase 9: Publisher, status API, observability
// ============================================================================

struct Engine {
  TestClock clock;
  oikos::EngineStats stats;
  oikos::HomeRegistry homes;
  oikos::TariffRegistry tariffs;
  MemoryReadingStore readings;
  MemorySnapshotStore snapshots;
  oikos::LoopbackTransport transport;
  oikos::WorkerPool compute{"compute", 2, 8, oikos::BackpressurePolicy::reject, &stats};
  oikos::WorkerPool persist{"persist", 1, 16, oikos::BackpressurePolicy::block, &stats};
  std::unique_ptr<oikos::BillingCalculator> calc;
  std::unique_ptr<oikos::SnapshotPublisher> publisher;

  explicit Engine(int64_t now) {
    clock.set(now);
    homes = one_home(clock, &stats);
    tariffs = e6_registry();
    calc = std::make_unique<oikos::BillingCalculator>(homes, tariffs, readings);
    oikos::PublisherOptions options;
    options.retry.max_attempts = 3;
    options.retry.base_delay = 1ms;
    options.retry.max_delay = 2ms;
    publisher = std::make_unique<oikos::SnapshotPublisher>(homes, *calc, transport, snapshots, compute, persist,
                                                           &stats, options, clock.fn());
  }
  ~Engine() {
    publisher->stop();
    compute.shutdown(1000ms);
    persist.shutdown(1000ms);
  }
  oikos::HomeContext& home() { return *homes.find("home_001"); }
};

void test_publisher_publishes_and_persists() {
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  Engine engine(now);
  expect(!engine.home().accumulator().add_reading(reading("2025-07-15T17:10:00-07:00", "hvac", 0, 5000.0)),
         "reading");

  expect(engine.publisher->process_home(engine.home(), now), "tick runs");
  expect(engine.persist.wait_idle(2000ms), "persist drained");

  const auto published = engine.transport.published();
  expect(published.size() == 1, "one publication");
  expect(published[0].topic == "home/home_001/billing/today_cost", "billing topic");
  expect(published[0].payload.find("\"cost_today\":2.25") != std::string::npos, "cost in payload");
  expect(published[0].payload.find("\"timestamp\":\"2025-07-16T00:30:00Z\"") != std::string::npos, "timestamp");
  expect(published[0].payload.find("current_rate") != std::string::npos, "rate in payload");
  expect(engine.snapshots.size() == 1, "snapshot persisted");
  expect(engine.stats.ticks_ok.load() == 1 && engine.stats.persist_ok.load() == 1, "counters");

  // Re-producing the same tick does not duplicate history.
  expect(engine.publisher->process_home(engine.home(), now), "same tick again");
  expect(engine.persist.wait_idle(2000ms), "persist drained");
  expect(engine.snapshots.size() == 1, "idempotent tick");
}

void test_publisher_skips_in_flight_home() {
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  Engine engine(now);
  expect(engine.home().try_begin_compute(), "simulate a running computation");
  expect(!engine.publisher->process_home(engine.home(), now), "second computation skipped");
  expect(engine.publisher->tick_once(now) == 0, "tick dispatches nothing for a busy home");
  expect(engine.stats.ticks_skipped.load() == 2, "skips counted");
  engine.home().end_compute();

  expect(engine.publisher->tick_once(now + 1000) == 1, "dispatched once idle");
  expect(eventually([&] { return engine.stats.ticks_ok.load() == 1; }), "compute pool ran the tick");
  expect(eventually([&] { return !engine.home().compute_in_flight(); }), "guard released");
  auto latest = engine.home().latest();
  expect(latest && latest->timestamp_ms == engine.publisher->align_tick(now + 1000), "aligned tick instant");
  expect(engine.publisher->align_tick(at("2025-07-16T00:34:59Z")) == at("2025-07-16T00:30:00Z"), "5 min floor");
}

void test_publish_and_persist_failures_isolated() {
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  Engine engine(now);

  engine.transport.fail_next_publishes(1);
  expect(engine.publisher->process_home(engine.home(), now), "tick with failing publish");
  expect(engine.persist.wait_idle(2000ms), "persist drained");
  expect(engine.stats.publish_failures.load() == 1, "publish failure counted");
  expect(engine.snapshots.size() == 1, "still persisted");

  engine.snapshots.always_fail = true;
  engine.snapshots.attempts = 0;
  expect(engine.publisher->process_home(engine.home(), now + 300000), "tick with failing store");
  expect(engine.persist.wait_idle(2000ms), "persist drained");
  expect(engine.stats.persist_exhausted.load() == 1, "exhaustion counted");
  expect(engine.snapshots.attempts == 3, "bounded attempts");
  expect(engine.transport.published().size() == 1, "publish still succeeded");
  expect(engine.stats.ticks_ok.load() == 2, "neither failure fails the tick");
}

void test_publisher_counts_compute_failures() {
  TestClock clock;
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  clock.set(now);
  oikos::EngineStats stats;
  auto homes = one_home(clock, &stats, "missing_tariff");
  auto tariffs = e6_registry();
  MemoryReadingStore readings;
  MemorySnapshotStore snapshots;
  oikos::LoopbackTransport transport;
  oikos::BillingCalculator calc(homes, tariffs, readings);
  oikos::WorkerPool compute("compute", 1, 4, oikos::BackpressurePolicy::reject, &stats);
  oikos::WorkerPool persist("persist", 1, 4, oikos::BackpressurePolicy::block, &stats);
  oikos::SnapshotPublisher publisher(homes, calc, transport, snapshots, compute, persist, &stats, {}, clock.fn());

  expect(publisher.process_home(*homes.find("home_001"), now), "tick ran");
  expect(stats.ticks_failed.load() == 1 && stats.lookup_failures.load() == 1, "failure categorized");
  expect(transport.published().empty() && snapshots.size() == 0, "nothing emitted");
}

void test_publisher_timer_thread() {
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  Engine engine(now);
  engine.publisher->start();
  expect(eventually([&] { return engine.stats.ticks_ok.load() >= 1; }), "startup tick runs");
  engine.publisher->stop();
  engine.publisher->stop();
}

void test_status_api_routes() {
  const int64_t now = at("2025-07-15T17:30:00-07:00");
  Engine engine(now);
  oikos::StatusApi api(engine.homes, engine.snapshots, &engine.stats);

  auto r = api.handle("GET", "/health");
  expect(r.status == 200 && r.body == "{\"status\":\"healthy\"}", "health");
  r = api.handle("GET", "/billing/current");
  expect(r.status == 404, "no snapshot yet");
  r = api.handle("POST", "/health");
  expect(r.status == 405, "only GET");
  r = api.handle("GET", "/nope");
  expect(r.status == 404, "unknown route");

  expect(!engine.home().accumulator().add_reading(reading("2025-07-15T17:10:00-07:00", "hvac", 0, 5000.0)),
         "reading");
  expect(engine.publisher->process_home(engine.home(), now), "tick");
  expect(engine.persist.wait_idle(2000ms), "persisted");

  r = api.handle("GET", "/billing/current?home_id=home_001");
  expect(r.status == 200, "current after a tick");
  expect(r.body.find("\"tariff\":\"pge_e6_2025\"") != std::string::npos, "tariff name");
  expect(r.body.find("\"cost_today\":2.25") != std::string::npos, "cost");
  expect(api.handle("GET", "/billing/current").status == 200, "default home");
  expect(api.handle("GET", "/billing/current?home_id=home_404").status == 404, "unknown home");

  r = api.handle("GET", "/billing/history?home_id=home_001&from=2025-07-15T00%3A00%3A00Z&to=2025-07-17T00:00:00Z");
  expect(r.status == 200 && r.body.front() == '[' && r.body.find("2025-07-16T00:30:00Z") != std::string::npos,
         "history array");
  expect(api.handle("GET", "/billing/history?home_id=home_001").status == 400, "from/to required");
  expect(api.handle("GET", "/billing/history?from=yesterday&to=2025-07-17T00:00:00Z").status == 400, "bad from");
  expect(api.handle("GET", "/billing/history?from=2025-07-17T00:00:00Z&to=2025-07-15T00:00:00Z").status == 400,
         "reversed range");
  expect(api.handle("GET", "/billing/history?from=%ZZ").status == 400, "bad escape");

  r = api.handle("GET", "/engine/stats");
  expect(r.status == 200 && r.body.find("\"ticks\":{\"ok\":1") != std::string::npos, "stats JSON");
}

void test_query_and_http_framing() {
  auto q = oikos::parse_query("a=1&b=x%20y&c=p+q&flag");
  expect(q && q->at("a") == "1" && q->at("b") == "x y" && q->at("c") == "p q", "decoded values");
  expect(q->contains("flag") && q->at("flag").empty(), "bare key");
  expect(!oikos::url_decode("%4"), "short escape rejected");

  auto line = oikos::parse_request_line("GET /billing/current?home_id=h HTTP/1.1");
  expect(line && line->first == "GET" && line->second == "/billing/current?home_id=h", "request line");
  expect(!oikos::parse_request_line("GARBAGE"), "malformed request line");

  oikos::HttpResponse resp;
  resp.status = 404;
  resp.body = "{}";
  const std::string wire = oikos::format_http_response(resp);
  expect(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0, "status line");
  expect(wire.find("Content-Length: 2\r\n") != std::string::npos, "content length");
  expect(wire.substr(wire.size() - 6) == "\r\n\r\n{}", "body after headers");
}

void test_engine_stats_and_events() {
  oikos::EngineStats stats;
  stats.record_failure(oikos::ErrorCode::lookup_error);
  stats.record_failure(oikos::ErrorCode::config_error);
  stats.record_failure(oikos::ErrorCode::dependency_error);
  stats.sample_queue_depth(4);
  stats.sample_queue_depth(2);
  stats.compute_latency.record(1500000);
  const std::string json = stats.to_json();
  expect(json.find("\"lookup_error\":1") != std::string::npos, "lookup failures");
  expect(json.find("\"config_error\":1") != std::string::npos, "config failures");
  expect(json.find("\"max_queue_depth\":4") != std::string::npos, "queue depth max");
  expect(json.find("\"avg_queue_depth\":3.00") != std::string::npos, "queue depth average");

  oikos::EngineEvent ev;
  ev.ts_ms = at("2025-07-16T00:30:00Z");
  ev.level = oikos::LogLevel::warn;
  ev.component = "ingest";
  ev.event = "reading_rejected";
  ev.home_id = "home_001";
  ev.detail = "bad \"quote\"";
  ev.error_code = oikos::ErrorCode::validation_error;
  const std::string line = oikos::event_to_json(ev);
  expect(line.find("\"event\":\"reading_rejected\"") != std::string::npos, "event name");
  expect(line.find("\\\"quote\\\"") != std::string::npos, "detail escaped");
  expect(line.find('\n') == std::string::npos, "single line");
  expect(oikos::parse_log_level("warn") == oikos::LogLevel::warn && !oikos::parse_log_level("loud"),
         "log level parsing");
}

void test_event_log_file_sink() {
  const auto dir = temp_dir("event_log");
  const fs::path first = dir / "events.jsonl";
  const fs::path second = dir / "events2.jsonl";
  auto lines = [](const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> out;
    for (std::string line; std::getline(in, line);) out.push_back(line);
    return out;
  };

  oikos::set_log_level(oikos::LogLevel::info);
  ::setenv("OIKOS_EVENT_LOG", first.c_str(), 1);
  oikos::log_event(oikos::LogLevel::warn, "ingest", "reading_rejected", "home_001", "one",
                   oikos::ErrorCode::validation_error);
  oikos::log_event(oikos::LogLevel::warn, "ingest", "reading_rejected", "home_001", "two",
                   oikos::ErrorCode::validation_error);
  auto got = lines(first);
  expect(got.size() == 2, "both events flushed to the log file");
  expect(got[0].find("\"detail\":\"one\"") != std::string::npos &&
             got[1].find("\"detail\":\"two\"") != std::string::npos,
         "events in emission order");

  // Pointing the variable elsewhere switches files without a restart.
  ::setenv("OIKOS_EVENT_LOG", second.c_str(), 1);
  oikos::log_event(oikos::LogLevel::info, "store", "partition_compacted", "home_001", "2025-07-01.ndjson");
  expect(lines(second).size() == 1 && lines(first).size() == 2, "new path receives later events");

  ::unsetenv("OIKOS_EVENT_LOG");
  oikos::set_log_level(oikos::LogLevel::error);
  fs::remove_all(dir);
}

}  // namespace

int main() {
  std::cout << "=== Oikos Billing Engine Test Suite ===\n";
  oikos::set_log_level(oikos::LogLevel::error);

  std::cout << "\n[Phase 1] Time, JSON, hashing\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("snapshot idempotency key", test_idempotency_key);
  run_test("RFC3339 parse/format", test_rfc3339_parse_and_format);
  run_test("local calendar", test_local_calendar);
  run_test("JSON strictness", test_json_strictness);

  std::cout << "\n[Phase 2] Tariffs\n";
  run_test("tariff file loads", test_tariff_file_loads);
  run_test("TOU partition gaps/overlaps rejected", test_tou_partition_rejects_gaps_and_overlaps);
  run_test("malformed tariff rows rejected", test_tariff_rejects_malformed_rows);
  run_test("rate resolution", test_resolve_rate);
  run_test("tier proration 395 + 10 kWh", test_tier_proration);
  run_test("registry effective dating", test_registry_effective_dating);

  std::cout << "\n[Phase 3] Energy accumulator\n";
  run_test("breakdown sum, order independent", test_breakdown_sum_order_independent);
  run_test("power integration", test_power_integration);
  run_test("reading validation", test_reading_validation);
  run_test("24h eviction", test_eviction_excludes_old_readings);
  run_test("late arrivals age out in order", test_late_arrivals_age_out_in_order);

  std::cout << "\n[Phase 4] Billing calculator\n";
  run_test("5 kWh at summer peak costs 2.25", test_billing_example);
  run_test("compute idempotent", test_compute_idempotent);
  run_test("month-to-date tier crossing", test_month_to_date_tier_crossing);
  run_test("compute failure produces no snapshot", test_compute_failure_produces_no_snapshot);
  run_test("day rollover", test_day_rollover);

  std::cout << "\n[Phase 5] Transport and ingest\n";
  run_test("topic matching", test_topic_matching);
  run_test("ingest gateway", test_ingest_gateway);
  run_test("stream transport", test_stream_transport);

  std::cout << "\n[Phase 6] Worker pool\n";
  run_test("reject policy", test_pool_reject_policy);
  run_test("drop_oldest policy", test_pool_drop_oldest_policy);
  run_test("block policy", test_pool_block_policy);
  run_test("shutdown abandons queue", test_pool_shutdown_abandons_queue);
  run_test("retry policy", test_retry_policy);

  std::cout << "\n[Phase 7] Durable stores\n";
  run_test("data dir layout", test_data_dir_layout);
  run_test("snapshot store dedup", test_snapshot_store_dedup);
  run_test("snapshot store torn/newer rows", test_snapshot_store_truncated_and_newer_rows);
  run_test("reading store month-to-date", test_reading_store_month_to_date);
  run_test("compaction crash counts rows once", test_compaction_crash_counts_rows_once);
  run_test("homes do not share store locks", test_store_homes_do_not_share_locks);
  run_test("snapshot keys bounded to a window", test_snapshot_keys_bounded_window);

  std::cout << "\n[Phase 8] Configuration\n";
  run_test("engine config from environment", test_engine_config_env);
  run_test("homes file", test_homes_file);

  std::cout << "\n[Phase 9] Publisher, status API, observability\n";
  run_test("publisher publishes and persists", test_publisher_publishes_and_persists);
  run_test("publisher skips in-flight home", test_publisher_skips_in_flight_home);
  run_test("publish/persist failure isolation", test_publish_and_persist_failures_isolated);
  run_test("publisher counts compute failures", test_publisher_counts_compute_failures);
  run_test("publisher timer thread", test_publisher_timer_thread);
  run_test("status API routes", test_status_api_routes);
  run_test("query decoding and HTTP framing", test_query_and_http_framing);
  run_test("engine stats and events", test_engine_stats_and_events);
  run_test("event log file sink", test_event_log_file_sink);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
