#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "oikos/billing.hpp"
#include "oikos/config.hpp"
#include "oikos/hash.hpp"
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

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void on_signal(int) { g_stop_requested = 1; }

void install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART: a blocked stdin read returns EINTR
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

std::optional<std::string> read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

std::string arg_value(int argc, char **argv, const std::string &flag,
                      const std::string &def = "") {
  for (int i = 2; i + 1 < argc; ++i)
    if (std::string(argv[i]) == flag)
      return argv[i + 1];
  return def;
}

std::optional<long long> parse_int(const std::string &s) {
  if (s.empty())
    return std::nullopt;
  errno = 0;
  char *end = nullptr;
  const long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0')
    return std::nullopt;
  return v;
}

std::optional<double> parse_number(const std::string &s) {
  if (s.empty())
    return std::nullopt;
  errno = 0;
  char *end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (errno != 0 || end == s.c_str() || *end != '\0')
    return std::nullopt;
  return v;
}

int print_error(const oikos::Error &e, int exit_code = 2) {
  std::cout << "{\"ok\":false,\"error\":\"" << oikos::to_string(e.code)
            << "\",\"message\":\"" << oikos::jsonlite::escape(e.message)
            << "\"}\n";
  return exit_code;
}

int usage_error(const std::string &message) {
  std::cerr << "{\"error\":\"usage\",\"message\":\""
            << oikos::jsonlite::escape(message) << "\"}\n";
  return 1;
}

// Loads the engine config, logging warnings. Prints errors and returns false
// when the environment is invalid.
bool load_config(oikos::EngineConfig *cfg) {
  const auto result = oikos::load_engine_config(cfg);
  for (const auto &w : result.warnings)
    oikos::log_event(oikos::LogLevel::warn, "config", "config_warning", {}, w);
  if (!result.ok) {
    std::cout << "{\"ok\":false,\"error\":\"config_error\",\"errors\":[";
    for (size_t i = 0; i < result.errors.size(); ++i) {
      if (i > 0)
        std::cout << ",";
      std::cout << "\"" << oikos::jsonlite::escape(result.errors[i]) << "\"";
    }
    std::cout << "]}\n";
    return false;
  }
  return true;
}

std::optional<oikos::TariffRegistry>
load_tariffs(const std::string &path, std::optional<oikos::Error> *error) {
  auto rows = oikos::load_tariff_file(path, error);
  if (*error)
    return std::nullopt;
  auto registry = oikos::TariffRegistry::build(std::move(rows), error);
  if (*error)
    return std::nullopt;
  return registry;
}

int cmd_validate_tariff(int argc, char **argv) {
  const std::string file = arg_value(argc, argv, "--file");
  if (file.empty())
    return usage_error("validate-tariff --file <tariffs.json>");

  auto raw = read_file(file);
  if (!raw)
    return print_error(oikos::make_error(oikos::ErrorCode::config_error,
                                         "cannot read " + file));
  std::optional<oikos::Error> error;
  auto rows = oikos::parse_tariff_file(*raw, &error);
  if (error)
    return print_error(*error);
  const std::vector<oikos::TariffDefinition> copy = rows;
  oikos::TariffRegistry::build(std::move(rows), &error);
  if (error)
    return print_error(*error);

  std::cout << "{\"ok\":true,\"content_hash\":\""
            << oikos::tariff_content_hash(*raw) << "\",\"tariffs\":[";
  for (size_t i = 0; i < copy.size(); ++i) {
    if (i > 0)
      std::cout << ",";
    std::cout << oikos::tariff_to_json(copy[i]);
  }
  std::cout << "]}\n";
  return 0;
}

int cmd_resolve(int argc, char **argv) {
  const std::string file = arg_value(argc, argv, "--tariff");
  const std::string name = arg_value(argc, argv, "--name");
  const std::string at = arg_value(argc, argv, "--at");
  if (file.empty() || name.empty() || at.empty())
    return usage_error("resolve --tariff <file> --name <name> --at <rfc3339> "
                       "[--offset-minutes M] [--mtd-kwh X]");

  const auto ts = oikos::timeutil::parse_rfc3339(at);
  if (!ts)
    return usage_error("--at must be RFC3339 with a zone: " + at);
  const auto offset = parse_int(arg_value(argc, argv, "--offset-minutes", "0"));
  if (!offset || *offset < -840 || *offset > 840)
    return usage_error("--offset-minutes must be an integer within +/-840");
  const auto mtd = parse_number(arg_value(argc, argv, "--mtd-kwh", "0"));
  if (!mtd || *mtd < 0.0)
    return usage_error("--mtd-kwh must be a non-negative number");

  std::optional<oikos::Error> error;
  auto registry = load_tariffs(file, &error);
  if (!registry)
    return print_error(*error);

  const int offset_minutes = static_cast<int>(*offset);
  const int64_t day = oikos::timeutil::local_day_index(*ts, offset_minutes);
  const auto *tariff = registry->active_for(name, day, &error);
  if (!tariff)
    return print_error(*error);
  const auto r = oikos::resolve(*ts, offset_minutes, *tariff, *mtd, &error);
  if (error)
    return print_error(*error);

  std::cout << "{\"ok\":true,\"tariff_id\":" << tariff->id << ",\"tariff\":\""
            << oikos::jsonlite::escape(tariff->name) << "\",\"local_time\":\""
            << oikos::timeutil::format_rfc3339(*ts, offset_minutes)
            << "\",\"season\":\"" << oikos::to_string(r.season)
            << "\",\"period\":\"" << oikos::to_string(r.period)
            << "\",\"tier\":" << (r.tier_index + 1)
            << ",\"rate\":" << oikos::jsonlite::format_double(r.rate) << "}\n";
  return 0;
}

int cmd_history(int argc, char **argv) {
  const std::string home = arg_value(argc, argv, "--home");
  const std::string from_text = arg_value(argc, argv, "--from");
  const std::string to_text = arg_value(argc, argv, "--to");
  if (home.empty() || from_text.empty() || to_text.empty())
    return usage_error("history --home <id> --from <rfc3339> --to <rfc3339>");
  const auto from = oikos::timeutil::parse_rfc3339(from_text);
  const auto to = oikos::timeutil::parse_rfc3339(to_text);
  if (!from || !to)
    return usage_error("--from and --to must be RFC3339 with a zone");

  oikos::EngineConfig cfg;
  if (!load_config(&cfg))
    return 2;
  if (auto e = oikos::prepare_data_dir(cfg.data_dir))
    return print_error(*e);

  oikos::FileSnapshotStore snapshots(cfg.data_dir);
  std::optional<oikos::Error> error;
  const auto rows = snapshots.range(home, *from, *to, &error);
  if (error)
    return print_error(*error);

  std::cout << "[";
  for (size_t i = 0; i < rows.size(); ++i) {
    if (i > 0)
      std::cout << ",";
    std::cout << oikos::snapshot_to_json(rows[i]);
  }
  std::cout << "]\n";
  return 0;
}

int cmd_compact(int argc, char **argv) {
  oikos::EngineConfig cfg;
  if (!load_config(&cfg))
    return 2;
  int days = cfg.compress_after_days;
  const std::string days_text = arg_value(argc, argv, "--days");
  if (!days_text.empty()) {
    const auto parsed = parse_int(days_text);
    if (!parsed || *parsed < 0 || *parsed > 3650)
      return usage_error("--days must be an integer within [0, 3650]");
    days = static_cast<int>(*parsed);
  }
  if (auto e = oikos::prepare_data_dir(cfg.data_dir))
    return print_error(*e);

  oikos::FileReadingStore readings(cfg.data_dir);
  std::optional<oikos::Error> error;
  const size_t compacted =
      readings.compact(oikos::timeutil::now_ms(), days, &error);
  if (error)
    return print_error(*error);
  std::cout << "{\"ok\":true,\"compression_available\":"
            << (oikos::FileReadingStore::compression_available() ? "true"
                                                                 : "false")
            << ",\"partitions_compacted\":" << compacted << "}\n";
  return 0;
}

int cmd_run() {
  install_signal_handlers();

  oikos::EngineConfig cfg;
  if (!load_config(&cfg))
    return 2;
  if (auto e = oikos::prepare_data_dir(cfg.data_dir))
    return print_error(*e);

  std::optional<oikos::Error> error;
  auto tariffs = load_tariffs(cfg.tariff_file, &error);
  if (!tariffs)
    return print_error(*error);
  auto homes_file = oikos::load_homes_file(cfg.homes_file, &error);
  if (error)
    return print_error(*error);

  oikos::EngineStats stats;
  auto homes = oikos::HomeRegistry::build(
      homes_file.homes, homes_file.categories,
      cfg.future_skew_s * oikos::timeutil::kMsPerSecond,
      oikos::timeutil::system_clock(), &stats, &error);
  if (error)
    return print_error(*error);
  for (const auto *home : homes.homes()) {
    if (!tariffs->has_name(home->config().tariff_name))
      return print_error(oikos::make_error(
          oikos::ErrorCode::config_error,
          "home " + home->id() + " references unknown tariff \"" +
              home->config().tariff_name + "\""));
  }

  oikos::FileReadingStore readings(cfg.data_dir);
  oikos::FileSnapshotStore snapshots(cfg.data_dir);

  // Compute tasks never exceed one per home, so the queue only needs room
  // for every home.
  oikos::WorkerPool compute_pool("compute", cfg.compute_workers,
                                 std::max<size_t>(homes.size(), 1),
                                 oikos::BackpressurePolicy::reject, &stats);
  oikos::WorkerPool persist_pool("persist", cfg.persist_workers,
                                 cfg.persist_queue, cfg.persist_policy, &stats);

  const oikos::RetryPolicy retry = cfg.retry;
  for (auto *home : homes.homes()) {
    home->accumulator().set_persist_hook(
        [&persist_pool, &readings, &stats, retry](const oikos::Reading &r) {
          auto queued = persist_pool.submit([&persist_pool, &readings, &stats,
                                             retry, r] {
            auto err = persist_pool.run_with_retry(
                retry, [&] { return readings.append(r); });
            if (err) {
              stats.persist_exhausted.fetch_add(1, std::memory_order_relaxed);
              oikos::log_event(oikos::LogLevel::error, "ingest",
                               "reading_persist_failed", r.home_id,
                               err->message, err->code);
              return;
            }
            stats.persist_ok.fetch_add(1, std::memory_order_relaxed);
          });
          if (queued)
            oikos::log_event(oikos::LogLevel::warn, "ingest",
                             "reading_persist_not_queued", r.home_id,
                             queued->message, queued->code);
        });
  }

  oikos::StreamTransport transport(std::cin, std::cout);
  oikos::IngestGateway gateway(homes, &stats);
  if (auto e = gateway.attach(transport))
    return print_error(*e);

  oikos::BillingCalculator calculator(homes, *tariffs, readings);
  oikos::PublisherOptions options;
  options.tick_interval = std::chrono::seconds(cfg.tick_interval_s);
  options.retry = cfg.retry;
  oikos::SnapshotPublisher publisher(homes, calculator, transport, snapshots,
                                     compute_pool, persist_pool, &stats,
                                     options, oikos::timeutil::system_clock());

  oikos::StatusApi api(homes, snapshots, &stats);
  std::optional<oikos::StatusServer> server;
  if (cfg.http_port > 0) {
    server.emplace(api, static_cast<uint16_t>(cfg.http_port));
    if (auto e = server->start())
      return print_error(*e);
  }

  // Closed partitions are compacted once at startup, off the ingest path.
  if (auto e = persist_pool.submit([&readings, &cfg] {
        std::optional<oikos::Error> err;
        readings.compact(oikos::timeutil::now_ms(), cfg.compress_after_days,
                         &err);
        if (err)
          oikos::log_event(oikos::LogLevel::warn, "store", "compaction_failed",
                           {}, err->message, err->code);
      }))
    oikos::log_event(oikos::LogLevel::warn, "store", "compaction_not_queued",
                     {}, e->message, e->code);

  oikos::log_event(oikos::LogLevel::info, "engine", "started", {},
                   oikos::config_to_json(cfg));
  publisher.start();

  transport.pump([] { return g_stop_requested != 0; });
  if (!g_stop_requested) {
    oikos::log_event(oikos::LogLevel::info, "engine", "input_closed", {},
                     "waiting for SIGINT/SIGTERM");
    while (!g_stop_requested)
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  oikos::log_event(oikos::LogLevel::info, "engine", "shutdown_requested");
  const auto grace = std::chrono::milliseconds(cfg.shutdown_grace_ms);
  publisher.stop();
  if (server)
    server->stop();
  compute_pool.shutdown(grace);
  persist_pool.shutdown(grace);
  oikos::log_event(oikos::LogLevel::info, "engine", "stopped", {},
                   stats.to_json());
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty())
    return usage_error("commands: version health config validate-tariff "
                       "resolve history compact run");

  if (cmd == "version") {
    std::cout << oikos::version::manifest_to_json(
                     oikos::version::current_manifest(PROJECT_VERSION))
              << "\n";
    return 0;
  }

  if (cmd == "health") {
    const auto h = oikos::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_backend\":\"" << h.backend
              << "\",\"hash_version\":\"" << h.version << "\"";
    std::cout << ",\"engine_version\":\"" << PROJECT_VERSION << "\"";
    std::cout << ",\"data_layout_version\":"
              << oikos::version::DATA_LAYOUT_VERSION;
    std::cout << ",\"compression_capabilities\":[\"identity\"";
#if defined(OIKOS_WITH_ZSTD)
    std::cout << ",\"zstd\"";
#endif
    std::cout << "]";
    std::cout << "}" << "\n";
    return 0;
  }

  if (cmd == "config") {
    oikos::EngineConfig cfg;
    if (!load_config(&cfg))
      return 2;
    std::cout << oikos::config_to_json(cfg) << "\n";
    return 0;
  }

  if (cmd == "validate-tariff")
    return cmd_validate_tariff(argc, argv);
  if (cmd == "resolve")
    return cmd_resolve(argc, argv);
  if (cmd == "history")
    return cmd_history(argc, argv);
  if (cmd == "compact")
    return cmd_compact(argc, argv);
  if (cmd == "run")
    return cmd_run();

  return usage_error("unknown command: " + cmd);
}
