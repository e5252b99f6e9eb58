#pragma once

// oikos/config.hpp — Engine configuration.
//
// Runtime knobs come from OIKOS_* environment variables, each with a default.
// Homes and device categories come from the homes file; tariffs from the
// tariff file (see tariff.hpp). Everything is validated once at startup;
// an invalid value is an error, never silently clamped.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "oikos/accumulator.hpp"
#include "oikos/home.hpp"
#include "oikos/types.hpp"
#include "oikos/worker_pool.hpp"

namespace oikos {

struct EngineConfig {
  std::string data_dir{".oikos"};
  std::string tariff_file{"config/tariffs.json"};
  std::string homes_file{"config/homes.json"};
  int64_t     tick_interval_s{300};
  int64_t     future_skew_s{60};
  std::size_t compute_workers{4};
  std::size_t persist_workers{2};
  std::size_t persist_queue{1024};
  BackpressurePolicy persist_policy{BackpressurePolicy::block};
  RetryPolicy retry;
  int64_t     shutdown_grace_ms{5000};
  int         http_port{8080};  // 0 disables the status server
  int         compress_after_days{7};
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Returns the variable's value or nullptr. Defaults to std::getenv.
using EnvLookup = std::function<const char*(const char*)>;

ConfigValidationResult load_engine_config(EngineConfig* out, const EnvLookup& env = {});
std::string config_to_json(const EngineConfig& config);

// ---------------------------------------------------------------------------
// Homes file: {"device_categories":[...], "homes":[{id, name, tariff, utc_offset_minutes}]}
// ---------------------------------------------------------------------------
struct HomesFile {
  CategorySet categories;
  std::vector<HomeConfig> homes;
};

CategorySet default_device_categories();

HomesFile parse_homes_file(const std::string& text, std::optional<Error>* error);
HomesFile load_homes_file(const std::string& path, std::optional<Error>* error);

}  // namespace oikos
