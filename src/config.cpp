#include "oikos/config.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "oikos/jsonlite.hpp"

namespace oikos {

namespace {

// Strict integer parse: the whole value must be a base-10 integer in range.
void read_int(const EnvLookup& env, const char* name, int64_t lo, int64_t hi, int64_t* out,
              ConfigValidationResult* result) {
  const char* raw = env(name);
  if (!raw || !raw[0]) return;
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(raw, &end, 10);
  if (errno != 0 || end == raw || *end != '\0') {
    result->errors.push_back(std::string(name) + ": not an integer: \"" + raw + "\"");
    return;
  }
  if (v < lo || v > hi) {
    result->errors.push_back(std::string(name) + ": " + std::to_string(v) + " outside [" +
                             std::to_string(lo) + ", " + std::to_string(hi) + "]");
    return;
  }
  *out = static_cast<int64_t>(v);
}

void read_string(const EnvLookup& env, const char* name, std::string* out) {
  const char* raw = env(name);
  if (raw && raw[0]) *out = raw;
}

std::optional<Error> homes_error(std::string message) {
  return make_error(ErrorCode::config_error, "homes file: " + std::move(message));
}

}  // namespace

ConfigValidationResult load_engine_config(EngineConfig* out, const EnvLookup& lookup) {
  ConfigValidationResult result;
  const EnvLookup env = lookup ? lookup : EnvLookup([](const char* n) { return std::getenv(n); });
  EngineConfig c;

  read_string(env, "OIKOS_DATA_DIR", &c.data_dir);
  read_string(env, "OIKOS_TARIFF_FILE", &c.tariff_file);
  read_string(env, "OIKOS_HOMES_FILE", &c.homes_file);

  read_int(env, "OIKOS_TICK_INTERVAL_S", 1, 86400, &c.tick_interval_s, &result);
  read_int(env, "OIKOS_FUTURE_SKEW_S", 0, 3600, &c.future_skew_s, &result);

  int64_t v = static_cast<int64_t>(c.compute_workers);
  read_int(env, "OIKOS_COMPUTE_WORKERS", 1, 256, &v, &result);
  c.compute_workers = static_cast<std::size_t>(v);
  v = static_cast<int64_t>(c.persist_workers);
  read_int(env, "OIKOS_PERSIST_WORKERS", 1, 256, &v, &result);
  c.persist_workers = static_cast<std::size_t>(v);
  v = static_cast<int64_t>(c.persist_queue);
  read_int(env, "OIKOS_PERSIST_QUEUE", 1, 1000000, &v, &result);
  c.persist_queue = static_cast<std::size_t>(v);

  if (const char* raw = env("OIKOS_PERSIST_POLICY"); raw && raw[0]) {
    if (auto p = parse_backpressure_policy(raw)) {
      c.persist_policy = *p;
    } else {
      result.errors.push_back(std::string("OIKOS_PERSIST_POLICY: expected block|drop_oldest|reject, got \"") +
                              raw + "\"");
    }
  }

  v = c.retry.max_attempts;
  read_int(env, "OIKOS_RETRY_MAX_ATTEMPTS", 1, 20, &v, &result);
  c.retry.max_attempts = static_cast<uint32_t>(v);
  v = c.retry.base_delay.count();
  read_int(env, "OIKOS_RETRY_BASE_MS", 1, 60000, &v, &result);
  c.retry.base_delay = std::chrono::milliseconds(v);
  v = c.retry.max_delay.count();
  read_int(env, "OIKOS_RETRY_MAX_MS", 1, 600000, &v, &result);
  c.retry.max_delay = std::chrono::milliseconds(v);
  if (c.retry.max_delay < c.retry.base_delay) {
    result.errors.push_back("OIKOS_RETRY_MAX_MS must be >= OIKOS_RETRY_BASE_MS");
  }

  read_int(env, "OIKOS_SHUTDOWN_GRACE_MS", 0, 600000, &c.shutdown_grace_ms, &result);
  v = c.http_port;
  read_int(env, "OIKOS_HTTP_PORT", 0, 65535, &v, &result);
  c.http_port = static_cast<int>(v);
  v = c.compress_after_days;
  read_int(env, "OIKOS_COMPRESS_AFTER_DAYS", 1, 3650, &v, &result);
  c.compress_after_days = static_cast<int>(v);

  if (c.tick_interval_s < 10) {
    result.warnings.push_back("OIKOS_TICK_INTERVAL_S below 10s rewrites snapshot history very often");
  }
  if (c.persist_policy != BackpressurePolicy::block) {
    result.warnings.push_back("persist policy " + to_string(c.persist_policy) +
                              " may drop raw readings under load; month-to-date totals would undercount");
  }

  result.ok = result.errors.empty();
  if (result.ok && out) *out = c;
  return result;
}

std::string config_to_json(const EngineConfig& c) {
  std::ostringstream o;
  o << "{\"data_dir\":\"" << jsonlite::escape(c.data_dir) << "\""
    << ",\"tariff_file\":\"" << jsonlite::escape(c.tariff_file) << "\""
    << ",\"homes_file\":\"" << jsonlite::escape(c.homes_file) << "\""
    << ",\"tick_interval_s\":" << c.tick_interval_s
    << ",\"future_skew_s\":" << c.future_skew_s
    << ",\"compute_workers\":" << c.compute_workers
    << ",\"persist_workers\":" << c.persist_workers
    << ",\"persist_queue\":" << c.persist_queue
    << ",\"persist_policy\":\"" << to_string(c.persist_policy) << "\""
    << ",\"retry\":{\"max_attempts\":" << c.retry.max_attempts
    << ",\"base_ms\":" << c.retry.base_delay.count()
    << ",\"max_ms\":" << c.retry.max_delay.count() << "}"
    << ",\"shutdown_grace_ms\":" << c.shutdown_grace_ms
    << ",\"http_port\":" << c.http_port
    << ",\"compress_after_days\":" << c.compress_after_days
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// Homes file
// ---------------------------------------------------------------------------

CategorySet default_device_categories() {
  return {"base_load", "office", "hvac", "garden_pump", "ev_charger", "entertainment", "kitchen"};
}

HomesFile parse_homes_file(const std::string& text, std::optional<Error>* error) {
  std::optional<jsonlite::JsonError> json_err;
  auto root = jsonlite::parse(text, &json_err);
  if (json_err) {
    *error = homes_error(json_err->code + ": " + json_err->message);
    return {};
  }

  HomesFile out;
  if (const jsonlite::Value* cats = jsonlite::find(root, "device_categories"); cats && !jsonlite::is_null(*cats)) {
    const auto* arr = std::get_if<jsonlite::Array>(&cats->v);
    if (!arr) {
      *error = homes_error("device_categories must be an array of strings");
      return {};
    }
    for (const auto& c : *arr) {
      const auto* s = std::get_if<std::string>(&c.v);
      if (!s) {
        *error = homes_error("device_categories must be an array of strings");
        return {};
      }
      out.categories.insert(*s);
    }
  } else {
    out.categories = default_device_categories();
  }

  const jsonlite::Array* homes = jsonlite::get_array(root, "homes");
  if (!homes || homes->empty()) {
    *error = homes_error("\"homes\" must be a non-empty array");
    return {};
  }
  for (std::size_t i = 0; i < homes->size(); ++i) {
    const auto* h = std::get_if<jsonlite::Object>(&(*homes)[i].v);
    if (!h) {
      *error = homes_error("homes[" + std::to_string(i) + "] must be an object");
      return {};
    }
    HomeConfig home;
    home.id = jsonlite::get_string(*h, "id");
    home.name = jsonlite::get_string(*h, "name", home.id);
    home.tariff_name = jsonlite::get_string(*h, "tariff");
    if (const jsonlite::Value* off = jsonlite::find(*h, "utc_offset_minutes")) {
      auto d = jsonlite::as_double(*off);
      if (!d || std::floor(*d) != *d || std::fabs(*d) > 24 * 60) {
        *error = homes_error("homes[" + std::to_string(i) + "].utc_offset_minutes must be an integer");
        return {};
      }
      home.utc_offset_minutes = static_cast<int>(*d);
    }
    if (auto e = validate_home_config(home)) {
      *error = homes_error(e->message);
      return {};
    }
    out.homes.push_back(std::move(home));
  }
  return out;
}

HomesFile load_homes_file(const std::string& path, std::optional<Error>* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    *error = make_error(ErrorCode::config_error, "cannot open homes file: " + path);
    return {};
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  return parse_homes_file(ss.str(), error);
}

}  // namespace oikos
