#include "oikos/ingest.hpp"

#include "oikos/jsonlite.hpp"
#include "oikos/observability.hpp"
#include "oikos/timeutil.hpp"

namespace oikos {

namespace {

std::optional<Error> invalid(std::string message) {
  return make_error(ErrorCode::validation_error, std::move(message));
}

}  // namespace

std::optional<Reading> parse_reading_message(const std::string& topic, const std::string& payload,
                                             std::optional<Error>* error) {
  const auto levels = split_topic(topic);
  if (levels.size() != 5 || levels[0] != "home" || levels[2] != "device" || levels[4] != "power") {
    *error = invalid("unexpected topic \"" + topic + "\"");
    return std::nullopt;
  }
  if (!valid_identifier(levels[1]) || !valid_identifier(levels[3])) {
    *error = invalid("invalid home or category in topic \"" + topic + "\"");
    return std::nullopt;
  }

  std::optional<jsonlite::JsonError> json_err;
  auto obj = jsonlite::parse(payload, &json_err);
  if (json_err) {
    *error = invalid("payload " + json_err->code + ": " + json_err->message);
    return std::nullopt;
  }

  Reading r;
  r.home_id = levels[1];
  r.device_category = levels[3];

  if (const jsonlite::Value* cat = jsonlite::find(obj, "device_category"); cat && !jsonlite::is_null(*cat)) {
    const auto* s = std::get_if<std::string>(&cat->v);
    if (!s || *s != r.device_category) {
      *error = invalid("payload device_category does not match topic category \"" + r.device_category + "\"");
      return std::nullopt;
    }
  }

  const auto* ts = jsonlite::find(obj, "timestamp");
  const auto* ts_str = ts ? std::get_if<std::string>(&ts->v) : nullptr;
  if (!ts_str) {
    *error = invalid("timestamp is required (RFC3339 string)");
    return std::nullopt;
  }
  auto ts_ms = timeutil::parse_rfc3339(*ts_str);
  if (!ts_ms) {
    *error = invalid("timestamp is not RFC3339: \"" + *ts_str + "\"");
    return std::nullopt;
  }
  r.timestamp_ms = *ts_ms;

  const auto* power = jsonlite::find(obj, "power_w");
  auto power_w = power ? jsonlite::as_double(*power) : std::nullopt;
  if (!power_w) {
    *error = invalid("power_w is required and must be a number");
    return std::nullopt;
  }
  r.power_w = *power_w;

  if (const auto* energy = jsonlite::find(obj, "energy_wh"); energy && !jsonlite::is_null(*energy)) {
    auto wh = jsonlite::as_double(*energy);
    if (!wh) {
      *error = invalid("energy_wh must be a number");
      return std::nullopt;
    }
    r.energy_wh = *wh;
  }
  return r;
}

IngestGateway::IngestGateway(const HomeRegistry& homes, EngineStats* stats) : homes_(homes), stats_(stats) {}

std::optional<Error> IngestGateway::attach(ITransport& transport) {
  return transport.subscribe(kReadingTopicFilter, [this](const std::string& topic, const std::string& payload) {
    // Rejections are logged and counted inside handle().
    (void)handle(topic, payload);
  });
}

std::optional<Error> IngestGateway::handle(const std::string& topic, const std::string& payload) {
  std::optional<Error> error;
  auto reading = parse_reading_message(topic, payload, &error);
  HomeContext* home = nullptr;
  if (reading) home = homes_.find(reading->home_id, &error);
  if (home) error = home->accumulator().add_reading(*reading);

  if (error) {
    if (stats_) stats_->readings_rejected.fetch_add(1, std::memory_order_relaxed);
    log_event(LogLevel::warn, "ingest", "reading_rejected", reading ? reading->home_id : std::string{},
              error->message, error->code);
    return error;
  }
  if (stats_) stats_->readings_accepted.fetch_add(1, std::memory_order_relaxed);
  return std::nullopt;
}

}  // namespace oikos
