#include "oikos/status_api.hpp"

#include <sstream>

#include "oikos/jsonlite.hpp"
#include "oikos/observability.hpp"
#include "oikos/timeutil.hpp"

namespace oikos {

namespace {

HttpResponse error_response(int status, const std::string& code, const std::string& message) {
  HttpResponse r;
  r.status = status;
  r.body = "{\"error\":\"" + jsonlite::escape(code) + "\",\"message\":\"" + jsonlite::escape(message) + "\"}";
  return r;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::optional<std::string> url_decode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= text.size()) return std::nullopt;
      const int hi = hex_value(text[i + 1]);
      const int lo = hex_value(text[i + 2]);
      if (hi < 0 || lo < 0) return std::nullopt;
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::optional<std::map<std::string, std::string>> parse_query(std::string_view query) {
  std::map<std::string, std::string> out;
  while (!query.empty()) {
    const std::size_t amp = query.find('&');
    const std::string_view part = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (part.empty()) continue;

    const std::size_t eq = part.find('=');
    auto key = url_decode(part.substr(0, eq));
    auto value = url_decode(eq == std::string_view::npos ? std::string_view{} : part.substr(eq + 1));
    if (!key || !value) return std::nullopt;
    out[*key] = *value;  // last occurrence wins
  }
  return out;
}

std::string snapshot_to_json(const BillingSnapshot& s) {
  std::ostringstream o;
  o << "{\"home_id\":\"" << jsonlite::escape(s.home_id) << "\""
    << ",\"timestamp\":\"" << timeutil::format_rfc3339(s.timestamp_ms) << "\""
    << ",\"cost_today\":" << jsonlite::format_double(s.cost_today)
    << ",\"energy_today_kwh\":" << jsonlite::format_double(s.energy_today_kwh)
    << ",\"projected_month\":" << jsonlite::format_double(s.projected_month)
    << ",\"co2_today_kg\":" << jsonlite::format_double(s.co2_today_kg)
    << ",\"current_rate\":" << jsonlite::format_double(s.current_rate)
    << ",\"tariff_id\":" << s.tariff_id
    << ",\"tariff\":\"" << jsonlite::escape(s.tariff_name) << "\""
    << "}";
  return o.str();
}

StatusApi::StatusApi(const HomeRegistry& homes, ISnapshotStore& snapshots, const EngineStats* stats)
    : homes_(homes), snapshots_(snapshots), stats_(stats) {}

HttpResponse StatusApi::handle(const std::string& method, const std::string& target) const {
  const std::size_t qmark = target.find('?');
  const std::string path = target.substr(0, qmark);
  const std::string_view raw_query =
      qmark == std::string::npos ? std::string_view{} : std::string_view(target).substr(qmark + 1);

  const bool known = path == "/health" || path == "/billing/current" || path == "/billing/history" ||
                     path == "/engine/stats";
  if (!known) return error_response(404, "not_found", "no route for " + path);
  if (method != "GET") return error_response(405, "method_not_allowed", method + " " + path);

  auto query = parse_query(raw_query);
  if (!query) return error_response(400, "bad_request", "malformed query string");

  if (path == "/health") {
    HttpResponse r;
    r.body = "{\"status\":\"healthy\"}";
    return r;
  }
  if (path == "/billing/current") return current(*query);
  if (path == "/billing/history") return history(*query);
  return stats();
}

const HomeContext* StatusApi::home_for(const std::map<std::string, std::string>& query,
                                       HttpResponse* error) const {
  auto it = query.find("home_id");
  const std::string home_id = it != query.end() ? it->second : homes_.default_home_id();
  std::optional<Error> lookup;
  const HomeContext* home = homes_.find(home_id, &lookup);
  if (!home) {
    *error = error_response(404, to_string(ErrorCode::lookup_error),
                            lookup ? lookup->message : "unknown home \"" + home_id + "\"");
  }
  return home;
}

HttpResponse StatusApi::current(const std::map<std::string, std::string>& query) const {
  HttpResponse err;
  const HomeContext* home = home_for(query, &err);
  if (!home) return err;

  auto latest = home->latest();
  if (!latest) return error_response(404, "no_snapshot", "no billing snapshot computed yet for " + home->id());

  HttpResponse r;
  r.body = snapshot_to_json(*latest);
  return r;
}

HttpResponse StatusApi::history(const std::map<std::string, std::string>& query) const {
  HttpResponse err;
  const HomeContext* home = home_for(query, &err);
  if (!home) return err;

  auto from_it = query.find("from");
  auto to_it = query.find("to");
  if (from_it == query.end() || to_it == query.end()) {
    return error_response(400, "bad_request", "from and to are required (RFC3339)");
  }
  auto from = timeutil::parse_rfc3339(from_it->second);
  auto to = timeutil::parse_rfc3339(to_it->second);
  if (!from) return error_response(400, "bad_request", "invalid from: " + from_it->second);
  if (!to) return error_response(400, "bad_request", "invalid to: " + to_it->second);
  if (*to < *from) return error_response(400, "bad_request", "to is before from");

  std::optional<Error> error;
  auto rows = snapshots_.range(home->id(), *from, *to, &error);
  if (error) {
    log_event(LogLevel::error, "status_api", "history_failed", home->id(), error->message, error->code);
    return error_response(500, to_string(error->code), error->message);
  }

  std::string body = "[";
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (i) body += ",";
    body += snapshot_to_json(rows[i]);
  }
  body += "]";
  HttpResponse r;
  r.body = std::move(body);
  return r;
}

HttpResponse StatusApi::stats() const {
  HttpResponse r;
  r.body = stats_ ? stats_->to_json() : std::string("{}");
  return r;
}

}  // namespace oikos
