#pragma once

// oikos/status_api.hpp — Read-only HTTP routes over engine state.
//
//   GET /health                              {"status":"healthy"}
//   GET /billing/current[?home_id=]          latest snapshot + tariff name
//   GET /billing/history?home_id=&from=&to=  persisted snapshots, oldest first
//   GET /engine/stats                        EngineStats::to_json()
//
// handle() is transport-free so it can be exercised without a socket;
// StatusServer (status_server.hpp) only frames requests and responses.
// home_id defaults to the first configured home. Errors are JSON bodies
// {"error": code, "message": text} with 400 / 404 / 405 / 500.

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "oikos/home.hpp"
#include "oikos/store.hpp"

namespace oikos {

class EngineStats;

struct HttpResponse {
  int         status{200};
  std::string content_type{"application/json"};
  std::string body;
};

// Percent-decodes a query component ('+' is a space). nullopt on a bad escape.
std::optional<std::string> url_decode(std::string_view text);

// Splits "a=1&b=2". nullopt when any component fails to decode.
std::optional<std::map<std::string, std::string>> parse_query(std::string_view query);

std::string snapshot_to_json(const BillingSnapshot& snapshot);

class StatusApi {
 public:
  StatusApi(const HomeRegistry& homes, ISnapshotStore& snapshots, const EngineStats* stats);

  HttpResponse handle(const std::string& method, const std::string& target) const;

 private:
  HttpResponse current(const std::map<std::string, std::string>& query) const;
  HttpResponse history(const std::map<std::string, std::string>& query) const;
  HttpResponse stats() const;
  const HomeContext* home_for(const std::map<std::string, std::string>& query, HttpResponse* error) const;

  const HomeRegistry& homes_;
  ISnapshotStore& snapshots_;
  const EngineStats* stats_;
};

}  // namespace oikos
