#pragma once

// oikos/status_server.hpp — Minimal HTTP/1.1 front for StatusApi.
//
// One background thread polls the listening socket, reads a single request
// per connection (headers only, bounded size), answers with
// "Connection: close" and closes. POSIX sockets only.

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "oikos/status_api.hpp"
#include "oikos/types.hpp"

namespace oikos {

// Splits "GET /path?q HTTP/1.1" into method and target. nullopt if malformed.
std::optional<std::pair<std::string, std::string>> parse_request_line(const std::string& line);

std::string format_http_response(const HttpResponse& response);

class StatusServer {
 public:
  static constexpr std::size_t kMaxRequestBytes = 8192;

  StatusServer(const StatusApi& api, uint16_t port);
  ~StatusServer();

  StatusServer(const StatusServer&) = delete;
  StatusServer& operator=(const StatusServer&) = delete;

  // Binds and starts serving. dependency_error when the port cannot be bound.
  std::optional<Error> start();
  void stop();

  uint16_t port() const { return port_; }

 private:
  void serve_loop();
  void serve_client(int fd);

  const StatusApi& api_;
  uint16_t port_;
  int listen_fd_{-1};
  std::atomic<bool> stopping_{false};
  std::thread thread_;
};

}  // namespace oikos
