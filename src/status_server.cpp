#include "oikos/status_server.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "oikos/observability.hpp"

namespace oikos {

namespace {

const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 500: return "Internal Server Error";
    default:  return "Unknown";
  }
}

void close_fd(int fd) {
  if (fd >= 0) ::close(fd);
}

bool send_all(int fd, const std::string& data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace

std::optional<std::pair<std::string, std::string>> parse_request_line(const std::string& line) {
  const std::size_t sp1 = line.find(' ');
  if (sp1 == std::string::npos || sp1 == 0) return std::nullopt;
  const std::size_t sp2 = line.find(' ', sp1 + 1);
  if (sp2 == std::string::npos || sp2 == sp1 + 1) return std::nullopt;
  if (line.compare(sp2 + 1, 5, "HTTP/") != 0) return std::nullopt;
  return std::make_pair(line.substr(0, sp1), line.substr(sp1 + 1, sp2 - sp1 - 1));
}

std::string format_http_response(const HttpResponse& r) {
  std::string out = "HTTP/1.1 " + std::to_string(r.status) + " " + reason_phrase(r.status) + "\r\n";
  out += "Content-Type: " + r.content_type + "\r\n";
  out += "Content-Length: " + std::to_string(r.body.size()) + "\r\n";
  out += "Connection: close\r\n\r\n";
  out += r.body;
  return out;
}

StatusServer::StatusServer(const StatusApi& api, uint16_t port) : api_(api), port_(port) {}

StatusServer::~StatusServer() { stop(); }

std::optional<Error> StatusServer::start() {
  if (thread_.joinable()) return std::nullopt;

  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return make_error(ErrorCode::dependency_error, std::string("socket: ") + std::strerror(errno));
  }
  int yes = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, static_cast<socklen_t>(sizeof(yes)));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 16) != 0) {
    const std::string reason = std::strerror(errno);
    close_fd(fd);
    return make_error(ErrorCode::dependency_error, "bind port " + std::to_string(port_) + ": " + reason);
  }

  listen_fd_ = fd;
  stopping_.store(false);
  thread_ = std::thread([this] { serve_loop(); });
  log_event(LogLevel::info, "status_server", "listening", {}, "port " + std::to_string(port_));
  return std::nullopt;
}

void StatusServer::stop() {
  stopping_.store(true);
  if (thread_.joinable()) thread_.join();
  close_fd(listen_fd_);
  listen_fd_ = -1;
}

void StatusServer::serve_loop() {
  while (!stopping_.load()) {
    pollfd pfd{listen_fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, 200);
    if (ready <= 0) continue;  // timeout or EINTR: re-check stopping_

    sockaddr_in peer;
    socklen_t len = static_cast<socklen_t>(sizeof(peer));
    const int client = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &len);
    if (client < 0) continue;
    serve_client(client);
    close_fd(client);
  }
}

void StatusServer::serve_client(int fd) {
  timeval tv{2, 0};
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, static_cast<socklen_t>(sizeof(tv)));

  std::string request;
  char buf[1024];
  while (request.find("\r\n\r\n") == std::string::npos && request.size() < kMaxRequestBytes) {
    const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    request.append(buf, static_cast<std::size_t>(n));
  }

  HttpResponse response;
  const std::size_t eol = request.find("\r\n");
  auto line = parse_request_line(eol == std::string::npos ? request : request.substr(0, eol));
  if (!line) {
    response.status = 400;
    response.body = "{\"error\":\"bad_request\",\"message\":\"malformed request line\"}";
  } else {
    response = api_.handle(line->first, line->second);
  }
  if (!send_all(fd, format_http_response(response))) {
    log_event(LogLevel::debug, "status_server", "send_failed", {}, std::strerror(errno));
  }
}

}  // namespace oikos
