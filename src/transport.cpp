#include "oikos/transport.hpp"

#include <istream>
#include <ostream>

#include "oikos/observability.hpp"

namespace oikos {

std::vector<std::string> split_topic(const std::string& topic) {
  std::vector<std::string> levels;
  std::size_t start = 0;
  while (true) {
    const std::size_t slash = topic.find('/', start);
    if (slash == std::string::npos) {
      levels.push_back(topic.substr(start));
      break;
    }
    levels.push_back(topic.substr(start, slash - start));
    start = slash + 1;
  }
  return levels;
}

bool topic_matches(const std::string& filter, const std::string& topic) {
  const auto f = split_topic(filter);
  const auto t = split_topic(topic);
  for (std::size_t i = 0; i < f.size(); ++i) {
    if (f[i] == "#") return i + 1 == f.size();
    if (i >= t.size()) return false;
    if (f[i] != "+" && f[i] != t[i]) return false;
  }
  return f.size() == t.size();
}

// ---------------------------------------------------------------------------
// LoopbackTransport
// ---------------------------------------------------------------------------

std::optional<Error> LoopbackTransport::publish(const std::string& topic, const std::string& payload) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (fail_budget_ > 0) {
      --fail_budget_;
      return make_error(ErrorCode::dependency_error, "loopback: injected publish failure");
    }
    published_.push_back(Message{topic, payload});
  }
  deliver(topic, payload);
  return std::nullopt;
}

std::optional<Error> LoopbackTransport::subscribe(const std::string& filter, MessageHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  subs_.emplace_back(filter, std::move(handler));
  return std::nullopt;
}

std::size_t LoopbackTransport::inject(const std::string& topic, const std::string& payload) {
  return deliver(topic, payload);
}

std::size_t LoopbackTransport::deliver(const std::string& topic, const std::string& payload) {
  std::vector<MessageHandler> targets;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& [filter, handler] : subs_) {
      if (topic_matches(filter, topic)) targets.push_back(handler);
    }
  }
  // Handlers run outside the lock so they may publish.
  for (const auto& h : targets) h(topic, payload);
  return targets.size();
}

std::vector<LoopbackTransport::Message> LoopbackTransport::published() const {
  std::lock_guard<std::mutex> lock(mu_);
  return published_;
}

void LoopbackTransport::fail_next_publishes(std::size_t n) {
  std::lock_guard<std::mutex> lock(mu_);
  fail_budget_ = n;
}

// ---------------------------------------------------------------------------
// StreamTransport
// ---------------------------------------------------------------------------

StreamTransport::StreamTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

std::optional<Error> StreamTransport::publish(const std::string& topic, const std::string& payload) {
  std::lock_guard<std::mutex> lock(out_mu_);
  out_ << topic << ' ' << payload << '\n';
  out_.flush();
  if (!out_) return make_error(ErrorCode::dependency_error, "stream transport: output closed");
  return std::nullopt;
}

std::optional<Error> StreamTransport::subscribe(const std::string& filter, MessageHandler handler) {
  std::lock_guard<std::mutex> lock(subs_mu_);
  subs_.emplace_back(filter, std::move(handler));
  return std::nullopt;
}

std::size_t StreamTransport::pump(const std::function<bool()>& stop) {
  std::size_t dispatched = 0;
  std::string line;
  while ((!stop || !stop()) && std::getline(in_, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    const std::size_t sp = line.find(' ');
    if (sp == std::string::npos || sp == 0) {
      log_event(LogLevel::warn, "transport", "malformed_line", {}, line.substr(0, 120),
                ErrorCode::validation_error);
      continue;
    }
    const std::string topic = line.substr(0, sp);
    const std::string payload = line.substr(sp + 1);

    std::vector<MessageHandler> targets;
    {
      std::lock_guard<std::mutex> lock(subs_mu_);
      for (const auto& [filter, handler] : subs_) {
        if (topic_matches(filter, topic)) targets.push_back(handler);
      }
    }
    for (const auto& h : targets) h(topic, payload);
    ++dispatched;
  }
  return dispatched;
}

}  // namespace oikos
