#pragma once

// oikos/transport.hpp — Message transport seam.
//
// ITransport is the only way readings enter and snapshots leave the engine.
// Topic filters use MQTT semantics: '+' matches one level, '#' (last level
// only) matches any remaining levels.
//
// Adapters:
//   LoopbackTransport  in-process, synchronous delivery; records publications
//   StreamTransport    "topic payload" lines on an istream/ostream pair, the
//                      format of `mosquitto_sub -v` and `mosquitto_pub -l`

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "oikos/types.hpp"

namespace oikos {

using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

bool topic_matches(const std::string& filter, const std::string& topic);
std::vector<std::string> split_topic(const std::string& topic);

class ITransport {
 public:
  virtual ~ITransport() = default;

  // dependency_error when the transport cannot deliver.
  virtual std::optional<Error> publish(const std::string& topic, const std::string& payload) = 0;
  virtual std::optional<Error> subscribe(const std::string& filter, MessageHandler handler) = 0;
};

// ---------------------------------------------------------------------------
// LoopbackTransport
// ---------------------------------------------------------------------------
class LoopbackTransport : public ITransport {
 public:
  struct Message {
    std::string topic;
    std::string payload;
  };

  std::optional<Error> publish(const std::string& topic, const std::string& payload) override;
  std::optional<Error> subscribe(const std::string& filter, MessageHandler handler) override;

  // Delivers to matching subscribers without recording (the inbound side).
  std::size_t inject(const std::string& topic, const std::string& payload);

  std::vector<Message> published() const;
  // Makes the next n publish() calls fail with dependency_error.
  void fail_next_publishes(std::size_t n);

 private:
  std::size_t deliver(const std::string& topic, const std::string& payload);

  mutable std::mutex mu_;
  std::vector<std::pair<std::string, MessageHandler>> subs_;
  std::vector<Message> published_;
  std::size_t fail_budget_{0};
};

// ---------------------------------------------------------------------------
// StreamTransport
// ---------------------------------------------------------------------------
class StreamTransport : public ITransport {
 public:
  StreamTransport(std::istream& in, std::ostream& out);

  std::optional<Error> publish(const std::string& topic, const std::string& payload) override;
  std::optional<Error> subscribe(const std::string& filter, MessageHandler handler) override;

  // Reads lines until EOF or until stop() is observed, dispatching each to
  // matching subscribers. Returns the number of lines dispatched. Malformed
  // lines (no space separator) are logged and skipped.
  std::size_t pump(const std::function<bool()>& stop = {});

 private:
  std::istream& in_;
  std::ostream& out_;
  std::mutex out_mu_;
  std::mutex subs_mu_;
  std::vector<std::pair<std::string, MessageHandler>> subs_;
};

}  // namespace oikos
