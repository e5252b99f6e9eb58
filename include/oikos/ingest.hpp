#pragma once

// oikos/ingest.hpp — Inbound reading gateway.
//
// Subscribes to home/{home_id}/device/{category}/power, turns each message
// into a validated Reading and hands it to the home's accumulator. A bad
// message is logged and counted, never propagated: the ingest path does not
// stop for malformed input.

#include <optional>
#include <string>

#include "oikos/home.hpp"
#include "oikos/transport.hpp"
#include "oikos/types.hpp"

namespace oikos {

class EngineStats;

constexpr const char* kReadingTopicFilter = "home/+/device/+/power";

// Parses one transport message. validation_error for a malformed topic,
// payload, timestamp or mismatched category.
std::optional<Reading> parse_reading_message(const std::string& topic, const std::string& payload,
                                             std::optional<Error>* error);

class IngestGateway {
 public:
  IngestGateway(const HomeRegistry& homes, EngineStats* stats);

  std::optional<Error> attach(ITransport& transport);

  // Returns the rejection, if any (already logged and counted).
  std::optional<Error> handle(const std::string& topic, const std::string& payload);

 private:
  const HomeRegistry& homes_;
  EngineStats* stats_;
};

}  // namespace oikos
