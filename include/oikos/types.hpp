#pragma once

// oikos/types.hpp — Core value types for the oikos metering and billing engine.
//
// ERROR MODEL:
//   Errors are values. Operations return std::optional<Error> (nullopt = ok) or
//   fill an std::optional<Error>* out-parameter. Nothing on the ingest, compute
//   or persistence path throws.
//
// TIME MODEL:
//   All instants are unix milliseconds (UTC). Local calendar questions (day,
//   month, hour) are answered with a per-home fixed UTC offset, see timeutil.hpp.
//
// MEMORY OWNERSHIP:
//   Reading and BillingSnapshot are value types. Components copy them across
//   thread boundaries; no borrowed references escape a lock.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace oikos {

enum class ErrorCode {
  none,
  validation_error,   // malformed / out-of-range reading: dropped, ingest continues
  config_error,       // malformed tariff or engine configuration
  lookup_error,       // unknown home, or no tariff active at the instant
  dependency_error,   // store/transport unavailable, or wrapped compute failure
  transient_error,    // retryable I/O failure (bounded backoff)
  json_parse_error,
  json_duplicate_key,
  queue_full,         // worker pool refused a task under the reject policy
  shutting_down,      // worker pool no longer accepts work
};

std::string to_string(ErrorCode code);

struct Error {
  ErrorCode   code{ErrorCode::none};
  std::string message;
  ErrorCode   cause{ErrorCode::none};  // original code when this error wraps another
};

inline Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message), ErrorCode::none};
}

// Wraps `inner` as `code`, keeping its code as the cause and its message
// after `context`.
inline Error wrap_error(ErrorCode code, const std::string& context, const Error& inner) {
  return Error{code, context + ": " + inner.message,
               inner.cause != ErrorCode::none ? inner.cause : inner.code};
}

// ---------------------------------------------------------------------------
// Tariff dimensions
// ---------------------------------------------------------------------------
enum class Season { summer = 0, winter = 1 };
enum class TouPeriod { off_peak = 0, partial_peak = 1, peak = 2 };

constexpr std::size_t kSeasonCount = 2;
constexpr std::size_t kPeriodCount = 3;

std::string to_string(Season s);
std::string to_string(TouPeriod p);

// ---------------------------------------------------------------------------
// Reading — one device sample as delivered by the transport.
// ---------------------------------------------------------------------------
struct Reading {
  int64_t     timestamp_ms{0};
  std::string home_id;
  std::string device_category;
  double      power_w{0.0};
  std::optional<double> energy_wh;  // sample energy reported by the device, if any
};

// Nominal device sampling interval used when a reading carries no energy_wh.
// Integrating power over this interval is an approximation: devices that
// sample at another rate are mis-weighted.
constexpr double kNominalSampleSeconds = 5.0;

// Energy attributed to one reading, in Wh.
double reading_energy_wh(const Reading& r);

// ---------------------------------------------------------------------------
// BillingSnapshot — immutable result of one tick for one home.
// ---------------------------------------------------------------------------
struct BillingSnapshot {
  int64_t     timestamp_ms{0};
  std::string home_id;
  double      cost_today{0.0};
  double      energy_today_kwh{0.0};
  double      projected_month{0.0};
  double      co2_today_kg{0.0};
  double      current_rate{0.0};
  int64_t     tariff_id{0};
  std::string tariff_name;
};

// Home ids and device categories become topic levels and file names.
// Only [A-Za-z0-9_-], 1..64 chars.
bool valid_identifier(const std::string& id);

}  // namespace oikos
