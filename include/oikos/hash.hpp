#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace oikos {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing for different contexts
std::string hash_domain(std::string_view domain, std::string_view payload);

// Idempotency key of one snapshot row: stable across restarts for the same
// (home, aligned tick instant, tariff row).
std::string snapshot_idempotency_key(const std::string& home_id, int64_t tick_ms, int64_t tariff_id);

// Digest of a tariff file's raw bytes, reported by `validate-tariff`.
std::string tariff_content_hash(std::string_view raw_bytes);

}  // namespace oikos
