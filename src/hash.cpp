#include "oikos/hash.hpp"

// BLAKE3 is the sole hash primitive.
//
// Domain separation: "snap:" and "tariff:" prefixes keep keys from different
// contexts from colliding. The prefixes are part of the on-disk contract
// (version::HASH_ALGORITHM_VERSION); changing them invalidates stored keys.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace oikos {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version   = blake3_version();
  info.primitive = "blake3";
  info.backend   = "system";
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string snapshot_idempotency_key(const std::string& home_id, int64_t tick_ms, int64_t tariff_id) {
  // Home ids are restricted to [A-Za-z0-9_-], so '|' cannot appear inside a field.
  std::string payload = home_id;
  payload += '|';
  payload += std::to_string(tick_ms);
  payload += '|';
  payload += std::to_string(tariff_id);
  return hash_domain("snap:", payload);
}

std::string tariff_content_hash(std::string_view raw_bytes) {
  return hash_domain("tariff:", raw_bytes);
}

}  // namespace oikos
