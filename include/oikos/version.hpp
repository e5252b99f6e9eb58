#pragma once

// oikos/version.hpp — Explicit version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift between the engine and the data directory it
//   reads back after a restart. Every component that reads or writes a
//   versioned format checks its constant here before processing data.
//
// INVARIANT:
//   Never silently accept data from a newer format version than the engine
//   was compiled against. Rows with a higher version are refused, not guessed.

#include <cstdint>
#include <string>

namespace oikos {
namespace version {

// ---------------------------------------------------------------------------
// DATA_LAYOUT_VERSION
// Tracks the directory layout under OIKOS_DATA_DIR.
// Version 1 = readings/<home>/<YYYY-MM-DD>.ndjson[.zst], snapshots/<home>.ndjson.
// Recorded in <data>/layout.json and checked when a store opens the directory.
// ---------------------------------------------------------------------------
constexpr uint32_t DATA_LAYOUT_VERSION = 1;

// ---------------------------------------------------------------------------
// READING_ROW_VERSION
// Version 1 = {v, ts, cat, p, e} NDJSON rows (ts unix ms, e Wh).
// ---------------------------------------------------------------------------
constexpr uint32_t READING_ROW_VERSION = 1;

// ---------------------------------------------------------------------------
// SNAPSHOT_ROW_VERSION
// Version 1 = {v, key, timestamp, home_id, cost_today, ...} NDJSON rows.
// Adding or removing a required field requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t SNAPSHOT_ROW_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex encoded, domain-separated by prefix.
// Snapshot idempotency keys depend on it.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// TARIFF_SCHEMA_VERSION
// Version 1 = {"tariffs":[{id, name, structure:{energy_charges, tou_schedule}}]}.
// ---------------------------------------------------------------------------
constexpr uint32_t TARIFF_SCHEMA_VERSION = 1;

struct VersionManifest {
  uint32_t data_layout{DATA_LAYOUT_VERSION};
  uint32_t reading_row{READING_ROW_VERSION};
  uint32_t snapshot_row{SNAPSHOT_ROW_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t tariff_schema{TARIFF_SCHEMA_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string compression;        // "zstd" or "none"
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");

std::string manifest_to_json(const VersionManifest& m);

// ---------------------------------------------------------------------------
// Compatibility check for a data directory written by another build.
// Never throws.
// ---------------------------------------------------------------------------
struct CompatibilityResult {
  bool ok{true};
  std::string error_code;    // Empty if ok
  std::string description;
  uint32_t required_layout{DATA_LAYOUT_VERSION};
  uint32_t actual_layout{DATA_LAYOUT_VERSION};
};

CompatibilityResult check_compatibility(uint32_t stored_layout_version = DATA_LAYOUT_VERSION);

}  // namespace version
}  // namespace oikos
