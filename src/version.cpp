#include "oikos/version.hpp"

#include <sstream>

namespace oikos {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver  = engine_semver.empty() ? "0.1.0" : engine_semver;
  m.hash_primitive = "blake3";
#if defined(OIKOS_WITH_ZSTD)
  m.compression = "zstd";
#else
  m.compression = "none";
#endif
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"data_layout\":" << m.data_layout
    << ",\"reading_row\":" << m.reading_row
    << ",\"snapshot_row\":" << m.snapshot_row
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"tariff_schema\":" << m.tariff_schema
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"compression\":\"" << m.compression << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_compatibility(uint32_t stored_layout_version) {
  CompatibilityResult r;
  r.actual_layout = stored_layout_version;
  if (stored_layout_version > DATA_LAYOUT_VERSION) {
    r.ok          = false;
    r.error_code  = "data_layout_too_new";
    r.description = "Data directory layout version " + std::to_string(stored_layout_version) +
                    " is newer than supported version " + std::to_string(DATA_LAYOUT_VERSION) +
                    ". Upgrade the engine before opening this directory.";
  } else if (stored_layout_version == 0) {
    r.ok          = false;
    r.error_code  = "data_layout_invalid";
    r.description = "Data directory layout version 0 is not a valid layout.";
  }
  return r;
}

}  // namespace version
}  // namespace oikos
