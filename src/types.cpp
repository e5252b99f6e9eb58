#include "oikos/types.hpp"

namespace oikos {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::validation_error: return "validation_error";
    case ErrorCode::config_error: return "config_error";
    case ErrorCode::lookup_error: return "lookup_error";
    case ErrorCode::dependency_error: return "dependency_error";
    case ErrorCode::transient_error: return "transient_error";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::queue_full: return "queue_full";
    case ErrorCode::shutting_down: return "shutting_down";
  }
  return "";
}

std::string to_string(Season s) {
  switch (s) {
    case Season::summer: return "summer";
    case Season::winter: return "winter";
  }
  return "winter";
}

std::string to_string(TouPeriod p) {
  switch (p) {
    case TouPeriod::off_peak: return "off_peak";
    case TouPeriod::partial_peak: return "partial_peak";
    case TouPeriod::peak: return "peak";
  }
  return "off_peak";
}

double reading_energy_wh(const Reading& r) {
  if (r.energy_wh) return *r.energy_wh;
  return r.power_w * (kNominalSampleSeconds / 3600.0);
}

bool valid_identifier(const std::string& id) {
  if (id.empty() || id.size() > 64) return false;
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

}  // namespace oikos
