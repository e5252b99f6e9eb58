#pragma once

// oikos/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Used at every boundary the engine owns: inbound reading payloads, tariff
// and home configuration, persisted NDJSON rows and Status API bodies.
//
// STRICTNESS:
//   - Duplicate object keys are rejected (json_duplicate_key).
//   - NaN/Infinity literals are rejected.
//   - Trailing data after the top-level value is rejected.
//
// NUMBERS:
//   Non-negative integers without fraction/exponent parse as uint64; everything
//   else parses as double. get_double() accepts both.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace oikos::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v;
};

// Parse a top-level JSON object. Returns {} and sets *error on failure, or when
// the top-level value is not an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Type-safe extractors. Missing keys and type mismatches yield def.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);

// Structural access. nullptr when missing or of another type.
const Value* find(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

bool is_null(const Value& v);
bool is_number(const Value& v);
std::optional<double> as_double(const Value& v);
// Integral numbers only (no fraction, no sign). Used for hours/months/ids.
std::optional<std::uint64_t> as_u64(const Value& v);

// Writers.
std::string escape(const std::string& s);
std::string format_double(double d);

}  // namespace oikos::jsonlite
