#pragma once

// carver/jsonlite.hpp - Minimal strict JSON reader/writer for configuration
// files and ledger artifact headers.
//
// Strictness: duplicate keys, trailing data, NaN/Infinity are errors.
// Objects are std::map, so serialization is key-sorted and deterministic.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace carver::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

// Parse text as a JSON object. On error, *error is set and {} is returned.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Type-safe extractors. A missing key or a value of the wrong type yields def.
bool has_key(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::optional<Object> get_object(const Object& obj, const std::string& key);

std::string escape(const std::string& s);
std::string to_json(const Value& v);

}  // namespace carver::jsonlite
