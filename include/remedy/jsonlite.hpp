#pragma once

// remedy/jsonlite.hpp: Minimal strict JSON value model, parser and serializer.
//
// Used for config files, capability request/response payloads and result
// serialization. Objects are std::map, so serialization order is sorted by
// key and therefore stable.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace remedy::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse a JSON document whose root must be an object. On error returns an
// empty object and fills *error (if non-null).
Object parse(const std::string& text, std::optional<JsonError>* error);

// Parse any JSON value.
std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing keys and wrong types yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

// Type predicates on an object member; false when the key is absent.
bool is_string(const Object& obj, const std::string& key);
bool is_number(const Object& obj, const std::string& key);
bool is_unsigned(const Object& obj, const std::string& key);

}  // namespace remedy::jsonlite
