#pragma once

// permagate/jsonlite.hpp — Minimal JSON value model, parser and serializer.
//
// Used for configuration files, filter expressions, trusted-node responses
// and JSONL output. Objects are std::map, so serialization is key-sorted and
// stable. Integers that fit in uint64 stay integers; everything else numeric
// is a double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace permagate::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parses any JSON value. Returns nullopt and sets *error on failure.
std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error);

// Parses a JSON object. Returns an empty object on failure (error set).
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);

// Type-safe extractors
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
const Value* find(const Object& obj, const std::string& key);

}  // namespace permagate::jsonlite
