#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace calfuse {

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based

  std::string to_string() const;
};

enum class JsonType { kNull, kBool, kNumber, kString, kObject, kArray };

const char* json_type_name(JsonType t) noexcept;

// Small JSON DOM. Objects are key-sorted so serialization is order independent.
class JsonValue {
 public:
  using Object = std::map<std::string, JsonValue>;
  using Array = std::vector<JsonValue>;

  JsonValue() = default;

  static JsonValue make_null() { return JsonValue{}; }
  static JsonValue make_bool(bool b);
  static JsonValue make_number(double v);
  static JsonValue make_string(std::string s);
  static JsonValue make_object();
  static JsonValue make_array();

  JsonType type() const noexcept { return t_; }
  bool is_null() const noexcept { return t_ == JsonType::kNull; }
  bool is_bool() const noexcept { return t_ == JsonType::kBool; }
  bool is_number() const noexcept { return t_ == JsonType::kNumber; }
  bool is_string() const noexcept { return t_ == JsonType::kString; }
  bool is_object() const noexcept { return t_ == JsonType::kObject; }
  bool is_array() const noexcept { return t_ == JsonType::kArray; }

  // Typed accessors throw calfuse::Error(kParse) on a type mismatch.
  bool as_bool() const;
  double as_number() const;
  const std::string& as_string() const;
  const Object& as_object() const;
  const Array& as_array() const;

  // nullptr if this is not an object or the key is absent.
  const JsonValue* find(std::string_view key) const;

  // Mutators for building documents. set() converts a null value into an object,
  // push_back() converts a null value into an array.
  JsonValue& set(std::string key, JsonValue v);
  JsonValue& push_back(JsonValue v);

 private:
  JsonType t_ = JsonType::kNull;
  bool b_ = false;
  double num_ = 0.0;
  std::string str_;
  Object obj_;
  Array arr_;
};

/// Parse a complete JSON document.
/// - Strict grammar: no trailing commas, no comments, no NaN/Inf literals.
/// - Duplicate keys inside one object are rejected.
/// - Trailing non-whitespace after the root value is rejected.
bool parse_json(std::string_view json, JsonValue* out, JsonParseError* err = nullptr);

/// Stream convenience (reads full stream into memory).
bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err = nullptr);

// Read a whole file into memory. Throws IoError if it cannot be opened or read.
std::string read_text_file(const std::string& path);

}  // namespace calfuse
