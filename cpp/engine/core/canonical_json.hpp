#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "engine/core/json_reader.hpp"

namespace calfuse {

struct JsonWriteOptions {
  // Pretty output = newlines + indentation. Canonical output is never pretty.
  bool pretty = false;
  int indent_spaces = 2;
};

// Deterministic JSON escaping (control chars as \u00xx, lowercase hex).
std::string escape_json(std::string_view s);

// Shortest representation that parses back to the same double; -0 prints as 0.
// Throws calfuse::Error(kParse) for NaN/Inf.
std::string format_json_number(double v);

// Serializes a JsonValue. Object keys come out sorted because JsonValue keeps
// them in a sorted map, so compact output is the canonical form.
class JsonWriter {
 public:
  JsonWriter(std::ostream& os, const JsonWriteOptions& opt) : os_(os), opt_(opt) {}

  void write(const JsonValue& v);

 private:
  void write_value(const JsonValue& v, int depth);
  void newline(int depth);

  std::ostream& os_;
  JsonWriteOptions opt_;
};

std::string to_json(const JsonValue& v, const JsonWriteOptions& opt = {});

// Sorted keys, no whitespace, shortest round-trip numbers.
std::string to_canonical_json(const JsonValue& v);

}  // namespace calfuse
