#include "engine/core/canonical_json.hpp"

#include <charconv>
#include <cmath>
#include <ostream>
#include <sstream>
#include <system_error>

#include "engine/core/error.hpp"

namespace calfuse {

std::string escape_json(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);

  for (unsigned char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          static const char* hex = "0123456789abcdef";
          out += "\\u00";
          out += hex[(c >> 4) & 0xF];
          out += hex[c & 0xF];
        } else {
          out += static_cast<char>(c);
        }
        break;
    }
  }
  return out;
}

std::string format_json_number(double v) {
  if (!std::isfinite(v)) {
    CALFUSE_THROW(ErrorCode::kParse, "JSON cannot represent a non-finite number");
  }
  if (v == 0.0) return "0";  // folds -0

  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), v);
  if (res.ec != std::errc{}) {
    CALFUSE_THROW(ErrorCode::kInternal, "to_chars failed for double");
  }
  return std::string(buf, res.ptr);
}

void JsonWriter::write(const JsonValue& v) {
  write_value(v, 0);
}

void JsonWriter::newline(int depth) {
  if (!opt_.pretty) return;
  os_ << "\n";
  for (int i = 0; i < depth * opt_.indent_spaces; ++i) os_ << ' ';
}

void JsonWriter::write_value(const JsonValue& v, int depth) {
  switch (v.type()) {
    case JsonType::kNull:
      os_ << "null";
      return;
    case JsonType::kBool:
      os_ << (v.as_bool() ? "true" : "false");
      return;
    case JsonType::kNumber:
      os_ << format_json_number(v.as_number());
      return;
    case JsonType::kString:
      os_ << "\"" << escape_json(v.as_string()) << "\"";
      return;
    case JsonType::kArray: {
      const auto& arr = v.as_array();
      os_ << "[";
      if (arr.empty()) {
        os_ << "]";
        return;
      }
      bool first = true;
      for (const auto& item : arr) {
        if (!first) os_ << ",";
        first = false;
        newline(depth + 1);
        write_value(item, depth + 1);
      }
      newline(depth);
      os_ << "]";
      return;
    }
    case JsonType::kObject: {
      const auto& obj = v.as_object();
      os_ << "{";
      if (obj.empty()) {
        os_ << "}";
        return;
      }
      bool first = true;
      for (const auto& [key, item] : obj) {
        if (!first) os_ << ",";
        first = false;
        newline(depth + 1);
        os_ << "\"" << escape_json(key) << "\":";
        if (opt_.pretty) os_ << " ";
        write_value(item, depth + 1);
      }
      newline(depth);
      os_ << "}";
      return;
    }
  }
}

std::string to_json(const JsonValue& v, const JsonWriteOptions& opt) {
  std::ostringstream oss;
  JsonWriter w(oss, opt);
  w.write(v);
  return oss.str();
}

std::string to_canonical_json(const JsonValue& v) {
  JsonWriteOptions opt;
  opt.pretty = false;
  return to_json(v, opt);
}

}  // namespace calfuse
