#include "engine/core/json_reader.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <istream>
#include <sstream>
#include <system_error>
#include <utility>

#include "engine/core/errors.hpp"

namespace calfuse {

std::string JsonParseError::to_string() const {
  std::ostringstream oss;
  oss << message << " (line " << line << ", col " << col << ", offset " << offset << ")";
  return oss.str();
}

const char* json_type_name(JsonType t) noexcept {
  switch (t) {
    case JsonType::kNull:   return "null";
    case JsonType::kBool:   return "bool";
    case JsonType::kNumber: return "number";
    case JsonType::kString: return "string";
    case JsonType::kObject: return "object";
    case JsonType::kArray:  return "array";
    default:                return "unknown";
  }
}

// ----------------------------- JsonValue -------------------------------------

JsonValue JsonValue::make_bool(bool b) {
  JsonValue v;
  v.t_ = JsonType::kBool;
  v.b_ = b;
  return v;
}

JsonValue JsonValue::make_number(double d) {
  JsonValue v;
  v.t_ = JsonType::kNumber;
  v.num_ = d;
  return v;
}

JsonValue JsonValue::make_string(std::string s) {
  JsonValue v;
  v.t_ = JsonType::kString;
  v.str_ = std::move(s);
  return v;
}

JsonValue JsonValue::make_object() {
  JsonValue v;
  v.t_ = JsonType::kObject;
  return v;
}

JsonValue JsonValue::make_array() {
  JsonValue v;
  v.t_ = JsonType::kArray;
  return v;
}

namespace {

[[noreturn]] void type_mismatch(JsonType want, JsonType got, ErrorSite site) {
  std::string msg = "JSON type mismatch: expected ";
  msg += json_type_name(want);
  msg += ", got ";
  msg += json_type_name(got);
  throw_error(ErrorCode::kParse, std::move(msg), site);
}

}  // namespace

bool JsonValue::as_bool() const {
  if (t_ != JsonType::kBool) type_mismatch(JsonType::kBool, t_, CALFUSE_SITE);
  return b_;
}

double JsonValue::as_number() const {
  if (t_ != JsonType::kNumber) type_mismatch(JsonType::kNumber, t_, CALFUSE_SITE);
  return num_;
}

const std::string& JsonValue::as_string() const {
  if (t_ != JsonType::kString) type_mismatch(JsonType::kString, t_, CALFUSE_SITE);
  return str_;
}

const JsonValue::Object& JsonValue::as_object() const {
  if (t_ != JsonType::kObject) type_mismatch(JsonType::kObject, t_, CALFUSE_SITE);
  return obj_;
}

const JsonValue::Array& JsonValue::as_array() const {
  if (t_ != JsonType::kArray) type_mismatch(JsonType::kArray, t_, CALFUSE_SITE);
  return arr_;
}

const JsonValue* JsonValue::find(std::string_view key) const {
  if (t_ != JsonType::kObject) return nullptr;
  auto it = obj_.find(std::string(key));
  return it == obj_.end() ? nullptr : &it->second;
}

JsonValue& JsonValue::set(std::string key, JsonValue v) {
  if (t_ == JsonType::kNull) t_ = JsonType::kObject;
  if (t_ != JsonType::kObject) type_mismatch(JsonType::kObject, t_, CALFUSE_SITE);
  obj_[std::move(key)] = std::move(v);
  return *this;
}

JsonValue& JsonValue::push_back(JsonValue v) {
  if (t_ == JsonType::kNull) t_ = JsonType::kArray;
  if (t_ != JsonType::kArray) type_mismatch(JsonType::kArray, t_, CALFUSE_SITE);
  arr_.emplace_back(std::move(v));
  return *this;
}

// ----------------------------- Parser ----------------------------------------

namespace {

// Input cursor plus line/column tracking. Every consumed byte goes through advance().
struct Reader {
  const char* b = nullptr;
  const char* p = nullptr;
  const char* e = nullptr;
  int line = 1;
  int col = 1;
  JsonParseError* err = nullptr;
  int depth = 0;

  bool eof() const { return p >= e; }
  char peek() const { return *p; }

  void advance() {
    if (*p == '\n') { line++; col = 1; }
    else { col++; }
    ++p;
  }

  bool fail(std::string msg) {
    if (err) {
      err->message = std::move(msg);
      err->offset = static_cast<size_t>(p - b);
      err->line = line;
      err->col = col;
    }
    return false;
  }

  void skip_ws() {
    while (!eof()) {
      const char c = *p;
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') advance();
      else break;
    }
  }

  bool consume(char ch) {
    skip_ws();
    if (eof() || *p != ch) return fail(std::string("Expected '") + ch + "'");
    advance();
    return true;
  }

  bool literal(const char* lit) {
    const char* q = p;
    for (const char* s = lit; *s; ++s, ++q) {
      if (q >= e || *q != *s) return fail("Invalid literal");
    }
    while (p < q) advance();
    return true;
  }
};

// Nesting bound keeps recursion finite on hostile input.
constexpr int kMaxDepth = 256;

bool read_hex4(Reader& r, unsigned& out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    if (r.eof()) return r.fail("Unexpected EOF in \\uXXXX escape");
    const char ch = r.peek();
    unsigned v = 0;
    if (ch >= '0' && ch <= '9') v = static_cast<unsigned>(ch - '0');
    else if (ch >= 'a' && ch <= 'f') v = 10u + static_cast<unsigned>(ch - 'a');
    else if (ch >= 'A' && ch <= 'F') v = 10u + static_cast<unsigned>(ch - 'A');
    else return r.fail("Invalid hex digit in \\uXXXX escape");
    out = (out << 4) | v;
    r.advance();
  }
  return true;
}

void append_utf8(std::string& s, unsigned cp) {
  if (cp <= 0x7F) {
    s.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    s.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    s.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    s.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool read_unicode_escape(Reader& r, std::string& out) {
  unsigned u = 0;
  if (!read_hex4(r, u)) return false;

  if (u >= 0xDC00 && u <= 0xDFFF) return r.fail("Unexpected low surrogate");
  if (u < 0xD800 || u > 0xDBFF) {
    append_utf8(out, u);
    return true;
  }

  // High surrogate: a \uDC00..\uDFFF escape must follow.
  if (r.eof() || r.peek() != '\\') return r.fail("High surrogate not followed by low surrogate");
  r.advance();
  if (r.eof() || r.peek() != 'u') return r.fail("High surrogate not followed by \\u");
  r.advance();

  unsigned lo = 0;
  if (!read_hex4(r, lo)) return false;
  if (lo < 0xDC00 || lo > 0xDFFF) return r.fail("Invalid low surrogate");

  append_utf8(out, 0x10000u + (((u - 0xD800u) << 10) | (lo - 0xDC00u)));
  return true;
}

bool read_string(Reader& r, std::string& out) {
  r.skip_ws();
  if (r.eof() || r.peek() != '"') return r.fail("Expected string");
  r.advance();
  out.clear();

  while (!r.eof()) {
    const char ch = r.peek();
    if (ch == '"') {
      r.advance();
      return true;
    }
    if (static_cast<unsigned char>(ch) < 0x20) return r.fail("Unescaped control character in string");

    if (ch != '\\') {
      out.push_back(ch);
      r.advance();
      continue;
    }

    r.advance();
    if (r.eof()) return r.fail("Unexpected EOF in string escape");
    const char esc = r.peek();
    r.advance();
    switch (esc) {
      case '"':  out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/':  out.push_back('/'); break;
      case 'b':  out.push_back('\b'); break;
      case 'f':  out.push_back('\f'); break;
      case 'n':  out.push_back('\n'); break;
      case 'r':  out.push_back('\r'); break;
      case 't':  out.push_back('\t'); break;
      case 'u':
        if (!read_unicode_escape(r, out)) return false;
        break;
      default:
        return r.fail("Invalid escape sequence");
    }
  }
  return r.fail("Unterminated string");
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool read_number(Reader& r, double& out) {
  r.skip_ws();
  const char* start = r.p;

  if (!r.eof() && r.peek() == '-') r.advance();
  if (r.eof()) return r.fail("Expected digits after '-'");

  if (r.peek() == '0') {
    r.advance();
  } else if (r.peek() >= '1' && r.peek() <= '9') {
    while (!r.eof() && is_digit(r.peek())) r.advance();
  } else {
    return r.fail("Invalid number");
  }

  if (!r.eof() && r.peek() == '.') {
    r.advance();
    if (r.eof() || !is_digit(r.peek())) return r.fail("Expected digits after '.'");
    while (!r.eof() && is_digit(r.peek())) r.advance();
  }

  if (!r.eof() && (r.peek() == 'e' || r.peek() == 'E')) {
    r.advance();
    if (!r.eof() && (r.peek() == '+' || r.peek() == '-')) r.advance();
    if (r.eof() || !is_digit(r.peek())) return r.fail("Expected digits in exponent");
    while (!r.eof() && is_digit(r.peek())) r.advance();
  }

  // from_chars ignores the C locale, so "0.5" means the same thing under any
  // LC_NUMERIC. Overflow and underflow past the double range are both rejected.
  double v = 0.0;
  const auto res = std::from_chars(start, r.p, v);
  if (res.ec == std::errc::result_out_of_range) return r.fail("Number out of range");
  if (res.ec != std::errc() || res.ptr != r.p) return r.fail("Failed to parse number");
  if (!std::isfinite(v)) return r.fail("Number out of range");
  out = v;
  return true;
}

bool read_value(Reader& r, JsonValue& out);

bool read_array(Reader& r, JsonValue& out) {
  if (!r.consume('[')) return false;
  out = JsonValue::make_array();

  r.skip_ws();
  if (!r.eof() && r.peek() == ']') {
    r.advance();
    return true;
  }

  while (true) {
    JsonValue v;
    if (!read_value(r, v)) return false;
    out.push_back(std::move(v));

    r.skip_ws();
    if (r.eof()) return r.fail("Unexpected EOF in array");
    if (r.peek() == ',') { r.advance(); continue; }
    if (r.peek() == ']') { r.advance(); return true; }
    return r.fail("Expected ',' or ']'");
  }
}

bool read_object(Reader& r, JsonValue& out) {
  if (!r.consume('{')) return false;
  out = JsonValue::make_object();

  r.skip_ws();
  if (!r.eof() && r.peek() == '}') {
    r.advance();
    return true;
  }

  while (true) {
    std::string key;
    if (!read_string(r, key)) return false;
    if (out.find(key) != nullptr) return r.fail("Duplicate object key: " + key);
    if (!r.consume(':')) return false;

    JsonValue val;
    if (!read_value(r, val)) return false;
    out.set(std::move(key), std::move(val));

    r.skip_ws();
    if (r.eof()) return r.fail("Unexpected EOF in object");
    if (r.peek() == ',') { r.advance(); continue; }
    if (r.peek() == '}') { r.advance(); return true; }
    return r.fail("Expected ',' or '}'");
  }
}

bool read_value(Reader& r, JsonValue& out) {
  r.skip_ws();
  if (r.eof()) return r.fail("Unexpected EOF");

  const char ch = r.peek();
  if (ch == '{' || ch == '[') {
    if (++r.depth > kMaxDepth) return r.fail("Nesting too deep");
    const bool ok = (ch == '{') ? read_object(r, out) : read_array(r, out);
    --r.depth;
    return ok;
  }
  if (ch == '"') {
    std::string s;
    if (!read_string(r, s)) return false;
    out = JsonValue::make_string(std::move(s));
    return true;
  }
  if (ch == 't') {
    if (!r.literal("true")) return false;
    out = JsonValue::make_bool(true);
    return true;
  }
  if (ch == 'f') {
    if (!r.literal("false")) return false;
    out = JsonValue::make_bool(false);
    return true;
  }
  if (ch == 'n') {
    if (!r.literal("null")) return false;
    out = JsonValue::make_null();
    return true;
  }
  if (ch == '-' || is_digit(ch)) {
    double d = 0.0;
    if (!read_number(r, d)) return false;
    out = JsonValue::make_number(d);
    return true;
  }
  return r.fail("Unexpected token");
}

}  // namespace

bool parse_json(std::string_view json, JsonValue* out, JsonParseError* err) {
  if (!out) return false;

  Reader r;
  r.b = json.data();
  r.p = json.data();
  r.e = json.data() + json.size();
  r.err = err;

  JsonValue root;
  if (!read_value(r, root)) return false;

  r.skip_ws();
  if (!r.eof()) return r.fail("Trailing characters after JSON");

  *out = std::move(root);
  return true;
}

bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err) {
  std::ostringstream ss;
  ss << is.rdbuf();
  const std::string buf = ss.str();
  return parse_json(std::string_view(buf), out, err);
}

std::string read_text_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw IoError("cannot open file: " + path, CALFUSE_SITE);
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) throw IoError("failed reading file: " + path, CALFUSE_SITE);
  return ss.str();
}

}  // namespace calfuse
