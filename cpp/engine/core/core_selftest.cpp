/*
  Core selftest: JSON reader/writer, digests, clock, logging.

  Framework-free; run as ./core_selftest, non-zero exit on failure.
*/

#include <chrono>
#include <clocale>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/canonical_json.hpp"
#include "engine/core/clock.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/json_reader.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"

namespace calfuse {
namespace {

using selftest::Report;

JsonValue parse_ok(Report& r, const std::string& text) {
  JsonValue v;
  JsonParseError err;
  if (!parse_json(text, &v, &err)) r.fail("parse failed for " + text + ": " + err.to_string());
  return v;
}

bool parse_rejects(const std::string& text) {
  JsonValue v;
  return !parse_json(text, &v);
}

void test_json_parse(Report& r) {
  const JsonValue v = parse_ok(r, R"({"a": [1, 2.5, -3e2], "b": {"c": null, "d": true}, "s": "x\ty"})");
  r.check(v.is_object(), "root is object");
  const JsonValue* a = v.find("a");
  r.check(a && a->is_array() && a->as_array().size() == 3, "array of three");
  if (a && a->is_array() && a->as_array().size() == 3) {
    r.check(a->as_array()[2].as_number() == -300.0, "exponent number");
  }
  const JsonValue* b = v.find("b");
  r.check(b && b->find("c") && b->find("c")->is_null(), "nested null");
  r.check(b && b->find("d") && b->find("d")->as_bool(), "nested bool");
  r.check(v.find("s") && v.find("s")->as_string() == "x\ty", "escaped tab");
  r.check(v.find("missing") == nullptr, "absent key");

  const JsonValue u = parse_ok(r, R"("\u00e9\ud83d\ude00")");
  r.check(u.as_string() == "\xC3\xA9\xF0\x9F\x98\x80", "unicode escapes decode to utf-8");

  r.check(parse_rejects(R"({"a":1,"a":2})"), "duplicate key rejected");
  r.check(parse_rejects("[1,2,]"), "trailing comma rejected");
  r.check(parse_rejects("NaN"), "NaN literal rejected");
  r.check(parse_rejects("{} x"), "trailing garbage rejected");
  r.check(parse_rejects(R"("\udc00")"), "lone low surrogate rejected");
  r.check(parse_rejects("// c\n{}"), "comments rejected");
  r.check(parse_rejects(std::string(300, '[') + std::string(300, ']')), "nesting bound");
  r.check(!parse_rejects(std::string(100, '[') + std::string(100, ']')), "moderate nesting accepted");

  r.check(parse_rejects("1e400"), "overflowing number rejected");
  r.check(parse_rejects("1e-400"), "underflowing number rejected");
  r.check(parse_ok(r, "0.1").as_number() == 0.1, "decimal parses to the nearest double");

  // A comma-decimal locale must not change how numbers parse.
  if (std::setlocale(LC_NUMERIC, "de_DE.UTF-8") != nullptr) {
    r.check(parse_ok(r, "[0.5, 2.25e1]").as_array()[1].as_number() == 22.5, "numbers ignore LC_NUMERIC");
    std::setlocale(LC_NUMERIC, "C");
  }

  JsonValue out;
  JsonParseError err;
  r.check(!parse_json("{\n  \"a\": }", &out, &err), "missing value rejected");
  r.check(err.line == 2, "error line reported");
  r.check(!err.message.empty(), "error message reported");

  std::istringstream is(R"([true, false])");
  JsonValue sv;
  r.check(parse_json(is, &sv) && sv.as_array().size() == 2, "stream overload");

  const bool mismatch = selftest::throws_as<Error>(r, "as_number on string", [&] {
    (void)v.find("s")->as_number();
  });
  r.check(mismatch, "typed accessor throws on mismatch");
}

void test_json_write(Report& r) {
  const JsonValue v = parse_ok(r, R"({ "b" : 1, "a" : [ true, null, "q\"\n" ] })");
  r.check(to_canonical_json(v) == R"({"a":[true,null,"q\"\n"],"b":1})", "canonical form is key-sorted and compact");

  const JsonValue w = parse_ok(r, R"({"a":[true,null,"q\"\n"],"b":1})");
  r.check(to_canonical_json(v) == to_canonical_json(w), "canonical form ignores key order and whitespace");

  r.check(format_json_number(0.1) == "0.1", "shortest round-trip double");
  r.check(format_json_number(100.0) == "100", "integral double");
  r.check(format_json_number(-0.0) == "0", "negative zero folds");
  r.check(selftest::throws_as<Error>(r, "nan", [] {
            (void)format_json_number(std::numeric_limits<double>::quiet_NaN());
          }),
          "non-finite number refused");

  r.check(escape_json(std::string("\x01", 1)) == "\\u0001", "control char escaped");

  JsonValue built = JsonValue::make_object();
  built.set("z", JsonValue::make_number(2));
  built.set("k", JsonValue::make_array());
  JsonWriteOptions pretty;
  pretty.pretty = true;
  r.check(to_json(built, pretty) == "{\n  \"k\": [],\n  \"z\": 2\n}", "pretty output");

  JsonValue reparsed;
  r.check(parse_json(to_json(built, pretty), &reparsed) &&
              to_canonical_json(reparsed) == to_canonical_json(built),
          "pretty output parses back");
}

void test_hashing(Report& r) {
  r.check(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256 empty");
  r.check(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256 abc");

  Sha256 h;
  h.update("a");
  h.update("bc");
  r.check(to_hex(h.finish()) == sha256_hex("abc"), "incremental sha256");
  h.update("abc");
  r.check(to_hex(h.finish()) == sha256_hex("abc"), "hasher reusable after finish");

  r.check(hmac_sha256_hex("Jefe", "what do ya want for nothing?") ==
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
          "hmac-sha256 known answer");
  r.check(selftest::throws_as<SignatureError>(r, "empty key", [] { (void)hmac_sha256_hex("", "x"); }),
          "empty hmac key refused");

  r.check(constant_time_equal("abcd", "abcd"), "equal strings");
  r.check(!constant_time_equal("abcd", "abce"), "different strings");
  r.check(!constant_time_equal("abc", "abcd"), "different lengths");

  r.check(is_hex_string("00ffAB"), "hex accepted");
  r.check(!is_hex_string(""), "empty is not hex");
  r.check(!is_hex_string("0g"), "non-hex rejected");
}

void test_clock(Report& r) {
  const Timestamp epoch{};
  r.check(format_utc_iso8601(epoch + std::chrono::milliseconds(1500)) == "1970-01-01T00:00:01.500Z",
          "epoch formatting");

  const auto t = parse_utc_iso8601("2024-03-15T12:30:00Z");
  r.check(t.has_value(), "plain timestamp parses");
  if (t) r.check(format_utc_iso8601(*t) == "2024-03-15T12:30:00.000Z", "timestamp round trip");

  const auto leap = parse_utc_iso8601("2024-02-29T23:59:59.123456Z");
  r.check(leap.has_value(), "leap day with fraction parses");
  if (leap) r.check(format_utc_iso8601(*leap) == "2024-02-29T23:59:59.123Z", "fraction truncated to ms");

  r.check(!parse_utc_iso8601("2024-03-15T12:30:00+01:00"), "offset suffix rejected");
  r.check(!parse_utc_iso8601("2024-03-15 12:30:00Z"), "space separator rejected");
  r.check(!parse_utc_iso8601(""), "empty rejected");
  r.check(!parse_utc_iso8601("2300-01-01T00:00:00Z"), "year past the clock range rejected");
  r.check(!parse_utc_iso8601("1600-01-01T00:00:00Z"), "year before the clock range rejected");
  const auto late = parse_utc_iso8601("2200-12-31T23:59:59.999Z");
  r.check(late && format_utc_iso8601(*late) == "2200-12-31T23:59:59.999Z", "late in-range year round trips");

  const Clock c = fixed_clock(*t);
  r.check(c() == *t && c() == *t, "fixed clock is constant");
}

void test_logging(Report& r) {
  std::vector<std::pair<LogLevel, std::string>> seen;
  set_log_sink([&](LogLevel lvl, const std::string& msg) { seen.emplace_back(lvl, msg); });

  set_log_level(LogLevel::WARN);
  log(LogLevel::INFO, "filtered");
  log(LogLevel::ERROR, "kept");
  r.check(seen.size() == 1 && seen[0].first == LogLevel::ERROR && seen[0].second == "kept",
          "level threshold filters");

  // A sink that logs from inside itself must not deadlock.
  seen.clear();
  set_log_sink([&](LogLevel lvl, const std::string& msg) {
    seen.emplace_back(lvl, msg);
    if (msg == "outer") log(LogLevel::ERROR, "inner");
  });
  log(LogLevel::ERROR, "outer");
  r.check(seen.size() == 2 && seen[1].second == "inner", "sink may log re-entrantly");

  set_log_sink([](LogLevel, const std::string&) { throw std::runtime_error("sink down"); });
  log(LogLevel::ERROR, "must not throw");
  ++r.checks;

  set_log_sink(nullptr);
  set_log_level(LogLevel::INFO);

  r.check(parse_log_level("Debug") == LogLevel::DEBUG, "parse debug");
  r.check(parse_log_level("warning") == LogLevel::WARN, "parse warning alias");
  r.check(!parse_log_level("loud"), "unknown level");
  r.check(std::string(log_level_tag(LogLevel::ERROR)) == "ERROR", "level tag");
}

}  // namespace
}  // namespace calfuse

int main() {
  calfuse::selftest::Report r;
  calfuse::test_json_parse(r);
  calfuse::test_json_write(r);
  calfuse::test_hashing(r);
  calfuse::test_clock(r);
  calfuse::test_logging(r);
  return calfuse::selftest::finish(r, "core_selftest");
}
