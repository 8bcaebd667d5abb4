#include "engine/core/clock.hpp"

#include <cstdint>
#include <cstdio>
#include <ctime>

namespace calfuse {
namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's algorithm).
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

constexpr int kMinParseYear = 1678;
constexpr int kMaxParseYear = 2261;

bool is_leap(int y) {
  return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

unsigned days_in_month(int y, unsigned m) {
  static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && is_leap(y)) return 29;
  return kDays[m - 1];
}

bool read_fixed_digits(std::string_view s, size_t pos, size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (size_t i = pos; i < pos + n; ++i) {
    const char c = s[i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

}  // namespace

Timestamp system_now() {
  return std::chrono::system_clock::now();
}

Clock fixed_clock(Timestamp at) {
  return [at]() { return at; };
}

std::string format_utc_iso8601(Timestamp t) {
  using namespace std::chrono;
  const auto ms_total = duration_cast<milliseconds>(t.time_since_epoch()).count();
  int64_t secs = ms_total / 1000;
  int64_t ms = ms_total % 1000;
  if (ms < 0) {
    ms += 1000;
    secs -= 1;
  }

  const std::time_t tt = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&tt, &tm);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

std::optional<Timestamp> parse_utc_iso8601(std::string_view s) {
  int year = 0, mon = 0, day = 0, hh = 0, mm = 0, ss = 0;
  if (s.size() < 20) return std::nullopt;
  if (!read_fixed_digits(s, 0, 4, year) || s[4] != '-' ||
      !read_fixed_digits(s, 5, 2, mon) || s[7] != '-' ||
      !read_fixed_digits(s, 8, 2, day) || s[10] != 'T' ||
      !read_fixed_digits(s, 11, 2, hh) || s[13] != ':' ||
      !read_fixed_digits(s, 14, 2, mm) || s[16] != ':' ||
      !read_fixed_digits(s, 17, 2, ss)) {
    return std::nullopt;
  }
  // A nanosecond system_clock spans 1677-09-21 to 2262-04-11; the year window
  // keeps the accepted set the same on every standard library.
  if (year < kMinParseYear || year > kMaxParseYear) return std::nullopt;
  if (mon < 1 || mon > 12) return std::nullopt;
  if (day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(mon))) return std::nullopt;
  if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;

  size_t pos = 19;
  int ms = 0;
  if (s[pos] == '.') {
    ++pos;
    size_t digits = 0;
    int scale = 100;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (digits < 3) {
        ms += (s[pos] - '0') * scale;
        scale /= 10;
      }
      ++digits;
      ++pos;
    }
    if (digits == 0 || digits > 9) return std::nullopt;
  }
  if (pos + 1 != s.size() || s[pos] != 'Z') return std::nullopt;

  const int64_t days = days_from_civil(year, static_cast<unsigned>(mon), static_cast<unsigned>(day));
  const int64_t secs = days * 86400 + hh * 3600 + mm * 60 + ss;

  return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds{secs * 1000 + ms})};
}

}  // namespace calfuse
