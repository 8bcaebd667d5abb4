/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
Line format: [<UTC timestamp>][<LEVEL>] <message>
The timestamp uses the same ISO-8601 form as manifest
entries, so CLI logs and manifests can be lined up.
===========================================================
*/

#include "engine/core/logging.hpp"

#include "engine/core/clock.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <exception>
#include <iostream>
#include <mutex>
#include <utility>

namespace calfuse {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::INFO)};

// Serializes stream writes and guards g_sink.
std::mutex g_write_mu;
LogSink g_sink;

bool passes_filter(LogLevel lvl) noexcept {
  return static_cast<int>(lvl) >= g_min_level.load(std::memory_order_relaxed);
}

void write_to_streams(LogLevel lvl, const std::string& msg) {
  std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
  out << '[' << format_utc_iso8601(system_now()) << "][" << log_level_tag(lvl) << "] " << msg << '\n';
  out.flush();
}

void report_write_failure(const char* detail) noexcept {
  std::fputs("[calfuse] dropped log record", stderr);
  if (detail) {
    std::fputs(": ", stderr);
    std::fputs(detail, stderr);
  }
  std::fputc('\n', stderr);
}

}  // namespace

const char* log_level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::INFO:
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept { g_min_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }

LogLevel get_log_level() noexcept { return static_cast<LogLevel>(g_min_level.load(std::memory_order_relaxed)); }

std::optional<LogLevel> parse_log_level(std::string_view s) {
  std::string name(s);
  for (char& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  if (name == "debug") return LogLevel::DEBUG;
  if (name == "info") return LogLevel::INFO;
  if (name == "warn" || name == "warning") return LogLevel::WARN;
  if (name == "error") return LogLevel::ERROR;
  return std::nullopt;
}

void set_log_sink(LogSink sink) noexcept {
  std::lock_guard<std::mutex> lk(g_write_mu);
  g_sink = std::move(sink);
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (!passes_filter(lvl)) return;
  try {
    LogSink sink;
    {
      std::lock_guard<std::mutex> lk(g_write_mu);
      if (!g_sink) {
        write_to_streams(lvl, msg);
        return;
      }
      sink = g_sink;
    }
    // Outside the lock: a sink may log, and may run on several threads at once.
    sink(lvl, msg);
  } catch (const std::exception& e) {
    report_write_failure(e.what());
  } catch (...) {
    report_write_failure(nullptr);
  }
}

}  // namespace calfuse
