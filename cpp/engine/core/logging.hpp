#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
One process-wide logger shared by the loader, the governor,
the manifest and the CLI.

Rules:
  - log() is noexcept. A record that cannot be written is
    dropped with a note on stderr.
  - INFO and DEBUG go to stdout, WARN and ERROR to stderr.
  - An installed sink receives every record that passes the
    level filter instead of the streams. It is called without
    the logger's lock held, so it may call log() itself but
    must do its own locking when several threads log.
===========================================================
*/

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace calfuse {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

using LogSink = std::function<void(LogLevel, const std::string&)>;

// Default INFO.
void set_log_level(LogLevel lvl) noexcept;
LogLevel get_log_level() noexcept;

// Accepts debug, info, warn (or warning) and error in any case.
std::optional<LogLevel> parse_log_level(std::string_view s);

const char* log_level_tag(LogLevel lvl) noexcept;

// An empty sink restores the stream writer.
void set_log_sink(LogSink sink) noexcept;

void log(LogLevel lvl, const std::string& msg) noexcept;

}  // namespace calfuse
