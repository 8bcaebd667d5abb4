#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace calfuse {

using Timestamp = std::chrono::system_clock::time_point;

// Injectable time source. The manifest takes one so tests can pin timestamps.
using Clock = std::function<Timestamp()>;

Timestamp system_now();

// Clock that always returns `at`.
Clock fixed_clock(Timestamp at);

// "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC, millisecond precision).
std::string format_utc_iso8601(Timestamp t);

// Accepts "YYYY-MM-DDTHH:MM:SSZ" with an optional fraction (".d" up to 9 digits,
// truncated to milliseconds). Only the 'Z' suffix is accepted, and only years
// 1678 to 2261, the range a nanosecond Timestamp can hold.
std::optional<Timestamp> parse_utc_iso8601(std::string_view s);

}  // namespace calfuse
