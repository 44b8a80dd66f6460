#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace almanac::schedule {

using Clock = std::chrono::system_clock;

/// Parses local wall-clock "YYYY-MM-DD HH:MM" (also accepts a 'T' separator and trailing
/// ":SS").
[[nodiscard]] std::optional<Clock::time_point> parse_local_time(const std::string &text);

/// "YYYY-MM-DD HH:MM" in local time.
[[nodiscard]] std::string format_local_minute(Clock::time_point when);

/// "YYYY-MM-DD HH:MM:SS" in local time.
[[nodiscard]] std::string format_local_second(Clock::time_point when);

} // namespace almanac::schedule
