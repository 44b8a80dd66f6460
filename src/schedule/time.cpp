#include "almanac/schedule/time.hpp"

#include "almanac/common/fs.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace almanac::schedule {

namespace {

std::string format_local(const Clock::time_point when, const char *pattern) {
  const std::time_t raw = Clock::to_time_t(when);
  std::tm local{};
  localtime_r(&raw, &local);
  std::ostringstream out;
  out << std::put_time(&local, pattern);
  return out.str();
}

} // namespace

std::optional<Clock::time_point> parse_local_time(const std::string &text) {
  std::string normalized = common::trim(text);
  if (normalized.size() > 10 && normalized[10] == 'T') {
    normalized[10] = ' ';
  }

  std::tm parsed{};
  std::istringstream in(normalized);
  in >> std::get_time(&parsed, "%Y-%m-%d %H:%M");
  if (in.fail()) {
    return std::nullopt;
  }
  if (in.peek() == ':') {
    in.get();
    int seconds = 0;
    in >> seconds;
    if (in.fail() || seconds < 0 || seconds > 60) {
      return std::nullopt;
    }
    parsed.tm_sec = seconds;
  }
  in >> std::ws;
  if (!in.eof()) {
    return std::nullopt;
  }

  const int month = parsed.tm_mon;
  const int day = parsed.tm_mday;
  parsed.tm_isdst = -1;
  const std::time_t epoch = std::mktime(&parsed);
  // mktime normalises overflow such as Feb 30; reject instead of silently shifting.
  if (epoch == static_cast<std::time_t>(-1) || parsed.tm_mon != month || parsed.tm_mday != day) {
    return std::nullopt;
  }
  return Clock::from_time_t(epoch);
}

std::string format_local_minute(const Clock::time_point when) {
  return format_local(when, "%Y-%m-%d %H:%M");
}

std::string format_local_second(const Clock::time_point when) {
  return format_local(when, "%Y-%m-%d %H:%M:%S");
}

} // namespace almanac::schedule
