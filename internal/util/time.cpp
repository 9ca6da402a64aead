#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace keyshop::util {

TimePoint Now() {
  return Clock::now();
}

NowFn SystemNow() {
  return [] { return Clock::now(); };
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

int64_t NowMs() {
  return ToUnixMillis(Now());
}

std::string FormatIso8601(int64_t ms) {
  std::time_t secs   = static_cast<std::time_t>(ms / 1000);
  int         millis = static_cast<int>(ms % 1000);
  if (millis < 0) {
    millis += 1000;
    secs -= 1;
  }

  std::tm tm{};
  gmtime_r(&secs, &tm);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                tm.tm_sec, millis);
  return buf;
}

std::optional<int64_t> ParseIso8601(std::string_view text) {
  const std::string s(text);

  std::tm tm{};
  int     consumed = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
    return std::nullopt;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;

  int64_t millis = 0;
  size_t  pos    = static_cast<size_t>(consumed);
  if (pos < s.size() && s[pos] == '.') {
    int digits = 0;
    ++pos;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (digits < 3) millis = millis * 10 + (s[pos] - '0');
      ++digits;
      ++pos;
    }
    for (; digits < 3; ++digits) millis *= 10;
  }
  if (pos < s.size() && s[pos] != 'Z') return std::nullopt;

  return static_cast<int64_t>(timegm(&tm)) * 1000 + millis;
}

} // namespace keyshop::util
