#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace keyshop::util {

/*
  Time utilities: the single place that controls the clock source.

  Components that make time-based decisions take a NowFn so tests can
  drive the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

// Returns Now wrapped as a NowFn; used as the default clock everywhere.
NowFn SystemNow();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

int64_t NowMs();

// "2026-10-18T09:30:00.000Z"
std::string FormatIso8601(int64_t ms);

// UTC only. Fractional seconds are optional.
std::optional<int64_t> ParseIso8601(std::string_view text);

} // namespace keyshop::util
