#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace beatstore::util {

/*
  Time utilities; the one place that picks the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowUnixMillis();

// UTC, "YYYY-MM-DD HH:MM:SS"
std::string FormatUnixMillis(uint64_t unix_ms);

} // namespace beatstore::util
