#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace gaitrank::util {

/*
  Time utilities. Race dates are UTC wall-clock instants stored as unix seconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::sys_seconds;

TimePoint Now();

// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM" and "YYYY-MM-DD HH:MM:SS" ('T' also separates).
// Throws InvalidArgument on anything else.
TimePoint ParseDate(std::string_view text);

std::string FormatDate(TimePoint tp);
std::string FormatDateTime(TimePoint tp);

int64_t   ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(int64_t seconds);

// Whole days elapsed from `from` to `to`, floored. Negative when `to` precedes `from`.
int64_t DaysBetween(TimePoint from, TimePoint to);

} // namespace gaitrank::util
