#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace cloudstrap::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixSeconds(TimePoint tp);
uint64_t ToUnixMillis(TimePoint tp);

// strftime-style formatting in local time ("%Y-%m-%d %H:%M:%S").
std::string FormatLocal(TimePoint tp, const char* format);

// strftime-style formatting in UTC.
std::string FormatUtc(TimePoint tp, const char* format);

} // namespace cloudstrap::util
