#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace booking::util {

/*
  Time utilities: single place to control the clock source.

  Reservation instants are naive campus-local wall-clock times held on the
  system clock's epoch at second resolution. Nothing here applies a time zone.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::sys_seconds;
using Date      = std::chrono::sys_days;

TimePoint Now();

// "YYYY-MM-DDTHH:MM" or "YYYY-MM-DDTHH:MM:SS"; a space may replace 'T'.
std::optional<TimePoint> ParseDateTime(std::string_view text);

// "YYYY-MM-DD"
std::optional<Date> ParseDate(std::string_view text);

// "HH:MM", returned as an offset from midnight.
std::optional<std::chrono::minutes> ParseClock(std::string_view text);

std::string FormatDateTime(TimePoint tp); // YYYY-MM-DDTHH:MM:SS
std::string FormatDate(Date date);        // YYYY-MM-DD
std::string FormatClock(TimePoint tp);    // HH:MM

int64_t   ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(int64_t seconds);

} // namespace booking::util
