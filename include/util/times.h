#pragma once

#include <chrono>
#include <string>
#include <string_view>

using SysClock = std::chrono::system_clock;
using LocalTimePoint = std::chrono::local_time<std::chrono::seconds>;

using seconds = std::chrono::seconds;
using days = std::chrono::days;

LocalTimePoint datetime_to_local(std::string_view datetime,
                                 std::string_view fmt = "%F %T");

inline LocalTimePoint date_to_local(std::string_view date) {
  return datetime_to_local(date, "%F");
}

std::string date_to_string(LocalTimePoint tp);

// Calendar date of "now" in UTC, formatted as YYYY-MM-DD.
std::string today_str();
