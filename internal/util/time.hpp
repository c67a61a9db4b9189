#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kbsync::util {

/*
  Time utilities. Single place to control the clock source.

  Ledger timestamps are stored as "YYYY-MM-DD HH:MM:SS.ffffff" (UTC), the
  DATETIME text layout existing ledgers already use.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::string              FormatTimestamp(TimePoint tp);
std::optional<TimePoint> ParseTimestamp(std::string_view text);

double   ToUnixSeconds(TimePoint tp);
uint64_t ToUnixMillis(TimePoint tp);

} // namespace kbsync::util
