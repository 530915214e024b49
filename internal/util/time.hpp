#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace gate::util {

/*
  Wall-clock helpers. Everything time-related goes through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(int64_t seconds);
uint64_t  ToUnixMillis(TimePoint tp);

// "2024-05-01T12:00:00Z"
std::string ToIso8601(TimePoint tp);
TimePoint   FromIso8601(const std::string& text);

} // namespace gate::util
