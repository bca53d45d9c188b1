#pragma once

#include <chrono>
#include <cstdint>

namespace proxicloud::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixSeconds(TimePoint tp);

} // namespace proxicloud::util
