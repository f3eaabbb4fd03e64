#pragma once

#include <chrono>
#include <cstdint>

namespace modsync::util {

/*
  Time utilities: one place to swap the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixSeconds(TimePoint tp);

} // namespace modsync::util
