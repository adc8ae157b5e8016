#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace sandbox::util {

/*
  Time utilities. Components that make decisions on elapsed time take a
  NowFn so tests can drive the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMillis(const NowFn& now);

} // namespace sandbox::util
