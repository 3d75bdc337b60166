#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace ride_dispatch
{

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn = std::function<TimePoint()>;

// Signed difference to - from, in fractional minutes.
double minutes_between(TimePoint from, TimePoint to);

std::string format_timestamp(TimePoint at);

} // namespace ride_dispatch
