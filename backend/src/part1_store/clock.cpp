#include "ride_dispatch/clock.hpp"

#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace ride_dispatch
{

double minutes_between(TimePoint from, TimePoint to)
{
    return std::chrono::duration<double, std::ratio<60>>(to - from).count();
}

std::string format_timestamp(TimePoint at)
{
    const std::time_t as_time = Clock::to_time_t(at);

    // std::gmtime returns a shared buffer; format it before releasing the lock.
    static std::mutex gmtime_mutex;
    std::lock_guard<std::mutex> lock(gmtime_mutex);

    char timestamp[64];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&as_time));
    return timestamp;
}

} // namespace ride_dispatch
