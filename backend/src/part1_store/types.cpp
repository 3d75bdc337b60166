#include "ride_dispatch/types.hpp"

#include <stdexcept>
#include <string>

namespace ride_dispatch
{

const char *to_string(DriverStatus status)
{
    switch (status)
    {
    case DriverStatus::idle:
        return "idle";
    case DriverStatus::assigned:
        return "assigned";
    case DriverStatus::on_trip:
        return "on_trip";
    }
    return "unknown";
}

const char *to_string(RideStatus status)
{
    switch (status)
    {
    case RideStatus::create_ride:
        return "create_ride";
    case RideStatus::assigned:
        return "assigned";
    case RideStatus::driver_arrived:
        return "driver_arrived";
    case RideStatus::started:
        return "started";
    case RideStatus::completed:
        return "completed";
    case RideStatus::cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char *to_string(CancellationSource source)
{
    return source == CancellationSource::driver ? "driver" : "rider";
}

CancellationSource parse_cancellation_source(const std::string &value)
{
    if (value == "rider")
    {
        return CancellationSource::rider;
    }
    if (value == "driver")
    {
        return CancellationSource::driver;
    }
    throw std::invalid_argument("Unknown cancellation source '" + value + "' (expected rider or driver).");
}

bool is_transition_allowed(RideStatus from, RideStatus to)
{
    switch (to)
    {
    case RideStatus::assigned:
        return from == RideStatus::create_ride;
    case RideStatus::driver_arrived:
        return from == RideStatus::assigned;
    case RideStatus::started:
        return from == RideStatus::driver_arrived;
    case RideStatus::completed:
        return from == RideStatus::started;
    case RideStatus::cancelled:
        return from == RideStatus::create_ride || from == RideStatus::assigned || from == RideStatus::driver_arrived;
    case RideStatus::create_ride:
        return false;
    }
    return false;
}

bool is_terminal(RideStatus status)
{
    return status == RideStatus::completed || status == RideStatus::cancelled;
}

} // namespace ride_dispatch
