#include "ride_dispatch/fare.hpp"

#include <algorithm>
#include <cmath>

#include "ride_dispatch/geometry.hpp"

namespace ride_dispatch
{

FareBreakdown calculate_fare(double distance_km, double duration_minutes, double wait_minutes, const PricingConfig &pricing)
{
    FareBreakdown fare;
    fare.distance_km = std::max(0.0, distance_km);
    fare.duration_minutes = std::max(0.0, duration_minutes);
    fare.wait_minutes = std::max(0.0, wait_minutes);

    fare.base = pricing.base_fare;
    fare.distance_component = fare.distance_km * pricing.rate_per_km;
    fare.time_component = fare.duration_minutes * pricing.rate_per_minute;
    fare.waiting_component = fare.wait_minutes * pricing.waiting_charge_per_minute;
    fare.total = fare.base + fare.distance_component + fare.time_component + fare.waiting_component;
    return fare;
}

FareBreakdown calculate_fare(const Ride &ride, const PricingConfig &pricing)
{
    const double distance_km = haversine_km(ride.pickup, ride.dropoff);

    double duration_minutes = 0.0;
    if (ride.started_at && ride.ended_at)
    {
        duration_minutes = minutes_between(*ride.started_at, *ride.ended_at);
    }

    double wait_minutes = 0.0;
    if (ride.arrived_at && ride.started_at)
    {
        wait_minutes = minutes_between(*ride.arrived_at, *ride.started_at);
    }

    return calculate_fare(distance_km, duration_minutes, wait_minutes, pricing);
}

double round_to_cents(double amount)
{
    return std::round(amount * 100.0) / 100.0;
}

} // namespace ride_dispatch
