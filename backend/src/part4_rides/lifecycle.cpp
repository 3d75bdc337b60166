#include "ride_dispatch/lifecycle.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "ride_dispatch/errors.hpp"
#include "ride_dispatch/fare.hpp"

namespace ride_dispatch
{
namespace
{

Ride require_ride(const EntityStore &store, long ride_id)
{
    auto ride = store.find_ride(ride_id);
    if (!ride)
    {
        throw NotFoundError("Ride", ride_id);
    }
    return *ride;
}

void require_transition(const Ride &ride, RideStatus target)
{
    if (!is_transition_allowed(ride.status, target))
    {
        throw InvalidTransitionError(ride.id, ride.status, target);
    }
}

// A guarded write lost to a concurrent transition; report the status that won.
void throw_conflict(const EntityStore &store, long ride_id, RideStatus target)
{
    const Ride current = require_ride(store, ride_id);
    throw InvalidTransitionError(ride_id, current.status, target);
}

void log_fare(long ride_id, const FareBreakdown &fare, const PricingConfig &pricing)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(2)
        << "Ride " << ride_id << " fare breakdown:\n"
        << "  Base fare: " << fare.base << "\n"
        << "  Distance fare: " << fare.distance_component << " (" << fare.distance_km
        << " km x " << pricing.rate_per_km << "/km)\n"
        << "  Time fare: " << fare.time_component << " (" << fare.duration_minutes
        << " min x " << pricing.rate_per_minute << "/min)\n"
        << "  Waiting fare: " << fare.waiting_component << " (" << fare.wait_minutes
        << " min x " << pricing.waiting_charge_per_minute << "/min)\n"
        << "  Total fare: " << fare.total;
    std::cout << out.str() << std::endl;
}

} // namespace

void mark_driver_arrived(EntityStore &store, long ride_id, TimePoint at)
{
    require_transition(require_ride(store, ride_id), RideStatus::driver_arrived);

    if (!store.try_mark_driver_arrived(ride_id, at))
    {
        throw_conflict(store, ride_id, RideStatus::driver_arrived);
    }
    std::cout << "Ride " << ride_id << " - driver at pickup location." << std::endl;
}

void start_ride(EntityStore &store, long ride_id, TimePoint at)
{
    require_transition(require_ride(store, ride_id), RideStatus::started);

    if (!store.try_start_ride(ride_id, at))
    {
        throw_conflict(store, ride_id, RideStatus::started);
    }
    std::cout << "Ride " << ride_id << " started." << std::endl;
}

FareBreakdown end_ride(EntityStore &store, long ride_id, TimePoint at, const std::string &pricing_key)
{
    Ride ride = require_ride(store, ride_id);
    require_transition(ride, RideStatus::completed);

    const auto pricing = store.find_pricing_config(pricing_key);
    if (!pricing)
    {
        throw ConfigurationMissingError(pricing_key);
    }

    // Pricing inputs other than the end time are fixed once the ride has started.
    ride.ended_at = at;
    const FareBreakdown fare = calculate_fare(ride, *pricing);

    if (!store.try_complete_ride(ride_id, at, fare))
    {
        throw_conflict(store, ride_id, RideStatus::completed);
    }

    std::cout << "Ride " << ride_id << " completed." << std::endl;
    log_fare(ride_id, fare, *pricing);
    return fare;
}

void cancel_ride(EntityStore &store, long ride_id, TimePoint at, CancellationSource source)
{
    require_transition(require_ride(store, ride_id), RideStatus::cancelled);

    if (!store.try_cancel_ride(ride_id, at, source))
    {
        throw_conflict(store, ride_id, RideStatus::cancelled);
    }
    std::cout << "Ride " << ride_id << " cancelled by " << to_string(source) << "." << std::endl;
}

} // namespace ride_dispatch
