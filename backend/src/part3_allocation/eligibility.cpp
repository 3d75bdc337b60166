#include "ride_dispatch/eligibility.hpp"

namespace ride_dispatch
{

EligibilityVerdict evaluate_eligibility(const Ride &ride, const Driver &driver, TimePoint now, const EligibilityRules &rules)
{
    if (driver.status != DriverStatus::idle || driver.active_ride_id)
    {
        return {false, IneligibilityReason::driver_not_idle};
    }

    // Cooldown covers [completion, completion + cooldown).
    if (const auto completed_at = driver.history.last_completion_with(ride.rider_id))
    {
        if (now < *completed_at + rules.rider_cooldown)
        {
            return {false, IneligibilityReason::recent_ride_with_rider};
        }
    }

    if (driver.history.ends_with_cancellations(rules.cancellation_streak))
    {
        return {false, IneligibilityReason::consecutive_cancellations};
    }

    return {true, IneligibilityReason::none};
}

const char *to_string(IneligibilityReason reason)
{
    switch (reason)
    {
    case IneligibilityReason::none:
        return "none";
    case IneligibilityReason::driver_not_idle:
        return "driver_not_idle";
    case IneligibilityReason::recent_ride_with_rider:
        return "recent_ride_with_rider";
    case IneligibilityReason::consecutive_cancellations:
        return "consecutive_cancellations";
    }
    return "unknown";
}

} // namespace ride_dispatch
