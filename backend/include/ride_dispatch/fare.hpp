#pragma once

#include "types.hpp"

namespace ride_dispatch
{

// base + distance * per_km + duration * per_minute + wait * per_wait_minute.
// Negative inputs are clamped to zero.
FareBreakdown calculate_fare(double distance_km, double duration_minutes, double wait_minutes, const PricingConfig &pricing);

// Uses pickup/drop-off distance, start->end duration and arrival->start wait.
// Missing timestamps contribute zero minutes.
FareBreakdown calculate_fare(const Ride &ride, const PricingConfig &pricing);

double round_to_cents(double amount);

} // namespace ride_dispatch
