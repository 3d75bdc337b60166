#pragma once

#include <string>

#include "entity_store.hpp"
#include "types.hpp"

namespace ride_dispatch
{

// Externally triggered ride transitions. Each throws NotFoundError for an unknown
// ride and InvalidTransitionError when the ride's status forbids the transition.

void mark_driver_arrived(EntityStore &store, long ride_id, TimePoint at);
void start_ride(EntityStore &store, long ride_id, TimePoint at);

// Prices the ride with the pricing config stored under pricing_key and completes
// it. Throws ConfigurationMissingError (ride stays started) if there is none.
FareBreakdown end_ride(EntityStore &store, long ride_id, TimePoint at, const std::string &pricing_key);

void cancel_ride(EntityStore &store, long ride_id, TimePoint at, CancellationSource source);

} // namespace ride_dispatch
