#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "config.hpp"
#include "entity_store.hpp"
#include "types.hpp"

namespace ride_dispatch
{

enum class DispatchResult
{
    assigned,
    ride_not_pending,
    no_eligible_driver
};

struct DispatchOutcome
{
    long ride_id{};
    DispatchResult result{DispatchResult::no_eligible_driver};
    std::optional<long> driver_id;
    double radius_km{};
    double distance_km{};
    int lost_races{0};
};

struct DispatchPassReport
{
    std::size_t pending{0};
    std::size_t assigned{0};
    std::size_t exhausted{0};
    std::size_t aborted{0};
    std::size_t failed{0};
    long long elapsed_ms{0};
    std::vector<DispatchOutcome> outcomes;
};

// Expanding-radius search for the nearest eligible idle driver. A lost race on
// the assignment write is retried once at the same radius before expanding.
// Eligibility is judged with store.rules(), the same rules that size each driver's history.
DispatchOutcome dispatch_ride(EntityStore &store, long ride_id, const DispatchConfig &dispatch);

// One dispatch pass over all pending rides in creation order. A failing ride is
// logged and counted; it never stops the rest of the pass.
DispatchPassReport run_dispatch_pass(EntityStore &store, const DispatchConfig &dispatch);

const char *to_string(DispatchResult result);

} // namespace ride_dispatch
