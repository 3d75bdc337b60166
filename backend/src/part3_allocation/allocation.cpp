#include "ride_dispatch/allocation.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "ride_dispatch/eligibility.hpp"
#include "ride_dispatch/errors.hpp"

namespace ride_dispatch
{
namespace
{

// Absorbs floating point error when the last radius step lands on the ceiling.
constexpr double kRadiusEpsilon = 1e-9;

std::string format_km(double km)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << km << " km";
    return out.str();
}

struct ExclusionStats
{
    int not_idle{0};
    int recent_ride{0};
    int cancellations{0};
};

std::optional<DriverCandidate> select_closest_eligible(
    const Ride &ride,
    const std::vector<DriverCandidate> &candidates,
    TimePoint now,
    const EligibilityRules &rules,
    ExclusionStats &stats)
{
    std::optional<DriverCandidate> best;

    for (const auto &candidate : candidates)
    {
        const auto verdict = evaluate_eligibility(ride, candidate.driver, now, rules);
        if (!verdict.eligible)
        {
            switch (verdict.reason)
            {
            case IneligibilityReason::driver_not_idle:
                stats.not_idle++;
                break;
            case IneligibilityReason::recent_ride_with_rider:
                stats.recent_ride++;
                break;
            case IneligibilityReason::consecutive_cancellations:
                stats.cancellations++;
                break;
            case IneligibilityReason::none:
                break;
            }
            continue;
        }

        if (!best || candidate.distance_km < best->distance_km ||
            (candidate.distance_km == best->distance_km && candidate.driver.id < best->driver.id))
        {
            best = candidate;
        }
    }

    return best;
}

DispatchOutcome make_outcome(long ride_id, DispatchResult result, double radius_km, int lost_races)
{
    DispatchOutcome outcome;
    outcome.ride_id = ride_id;
    outcome.result = result;
    outcome.radius_km = radius_km;
    outcome.lost_races = lost_races;
    return outcome;
}

bool still_pending(const EntityStore &store, long ride_id)
{
    const auto ride = store.find_ride(ride_id);
    return ride && ride->status == RideStatus::create_ride;
}

void tally(DispatchPassReport &report, const DispatchOutcome &outcome)
{
    switch (outcome.result)
    {
    case DispatchResult::assigned:
        report.assigned++;
        break;
    case DispatchResult::ride_not_pending:
        report.aborted++;
        break;
    case DispatchResult::no_eligible_driver:
        report.exhausted++;
        break;
    }
    report.outcomes.push_back(outcome);
}

} // namespace

DispatchOutcome dispatch_ride(EntityStore &store, long ride_id, const DispatchConfig &dispatch)
{
    const EligibilityRules &rules = store.rules();
    if (!store.find_ride(ride_id))
    {
        throw NotFoundError("Ride", ride_id);
    }

    int lost_races = 0;
    bool retried_at_radius = false;
    int step = 0;
    double radius = dispatch.initial_radius_km;

    while (radius <= dispatch.max_radius_km + kRadiusEpsilon)
    {
        // The ride may have been cancelled or assigned elsewhere since the last iteration.
        const auto ride = store.find_ride(ride_id);
        if (!ride || ride->status != RideStatus::create_ride)
        {
            std::cout << "Ride " << ride_id << " no longer pending, stopping search at "
                      << radius << " km." << std::endl;
            return make_outcome(ride_id, DispatchResult::ride_not_pending, radius, lost_races);
        }

        const auto candidates = store.list_drivers_within(ride->pickup, radius);
        ExclusionStats stats;
        const auto best = select_closest_eligible(*ride, candidates, store.now(), rules, stats);

        if (dispatch.verbose)
        {
            std::cout << "Ride " << ride_id << " - radius " << radius << " km: "
                      << candidates.size() << " idle in range (not_idle=" << stats.not_idle
                      << ", recent_ride=" << stats.recent_ride
                      << ", cancellations=" << stats.cancellations << ")." << std::endl;
        }

        if (best)
        {
            if (store.try_assign(ride_id, best->driver.id, RideStatus::create_ride, DriverStatus::idle))
            {
                std::cout << "Assigned driver " << best->driver.id << " to ride " << ride_id
                          << " at " << format_km(best->distance_km) << "." << std::endl;

                auto outcome = make_outcome(ride_id, DispatchResult::assigned, radius, lost_races);
                outcome.driver_id = best->driver.id;
                outcome.distance_km = best->distance_km;
                return outcome;
            }

            lost_races++;
            std::cout << "Ride " << ride_id << " lost assignment race for driver "
                      << best->driver.id << "." << std::endl;

            if (!still_pending(store, ride_id))
            {
                return make_outcome(ride_id, DispatchResult::ride_not_pending, radius, lost_races);
            }

            if (!retried_at_radius)
            {
                retried_at_radius = true;
                continue;
            }
        }

        retried_at_radius = false;
        step++;
        radius = dispatch.initial_radius_km + step * dispatch.radius_step_km;
    }

    std::cerr << "No eligible driver for ride " << ride_id << " within "
              << dispatch.max_radius_km << " km; ride stays pending." << std::endl;
    return make_outcome(ride_id, DispatchResult::no_eligible_driver, dispatch.max_radius_km, lost_races);
}

DispatchPassReport run_dispatch_pass(EntityStore &store, const DispatchConfig &dispatch)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    DispatchPassReport report;
    const auto pending = store.list_pending_rides();
    report.pending = pending.size();

    std::cout << "Dispatch pass: " << pending.size() << " pending rides." << std::endl;

    if (dispatch.parallel)
    {
        std::vector<std::future<DispatchOutcome>> futures;
        futures.reserve(pending.size());
        for (const auto &ride : pending)
        {
            try
            {
                futures.push_back(std::async(std::launch::async, dispatch_ride, std::ref(store), ride.id,
                                             std::cref(dispatch)));
            }
            catch (const std::system_error &ex)
            {
                // No thread available; the ride is dispatched on this thread when its result is collected.
                std::cerr << "Could not start dispatch thread for ride " << ride.id << ": " << ex.what()
                          << "; running it inline." << std::endl;
                futures.push_back(std::async(std::launch::deferred, dispatch_ride, std::ref(store), ride.id,
                                             std::cref(dispatch)));
            }
        }

        for (std::size_t i = 0; i < futures.size(); ++i)
        {
            try
            {
                tally(report, futures[i].get());
            }
            catch (const std::exception &ex)
            {
                report.failed++;
                std::cerr << "Dispatch failed for ride " << pending[i].id << ": " << ex.what() << std::endl;
            }
        }
    }
    else
    {
        for (const auto &ride : pending)
        {
            try
            {
                tally(report, dispatch_ride(store, ride.id, dispatch));
            }
            catch (const std::exception &ex)
            {
                report.failed++;
                std::cerr << "Dispatch failed for ride " << ride.id << ": " << ex.what() << std::endl;
            }
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    report.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    std::cout << "Dispatch pass complete: " << report.assigned << " assigned, "
              << report.exhausted << " unmatched, " << report.aborted << " aborted, "
              << report.failed << " failed in " << report.elapsed_ms << " ms." << std::endl;
    return report;
}

const char *to_string(DispatchResult result)
{
    switch (result)
    {
    case DispatchResult::assigned:
        return "assigned";
    case DispatchResult::ride_not_pending:
        return "ride_not_pending";
    case DispatchResult::no_eligible_driver:
        return "no_eligible_driver";
    }
    return "unknown";
}

} // namespace ride_dispatch
