#include "ride_dispatch/metrics.hpp"

#include <cstddef>
#include <initializer_list>
#include <map>
#include <utility>
#include <vector>

namespace ride_dispatch
{
namespace
{

struct Accumulator
{
    double wait_total{0.0};
    std::size_t wait_count{0};
    double duration_total{0.0};
    std::size_t duration_count{0};

    void add(const Ride &ride)
    {
        if (ride.arrived_at && ride.started_at)
        {
            wait_total += minutes_between(*ride.arrived_at, *ride.started_at);
            wait_count++;
        }
        if (ride.started_at && ride.ended_at)
        {
            duration_total += minutes_between(*ride.started_at, *ride.ended_at);
            duration_count++;
        }
    }

    double average_wait() const { return wait_count > 0 ? wait_total / wait_count : 0.0; }
    double average_duration() const { return duration_count > 0 ? duration_total / duration_count : 0.0; }
};

} // namespace

SimulationMetrics compute_metrics(const EntityStore &store)
{
    const auto rides = store.list_rides();
    const auto drivers = store.list_drivers();

    SimulationMetrics metrics;
    metrics.total_rides = rides.size();

    for (const RideStatus status : {RideStatus::create_ride, RideStatus::assigned, RideStatus::driver_arrived,
                                    RideStatus::started, RideStatus::completed, RideStatus::cancelled})
    {
        metrics.rides_by_status[to_string(status)] = 0;
    }

    Accumulator overall;
    std::map<long, Accumulator> per_driver_times;
    std::map<long, std::pair<std::size_t, double>> per_driver_fares;

    for (const auto &ride : rides)
    {
        metrics.rides_by_status[to_string(ride.status)]++;

        if (ride.status != RideStatus::completed)
        {
            continue;
        }

        overall.add(ride);
        if (ride.driver_id)
        {
            per_driver_times[*ride.driver_id].add(ride);
            auto &fares = per_driver_fares[*ride.driver_id];
            fares.first++;
            fares.second += ride.fare;
        }
    }

    metrics.completed_rides = metrics.rides_by_status[to_string(RideStatus::completed)];
    metrics.unmatched_rides = metrics.rides_by_status[to_string(RideStatus::create_ride)];
    metrics.cancelled_rides = metrics.rides_by_status[to_string(RideStatus::cancelled)];
    metrics.average_wait_minutes = overall.average_wait();
    metrics.average_duration_minutes = overall.average_duration();

    metrics.drivers.reserve(drivers.size());
    for (const auto &driver : drivers)
    {
        DriverMetrics entry;
        entry.driver_id = driver.id;
        entry.name = driver.name;
        entry.cancelled_rides = driver.cancelled_rides;

        const auto fares_it = per_driver_fares.find(driver.id);
        if (fares_it != per_driver_fares.end())
        {
            entry.completed_rides = fares_it->second.first;
            entry.total_fare = fares_it->second.second;
            entry.average_fare = entry.total_fare / entry.completed_rides;
        }

        const auto times_it = per_driver_times.find(driver.id);
        if (times_it != per_driver_times.end())
        {
            entry.average_wait_minutes = times_it->second.average_wait();
            entry.average_duration_minutes = times_it->second.average_duration();
        }

        metrics.drivers.push_back(entry);
    }

    return metrics;
}

} // namespace ride_dispatch
