#include "ride_dispatch/entity_store.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ride_dispatch/errors.hpp"
#include "ride_dispatch/fare.hpp"

namespace ride_dispatch
{
namespace
{

void check_point(const GeoPoint &point, const char *what)
{
    if (!std::isfinite(point.lat) || !std::isfinite(point.lon) ||
        std::abs(point.lat) > 90.0 || std::abs(point.lon) > 180.0)
    {
        throw std::invalid_argument(std::string("Invalid ") + what + " coordinate.");
    }
}

template <typename Record>
std::vector<Record> snapshot(const std::map<long, Record> &records)
{
    std::vector<Record> result;
    result.reserve(records.size());
    for (const auto &[id, record] : records)
    {
        result.push_back(record);
    }
    return result;
}

} // namespace

EntityStore::EntityStore(EligibilityRules rules, ClockFn clock)
    : rules_(rules), clock_(std::move(clock))
{
    if (!clock_)
    {
        throw std::invalid_argument("EntityStore requires a clock.");
    }
}

TimePoint EntityStore::now() const
{
    return clock_();
}

long EntityStore::add_rider(const std::string &name, const GeoPoint &home)
{
    check_point(home, "rider home");

    std::lock_guard<std::mutex> lock(mutex_);
    Rider rider;
    rider.id = next_rider_id_++;
    rider.name = name;
    rider.home = home;
    riders_.emplace(rider.id, rider);
    return rider.id;
}

long EntityStore::add_driver(const std::string &name, const GeoPoint &position)
{
    check_point(position, "driver");

    std::lock_guard<std::mutex> lock(mutex_);
    Driver driver;
    driver.id = next_driver_id_++;
    driver.name = name;
    driver.position = position;
    driver.history = DriverHistory(rules_.history_size, rules_.rider_cooldown);
    drivers_.emplace(driver.id, driver);
    index_dirty_ = true;
    return driver.id;
}

long EntityStore::create_ride(long rider_id, const GeoPoint &pickup, const GeoPoint &dropoff)
{
    return create_ride(rider_id, pickup, dropoff, now());
}

long EntityStore::create_ride(long rider_id, const GeoPoint &pickup, const GeoPoint &dropoff, TimePoint created_at)
{
    check_point(pickup, "pickup");
    check_point(dropoff, "drop-off");

    std::lock_guard<std::mutex> lock(mutex_);
    if (riders_.find(rider_id) == riders_.end())
    {
        throw NotFoundError("Rider", rider_id);
    }

    Ride ride;
    ride.id = next_ride_id_++;
    ride.rider_id = rider_id;
    ride.pickup = pickup;
    ride.dropoff = dropoff;
    ride.created_at = created_at;
    rides_.emplace(ride.id, ride);
    return ride.id;
}

void EntityStore::put_pricing_config(const std::string &key, const PricingConfig &pricing)
{
    if (key.empty())
    {
        throw std::invalid_argument("Pricing config key must not be empty.");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    pricing_[key] = pricing;
}

std::optional<PricingConfig> EntityStore::find_pricing_config(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pricing_.find(key);
    if (it == pricing_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Rider> EntityStore::find_rider(long rider_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = riders_.find(rider_id);
    if (it == riders_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Driver> EntityStore::find_driver(long driver_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = drivers_.find(driver_id);
    if (it == drivers_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Ride> EntityStore::find_ride(long ride_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = rides_.find(ride_id);
    if (it == rides_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Rider> EntityStore::list_riders() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot(riders_);
}

std::vector<Driver> EntityStore::list_drivers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot(drivers_);
}

std::vector<Ride> EntityStore::list_rides() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot(rides_);
}

std::vector<Ride> EntityStore::list_pending_rides() const
{
    std::vector<Ride> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[id, ride] : rides_)
        {
            if (ride.status == RideStatus::create_ride)
            {
                pending.push_back(ride);
            }
        }
    }

    std::stable_sort(pending.begin(), pending.end(),
                     [](const Ride &a, const Ride &b)
                     {
                         if (a.created_at != b.created_at)
                         {
                             return a.created_at < b.created_at;
                         }
                         return a.id < b.id;
                     });
    return pending;
}

void EntityStore::refresh_index_locked() const
{
    if (!index_dirty_)
    {
        return;
    }

    std::vector<std::pair<long, GeoPoint>> points;
    points.reserve(drivers_.size());
    for (const auto &[id, driver] : drivers_)
    {
        points.push_back({id, driver.position});
    }

    driver_index_.rebuild(std::move(points));
    index_dirty_ = false;
}

std::vector<DriverCandidate> EntityStore::list_drivers_within(const GeoPoint &center, double radius_km) const
{
    check_point(center, "search center");
    if (!std::isfinite(radius_km) || radius_km < 0.0)
    {
        throw std::invalid_argument("Search radius must be a non-negative number of kilometres.");
    }

    std::vector<DriverCandidate> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refresh_index_locked();

        for (const auto &hit : driver_index_.query_radius(center, radius_km))
        {
            const auto it = drivers_.find(hit.driver_id);
            if (it == drivers_.end() || it->second.status != DriverStatus::idle)
            {
                continue;
            }
            candidates.push_back({it->second, hit.distance_km});
        }
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const DriverCandidate &a, const DriverCandidate &b)
              {
                  if (a.distance_km != b.distance_km)
                  {
                      return a.distance_km < b.distance_km;
                  }
                  return a.driver.id < b.driver.id;
              });
    return candidates;
}

bool EntityStore::try_assign(long ride_id, long driver_id, RideStatus expected_ride_status, DriverStatus expected_driver_status)
{
    std::lock_guard<std::mutex> lock(mutex_);

    const auto ride_it = rides_.find(ride_id);
    if (ride_it == rides_.end())
    {
        throw NotFoundError("Ride", ride_id);
    }
    const auto driver_it = drivers_.find(driver_id);
    if (driver_it == drivers_.end())
    {
        throw NotFoundError("Driver", driver_id);
    }

    Ride &ride = ride_it->second;
    Driver &driver = driver_it->second;

    if (ride.status != expected_ride_status || driver.status != expected_driver_status)
    {
        return false;
    }
    if (!is_transition_allowed(ride.status, RideStatus::assigned) ||
        driver.status != DriverStatus::idle || driver.active_ride_id || ride.driver_id)
    {
        return false;
    }

    ride.status = RideStatus::assigned;
    ride.driver_id = driver.id;
    ride.assigned_at = clock_();
    driver.status = DriverStatus::assigned;
    driver.active_ride_id = ride.id;
    return true;
}

bool EntityStore::guarded_ride_update(long ride_id, RideStatus target,
                                      std::optional<DriverStatus> expected_driver_status,
                                      const RideMutation &mutate)
{
    std::lock_guard<std::mutex> lock(mutex_);

    const auto ride_it = rides_.find(ride_id);
    if (ride_it == rides_.end())
    {
        throw NotFoundError("Ride", ride_id);
    }
    Ride &ride = ride_it->second;

    if (!is_transition_allowed(ride.status, target))
    {
        return false;
    }

    Driver *driver = nullptr;
    if (ride.driver_id)
    {
        const auto driver_it = drivers_.find(*ride.driver_id);
        if (driver_it != drivers_.end())
        {
            driver = &driver_it->second;
        }
    }

    if (expected_driver_status)
    {
        if (!driver || driver->status != *expected_driver_status || driver->active_ride_id != ride.id)
        {
            return false;
        }
    }

    mutate(ride, driver);
    ride.status = target;
    return true;
}

bool EntityStore::try_mark_driver_arrived(long ride_id, TimePoint at)
{
    return guarded_ride_update(ride_id, RideStatus::driver_arrived, DriverStatus::assigned,
                               [at](Ride &ride, Driver *)
                               { ride.arrived_at = at; });
}

bool EntityStore::try_start_ride(long ride_id, TimePoint at)
{
    return guarded_ride_update(ride_id, RideStatus::started, DriverStatus::assigned,
                               [at](Ride &ride, Driver *driver)
                               {
                                   ride.started_at = at;
                                   driver->status = DriverStatus::on_trip;
                               });
}

bool EntityStore::try_complete_ride(long ride_id, TimePoint at, const FareBreakdown &fare)
{
    return guarded_ride_update(ride_id, RideStatus::completed, DriverStatus::on_trip,
                               [&](Ride &ride, Driver *driver)
                               {
                                   ride.ended_at = at;
                                   ride.distance_km = fare.distance_km;
                                   ride.fare = round_to_cents(fare.total);
                                   ride.fare_breakdown = fare;

                                   // Drivers stay at the drop-off until their next ride.
                                   driver->status = DriverStatus::idle;
                                   driver->active_ride_id.reset();
                                   driver->position = ride.dropoff;
                                   driver->last_ride_end = at;
                                   driver->history.record_completion(ride.id, ride.rider_id, at);
                                   index_dirty_ = true;
                               });
}

bool EntityStore::try_cancel_ride(long ride_id, TimePoint at, CancellationSource source)
{
    return guarded_ride_update(ride_id, RideStatus::cancelled, std::nullopt,
                               [at, source](Ride &ride, Driver *driver)
                               {
                                   ride.cancelled_at = at;
                                   ride.cancelled_by = source;

                                   if (!driver || driver->active_ride_id != ride.id)
                                   {
                                       return;
                                   }
                                   driver->status = DriverStatus::idle;
                                   driver->active_ride_id.reset();
                                   if (source == CancellationSource::driver)
                                   {
                                       driver->cancelled_rides++;
                                       driver->history.record_cancellation(ride.id, at);
                                   }
                               });
}

} // namespace ride_dispatch
