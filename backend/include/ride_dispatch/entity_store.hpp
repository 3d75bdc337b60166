#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "spatial_index.hpp"
#include "types.hpp"

namespace ride_dispatch
{

// Sole owner of rider, driver, ride and pricing records. Readers receive copies;
// every mutation goes through a status-guarded write under the store lock, so
// the dispatcher and externally triggered transitions can run concurrently.
class EntityStore
{
public:
    explicit EntityStore(EligibilityRules rules = {}, ClockFn clock = Clock::now);

    EntityStore(const EntityStore &) = delete;
    EntityStore &operator=(const EntityStore &) = delete;

    TimePoint now() const;
    const EligibilityRules &rules() const { return rules_; }

    long add_rider(const std::string &name, const GeoPoint &home);
    long add_driver(const std::string &name, const GeoPoint &position);
    long create_ride(long rider_id, const GeoPoint &pickup, const GeoPoint &dropoff);
    long create_ride(long rider_id, const GeoPoint &pickup, const GeoPoint &dropoff, TimePoint created_at);

    void put_pricing_config(const std::string &key, const PricingConfig &pricing);
    std::optional<PricingConfig> find_pricing_config(const std::string &key) const;

    std::optional<Rider> find_rider(long rider_id) const;
    std::optional<Driver> find_driver(long driver_id) const;
    std::optional<Ride> find_ride(long ride_id) const;

    std::vector<Rider> list_riders() const;
    std::vector<Driver> list_drivers() const;
    std::vector<Ride> list_rides() const;

    // Rides in create_ride, oldest first (ties broken by id).
    std::vector<Ride> list_pending_rides() const;

    // Idle drivers within radius_km of center, nearest first (ties broken by id).
    std::vector<DriverCandidate> list_drivers_within(const GeoPoint &center, double radius_km) const;

    // Guarded writes. Each returns false, leaving both records untouched, when the
    // current status of the ride (or its driver) no longer matches the expectation.
    bool try_assign(long ride_id, long driver_id, RideStatus expected_ride_status, DriverStatus expected_driver_status);
    bool try_mark_driver_arrived(long ride_id, TimePoint at);
    bool try_start_ride(long ride_id, TimePoint at);
    bool try_complete_ride(long ride_id, TimePoint at, const FareBreakdown &fare);
    bool try_cancel_ride(long ride_id, TimePoint at, CancellationSource source);

private:
    using RideMutation = std::function<void(Ride &, Driver *)>;

    bool guarded_ride_update(long ride_id, RideStatus target,
                             std::optional<DriverStatus> expected_driver_status,
                             const RideMutation &mutate);
    void refresh_index_locked() const;

    EligibilityRules rules_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<long, Rider> riders_;
    std::map<long, Driver> drivers_;
    std::map<long, Ride> rides_;
    std::unordered_map<std::string, PricingConfig> pricing_;

    mutable SpatialIndex driver_index_;
    mutable bool index_dirty_{true};

    long next_rider_id_{1};
    long next_driver_id_{1};
    long next_ride_id_{1};
};

} // namespace ride_dispatch
