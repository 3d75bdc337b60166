#include <gtest/gtest.h>

#include <chrono>

#include "ride_dispatch/entity_store.hpp"
#include "ride_dispatch/errors.hpp"
#include "ride_dispatch/fare.hpp"
#include "ride_dispatch/lifecycle.hpp"
#include "test_support.hpp"

namespace ride_dispatch
{
namespace
{

using std::chrono::minutes;
using test_support::north_of;

class LifecycleTest : public ::testing::Test
{
protected:
    LifecycleTest() : store({}, clock.fn())
    {
        PricingConfig pricing;
        pricing.base_fare = 50.0;
        pricing.rate_per_km = 10.0;
        pricing.rate_per_minute = 2.0;
        pricing.waiting_charge_per_minute = 1.0;
        store.put_pricing_config("default", pricing);

        rider = store.add_rider("Rider", pickup);
        driver = store.add_driver("Driver", pickup);
        ride = store.create_ride(rider, pickup, north_of(pickup, 10.0));
    }

    void assign()
    {
        ASSERT_TRUE(store.try_assign(ride, driver, RideStatus::create_ride, DriverStatus::idle));
    }

    test_support::ManualClock clock;
    EntityStore store;
    const GeoPoint pickup{12.9716, 77.5946};
    long rider{};
    long driver{};
    long ride{};
};

TEST_F(LifecycleTest, FullRideComputesFareOnce)
{
    assign();
    const TimePoint t0 = clock.now();

    mark_driver_arrived(store, ride, t0);
    start_ride(store, ride, t0 + minutes(2));
    const FareBreakdown fare = end_ride(store, ride, t0 + minutes(22), "default");

    EXPECT_NEAR(fare.distance_km, 10.0, 1e-9);
    EXPECT_DOUBLE_EQ(fare.duration_minutes, 20.0);
    EXPECT_DOUBLE_EQ(fare.wait_minutes, 2.0);
    EXPECT_NEAR(fare.total, 192.0, 1e-6);

    const auto completed = store.find_ride(ride);
    EXPECT_EQ(completed->status, RideStatus::completed);
    EXPECT_DOUBLE_EQ(completed->fare, 192.0);
    ASSERT_TRUE(completed->fare_breakdown.has_value());

    EXPECT_THROW(end_ride(store, ride, t0 + minutes(30), "default"), InvalidTransitionError);
    EXPECT_DOUBLE_EQ(store.find_ride(ride)->fare, 192.0);
    EXPECT_EQ(store.find_ride(ride)->ended_at, t0 + minutes(22));

    const auto freed = store.find_driver(driver);
    EXPECT_EQ(freed->status, DriverStatus::idle);
    EXPECT_FALSE(freed->active_ride_id.has_value());
}

TEST_F(LifecycleTest, TransitionsCannotSkipSteps)
{
    const TimePoint t0 = clock.now();
    EXPECT_THROW(mark_driver_arrived(store, ride, t0), InvalidTransitionError);
    EXPECT_THROW(start_ride(store, ride, t0), InvalidTransitionError);
    EXPECT_THROW(end_ride(store, ride, t0, "default"), InvalidTransitionError);

    assign();
    EXPECT_THROW(start_ride(store, ride, t0), InvalidTransitionError);
    EXPECT_THROW(end_ride(store, ride, t0, "default"), InvalidTransitionError);
    EXPECT_EQ(store.find_ride(ride)->status, RideStatus::assigned);
}

TEST_F(LifecycleTest, CancelStartedRideIsRejected)
{
    assign();
    const TimePoint t0 = clock.now();
    mark_driver_arrived(store, ride, t0);
    start_ride(store, ride, t0);

    try
    {
        cancel_ride(store, ride, t0, CancellationSource::rider);
        FAIL() << "cancelling a started ride must be rejected";
    }
    catch (const InvalidTransitionError &ex)
    {
        EXPECT_EQ(ex.ride_id(), ride);
        EXPECT_EQ(ex.current(), RideStatus::started);
        EXPECT_EQ(ex.target(), RideStatus::cancelled);
    }

    EXPECT_EQ(store.find_ride(ride)->status, RideStatus::started);
    EXPECT_EQ(store.find_driver(driver)->status, DriverStatus::on_trip);
}

TEST_F(LifecycleTest, CancelAssignedRideFreesDriver)
{
    assign();
    cancel_ride(store, ride, clock.now(), CancellationSource::rider);

    EXPECT_EQ(store.find_ride(ride)->status, RideStatus::cancelled);
    const auto freed = store.find_driver(driver);
    EXPECT_EQ(freed->status, DriverStatus::idle);
    EXPECT_FALSE(freed->active_ride_id.has_value());
}

TEST_F(LifecycleTest, CancelPendingAndArrivedRides)
{
    cancel_ride(store, ride, clock.now(), CancellationSource::rider);
    EXPECT_EQ(store.find_ride(ride)->status, RideStatus::cancelled);
    EXPECT_THROW(cancel_ride(store, ride, clock.now(), CancellationSource::rider), InvalidTransitionError);

    const long second = store.create_ride(rider, pickup, pickup);
    ASSERT_TRUE(store.try_assign(second, driver, RideStatus::create_ride, DriverStatus::idle));
    mark_driver_arrived(store, second, clock.now());
    cancel_ride(store, second, clock.now(), CancellationSource::driver);

    EXPECT_EQ(store.find_ride(second)->status, RideStatus::cancelled);
    EXPECT_EQ(store.find_driver(driver)->status, DriverStatus::idle);
    EXPECT_EQ(store.find_driver(driver)->cancelled_rides, 1);
}

TEST_F(LifecycleTest, MissingPricingKeepsRideStarted)
{
    assign();
    const TimePoint t0 = clock.now();
    mark_driver_arrived(store, ride, t0);
    start_ride(store, ride, t0);

    try
    {
        end_ride(store, ride, t0 + minutes(10), "surge");
        FAIL() << "expected ConfigurationMissingError";
    }
    catch (const ConfigurationMissingError &ex)
    {
        EXPECT_EQ(ex.key(), "surge");
    }

    const auto still_started = store.find_ride(ride);
    EXPECT_EQ(still_started->status, RideStatus::started);
    EXPECT_FALSE(still_started->ended_at.has_value());
    EXPECT_DOUBLE_EQ(still_started->fare, 0.0);
    EXPECT_EQ(store.find_driver(driver)->status, DriverStatus::on_trip);

    end_ride(store, ride, t0 + minutes(10), "default");
    EXPECT_EQ(store.find_ride(ride)->status, RideStatus::completed);
}

TEST_F(LifecycleTest, ClockSkewIsClampedToZero)
{
    assign();
    const TimePoint t0 = clock.now();
    mark_driver_arrived(store, ride, t0);
    start_ride(store, ride, t0 - minutes(3));
    const FareBreakdown fare = end_ride(store, ride, t0 - minutes(10), "default");

    EXPECT_DOUBLE_EQ(fare.duration_minutes, 0.0);
    EXPECT_DOUBLE_EQ(fare.wait_minutes, 0.0);
    EXPECT_NEAR(fare.total, 50.0 + 100.0, 1e-6);
}

TEST_F(LifecycleTest, UnknownRideIsNotFound)
{
    EXPECT_THROW(mark_driver_arrived(store, 404, clock.now()), NotFoundError);
    EXPECT_THROW(cancel_ride(store, 404, clock.now(), CancellationSource::rider), NotFoundError);
}

TEST(RideStateMachineTest, AllowedTransitions)
{
    EXPECT_TRUE(is_transition_allowed(RideStatus::create_ride, RideStatus::assigned));
    EXPECT_TRUE(is_transition_allowed(RideStatus::assigned, RideStatus::driver_arrived));
    EXPECT_TRUE(is_transition_allowed(RideStatus::driver_arrived, RideStatus::started));
    EXPECT_TRUE(is_transition_allowed(RideStatus::started, RideStatus::completed));

    EXPECT_TRUE(is_transition_allowed(RideStatus::create_ride, RideStatus::cancelled));
    EXPECT_TRUE(is_transition_allowed(RideStatus::assigned, RideStatus::cancelled));
    EXPECT_TRUE(is_transition_allowed(RideStatus::driver_arrived, RideStatus::cancelled));
    EXPECT_FALSE(is_transition_allowed(RideStatus::started, RideStatus::cancelled));
    EXPECT_FALSE(is_transition_allowed(RideStatus::completed, RideStatus::cancelled));

    EXPECT_FALSE(is_transition_allowed(RideStatus::create_ride, RideStatus::started));
    EXPECT_FALSE(is_transition_allowed(RideStatus::assigned, RideStatus::create_ride));
    EXPECT_FALSE(is_transition_allowed(RideStatus::cancelled, RideStatus::assigned));
    EXPECT_TRUE(is_terminal(RideStatus::completed));
    EXPECT_TRUE(is_terminal(RideStatus::cancelled));
    EXPECT_FALSE(is_terminal(RideStatus::started));
}

} // namespace
} // namespace ride_dispatch
