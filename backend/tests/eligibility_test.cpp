#include <gtest/gtest.h>

#include <chrono>

#include "ride_dispatch/driver_history.hpp"
#include "ride_dispatch/eligibility.hpp"
#include "test_support.hpp"

namespace ride_dispatch
{
namespace
{

using std::chrono::minutes;
using std::chrono::seconds;

class EligibilityTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ride.id = 100;
        ride.rider_id = 7;
        driver.id = 1;
        driver.history = DriverHistory(rules.history_size, rules.rider_cooldown);
    }

    EligibilityRules rules;
    Ride ride;
    Driver driver;
    TimePoint t0{std::chrono::hours(1000)};
};

TEST_F(EligibilityTest, IdleDriverWithNoHistoryIsEligible)
{
    const auto verdict = evaluate_eligibility(ride, driver, t0, rules);
    EXPECT_TRUE(verdict.eligible);
    EXPECT_EQ(verdict.reason, IneligibilityReason::none);
}

TEST_F(EligibilityTest, BusyDriverIsIneligible)
{
    driver.status = DriverStatus::assigned;
    driver.active_ride_id = 55;
    auto verdict = evaluate_eligibility(ride, driver, t0, rules);
    EXPECT_FALSE(verdict.eligible);
    EXPECT_EQ(verdict.reason, IneligibilityReason::driver_not_idle);

    driver.status = DriverStatus::on_trip;
    verdict = evaluate_eligibility(ride, driver, t0, rules);
    EXPECT_EQ(verdict.reason, IneligibilityReason::driver_not_idle);
}

TEST_F(EligibilityTest, SameRiderCooldownWindow)
{
    driver.history.record_completion(10, ride.rider_id, t0);

    EXPECT_EQ(evaluate_eligibility(ride, driver, t0 + seconds(1), rules).reason,
              IneligibilityReason::recent_ride_with_rider);
    EXPECT_FALSE(evaluate_eligibility(ride, driver, t0 + minutes(15), rules).eligible);
    EXPECT_FALSE(evaluate_eligibility(ride, driver, t0 + minutes(30) - seconds(1), rules).eligible);

    EXPECT_TRUE(evaluate_eligibility(ride, driver, t0 + minutes(30), rules).eligible);
    EXPECT_TRUE(evaluate_eligibility(ride, driver, t0 + minutes(45), rules).eligible);
}

TEST_F(EligibilityTest, CooldownOnlyAppliesToSameRider)
{
    driver.history.record_completion(10, ride.rider_id + 1, t0);
    EXPECT_TRUE(evaluate_eligibility(ride, driver, t0 + minutes(1), rules).eligible);
}

TEST_F(EligibilityTest, TwoTrailingCancellationsExcludeDriver)
{
    driver.history.record_completion(1, 99, t0 - minutes(120));
    driver.history.record_cancellation(2, t0 - minutes(60));
    driver.history.record_cancellation(3, t0 - minutes(30));

    const auto verdict = evaluate_eligibility(ride, driver, t0, rules);
    EXPECT_FALSE(verdict.eligible);
    EXPECT_EQ(verdict.reason, IneligibilityReason::consecutive_cancellations);
}

TEST_F(EligibilityTest, CompletionAmongLastTwoRestoresEligibility)
{
    Driver older_completed = driver;
    older_completed.history.record_cancellation(1, t0 - minutes(90));
    older_completed.history.record_completion(2, 99, t0 - minutes(60));
    older_completed.history.record_cancellation(3, t0 - minutes(30));
    EXPECT_TRUE(evaluate_eligibility(ride, older_completed, t0, rules).eligible);

    Driver newest_completed = driver;
    newest_completed.history.record_cancellation(1, t0 - minutes(90));
    newest_completed.history.record_cancellation(2, t0 - minutes(60));
    newest_completed.history.record_completion(3, 99, t0 - minutes(45));
    EXPECT_TRUE(evaluate_eligibility(ride, newest_completed, t0, rules).eligible);
}

TEST_F(EligibilityTest, SingleCancellationIsNotEnough)
{
    driver.history.record_cancellation(1, t0 - minutes(5));
    EXPECT_TRUE(evaluate_eligibility(ride, driver, t0, rules).eligible);
}

TEST_F(EligibilityTest, ReasonFollowsRuleOrder)
{
    driver.history.record_completion(1, ride.rider_id, t0 - minutes(5));
    driver.history.record_cancellation(2, t0 - minutes(4));
    driver.history.record_cancellation(3, t0 - minutes(3));

    EXPECT_EQ(evaluate_eligibility(ride, driver, t0, rules).reason, IneligibilityReason::recent_ride_with_rider);

    driver.status = DriverStatus::assigned;
    EXPECT_EQ(evaluate_eligibility(ride, driver, t0, rules).reason, IneligibilityReason::driver_not_idle);
}

TEST(DriverHistoryTest, RingKeepsOnlyNewestOutcomes)
{
    DriverHistory history(3, minutes(30));
    const TimePoint t0{std::chrono::hours(10)};
    for (long ride_id = 1; ride_id <= 5; ++ride_id)
    {
        history.record_cancellation(ride_id, t0 + minutes(ride_id));
    }

    ASSERT_EQ(history.outcomes().size(), 3u);
    EXPECT_EQ(history.outcomes().front().ride_id, 3);
    EXPECT_EQ(history.outcomes().back().ride_id, 5);
    EXPECT_TRUE(history.ends_with_cancellations(3));
    EXPECT_FALSE(history.ends_with_cancellations(4));
}

TEST(DriverHistoryTest, CooldownIndexDropsExpiredRiders)
{
    DriverHistory history(8, minutes(30));
    const TimePoint t0{std::chrono::hours(10)};

    history.record_completion(1, 11, t0);
    history.record_completion(2, 12, t0 + minutes(10));
    EXPECT_EQ(history.tracked_riders(), 2u);

    history.record_completion(3, 13, t0 + minutes(35));
    EXPECT_FALSE(history.last_completion_with(11).has_value());
    ASSERT_TRUE(history.last_completion_with(12).has_value());
    EXPECT_EQ(*history.last_completion_with(12), t0 + minutes(10));
    EXPECT_EQ(history.tracked_riders(), 2u);
}

TEST(DriverHistoryTest, KeepsLatestCompletionPerRider)
{
    DriverHistory history(8, minutes(30));
    const TimePoint t0{std::chrono::hours(10)};

    history.record_completion(1, 11, t0 + minutes(5));
    history.record_completion(2, 11, t0 + minutes(20));
    EXPECT_EQ(*history.last_completion_with(11), t0 + minutes(20));
}

} // namespace
} // namespace ride_dispatch
