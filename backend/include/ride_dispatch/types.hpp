#pragma once

#include <optional>
#include <string>

#include "clock.hpp"
#include "driver_history.hpp"

namespace ride_dispatch
{

struct GeoPoint
{
    double lat{};
    double lon{};
};

enum class DriverStatus
{
    idle,
    assigned,
    on_trip
};

enum class RideStatus
{
    create_ride,
    assigned,
    driver_arrived,
    started,
    completed,
    cancelled
};

enum class CancellationSource
{
    rider,
    driver
};

struct Rider
{
    long id{};
    std::string name;
    GeoPoint home;
};

struct Driver
{
    long id{};
    std::string name;
    GeoPoint position;
    DriverStatus status{DriverStatus::idle};
    std::optional<long> active_ride_id;
    int cancelled_rides{0};
    std::optional<TimePoint> last_ride_end;
    DriverHistory history;
};

struct FareBreakdown
{
    double distance_km{};
    double duration_minutes{};
    double wait_minutes{};
    double base{};
    double distance_component{};
    double time_component{};
    double waiting_component{};
    double total{};
};

struct Ride
{
    long id{};
    long rider_id{};
    GeoPoint pickup;
    GeoPoint dropoff;
    RideStatus status{RideStatus::create_ride};
    std::optional<long> driver_id;
    TimePoint created_at{};
    std::optional<TimePoint> assigned_at;
    std::optional<TimePoint> arrived_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> ended_at;
    std::optional<TimePoint> cancelled_at;
    std::optional<CancellationSource> cancelled_by;
    double distance_km{0.0};
    double fare{0.0};
    std::optional<FareBreakdown> fare_breakdown;
};

struct PricingConfig
{
    double base_fare{20.0};
    double rate_per_km{10.0};
    double rate_per_minute{2.0};
    double waiting_charge_per_minute{1.0};
};

// Idle driver returned by a radius query, with its distance to the query center.
struct DriverCandidate
{
    Driver driver;
    double distance_km{};
};

const char *to_string(DriverStatus status);
const char *to_string(RideStatus status);
const char *to_string(CancellationSource source);
CancellationSource parse_cancellation_source(const std::string &value);

// Ride state machine: create_ride -> assigned -> driver_arrived -> started -> completed,
// with cancelled reachable from create_ride, assigned and driver_arrived.
bool is_transition_allowed(RideStatus from, RideStatus to);
bool is_terminal(RideStatus status);

} // namespace ride_dispatch
