#include "ride_dispatch/json_codec.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

namespace ride_dispatch
{
namespace
{

using json = nlohmann::json;

template <typename T>
json optional_json(const std::optional<T> &value)
{
    return value ? json(*value) : json();
}

json optional_timestamp(const std::optional<TimePoint> &at)
{
    return at ? json(format_timestamp(*at)) : json();
}

double require_number(const json &body, const std::string &key)
{
    if (!body.contains(key) || !body[key].is_number())
    {
        throw std::invalid_argument("Missing numeric field '" + key + "'.");
    }
    const double value = body[key].get<double>();
    if (!std::isfinite(value))
    {
        throw std::invalid_argument("Field '" + key + "' must be finite.");
    }
    return value;
}

} // namespace

void to_json(json &j, const GeoPoint &point)
{
    j = json{{"lat", point.lat}, {"lon", point.lon}};
}

void to_json(json &j, const Rider &rider)
{
    j = json{
        {"id", rider.id},
        {"name", rider.name},
        {"location", rider.home}};
}

void to_json(json &j, const Driver &driver)
{
    json recent = json::array();
    for (const auto &record : driver.history.outcomes())
    {
        recent.push_back({
            {"ride_id", record.ride_id},
            {"outcome", record.outcome == RideOutcome::completed ? "completed" : "cancelled"},
            {"at", format_timestamp(record.at)}});
    }

    j = json{
        {"id", driver.id},
        {"name", driver.name},
        {"location", driver.position},
        {"status", to_string(driver.status)},
        {"active_ride_id", optional_json(driver.active_ride_id)},
        {"cancelled_rides_count", driver.cancelled_rides},
        {"last_ride_end", optional_timestamp(driver.last_ride_end)},
        {"recent_outcomes", recent}};
}

void to_json(json &j, const FareBreakdown &fare)
{
    j = json{
        {"distance_km", fare.distance_km},
        {"duration_minutes", fare.duration_minutes},
        {"wait_minutes", fare.wait_minutes},
        {"base_fare", fare.base},
        {"distance_fare", fare.distance_component},
        {"time_fare", fare.time_component},
        {"waiting_fare", fare.waiting_component},
        {"total", fare.total}};
}

void to_json(json &j, const Ride &ride)
{
    j = json{
        {"id", ride.id},
        {"rider_id", ride.rider_id},
        {"driver_id", optional_json(ride.driver_id)},
        {"status", to_string(ride.status)},
        {"pickup_location", ride.pickup},
        {"drop_location", ride.dropoff},
        {"created_at", format_timestamp(ride.created_at)},
        {"driver_assigned_at", optional_timestamp(ride.assigned_at)},
        {"driver_at_location_at", optional_timestamp(ride.arrived_at)},
        {"start_ride_at", optional_timestamp(ride.started_at)},
        {"end_ride_at", optional_timestamp(ride.ended_at)},
        {"cancelled_at", optional_timestamp(ride.cancelled_at)},
        {"cancelled_by", ride.cancelled_by ? json(to_string(*ride.cancelled_by)) : json()},
        {"distance_km", ride.distance_km},
        {"fare", ride.fare},
        {"fare_breakdown", optional_json(ride.fare_breakdown)}};
}

void to_json(json &j, const DispatchOutcome &outcome)
{
    j = json{
        {"ride_id", outcome.ride_id},
        {"result", to_string(outcome.result)},
        {"driver_id", optional_json(outcome.driver_id)},
        {"radius_km", outcome.radius_km},
        {"distance_km", outcome.distance_km},
        {"lost_races", outcome.lost_races}};
}

void to_json(json &j, const DispatchPassReport &report)
{
    j = json{
        {"pending", report.pending},
        {"assigned", report.assigned},
        {"unmatched", report.exhausted},
        {"aborted", report.aborted},
        {"failed", report.failed},
        {"elapsed_ms", report.elapsed_ms},
        {"outcomes", report.outcomes}};
}

void to_json(json &j, const DispatchStats &stats)
{
    j = json{
        {"passes_run", stats.passes_run},
        {"passes_skipped", stats.passes_skipped},
        {"pass_failures", stats.pass_failures},
        {"rides_assigned", stats.rides_assigned},
        {"rides_unmatched", stats.rides_exhausted},
        {"rides_aborted", stats.rides_aborted},
        {"ride_failures", stats.ride_failures},
        {"last_pass_ms", stats.last_pass_ms}};
}

void to_json(json &j, const DriverMetrics &metrics)
{
    j = json{
        {"driver_id", metrics.driver_id},
        {"name", metrics.name},
        {"total_rides", metrics.completed_rides},
        {"cancelled_rides", metrics.cancelled_rides},
        {"total_fare", metrics.total_fare},
        {"avg_fare", metrics.average_fare},
        {"avg_wait_time", metrics.average_wait_minutes},
        {"avg_ride_duration", metrics.average_duration_minutes}};
}

void to_json(json &j, const SimulationMetrics &metrics)
{
    j = json{
        {"total_rides", metrics.total_rides},
        {"completed_rides", metrics.completed_rides},
        {"unmatched_rides", metrics.unmatched_rides},
        {"cancelled_rides", metrics.cancelled_rides},
        {"rides_by_status", metrics.rides_by_status},
        {"avg_wait_time", metrics.average_wait_minutes},
        {"avg_ride_duration", metrics.average_duration_minutes},
        {"drivers", metrics.drivers}};
}

GeoPoint geo_point_from_json(const json &body, const std::string &prefix)
{
    if (!body.is_object())
    {
        throw std::invalid_argument("Request body must be a JSON object.");
    }

    const std::string lat_key = prefix.empty() ? "lat" : prefix + "_lat";
    const std::string lon_key = prefix.empty() ? "lon" : prefix + "_lon";

    GeoPoint point;
    point.lat = require_number(body, lat_key);
    point.lon = require_number(body, lon_key);
    return point;
}

} // namespace ride_dispatch
