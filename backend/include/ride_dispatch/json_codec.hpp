#pragma once

#include <nlohmann/json.hpp>

#include "allocation.hpp"
#include "metrics.hpp"
#include "scheduler.hpp"
#include "types.hpp"

namespace ride_dispatch
{

void to_json(nlohmann::json &j, const GeoPoint &point);
void to_json(nlohmann::json &j, const Rider &rider);
void to_json(nlohmann::json &j, const Driver &driver);
void to_json(nlohmann::json &j, const FareBreakdown &fare);
void to_json(nlohmann::json &j, const Ride &ride);
void to_json(nlohmann::json &j, const DispatchOutcome &outcome);
void to_json(nlohmann::json &j, const DispatchPassReport &report);
void to_json(nlohmann::json &j, const DispatchStats &stats);
void to_json(nlohmann::json &j, const DriverMetrics &metrics);
void to_json(nlohmann::json &j, const SimulationMetrics &metrics);

// Reads "lat"/"lon" (or prefix + "_lat"/"_lon") and rejects missing or non-finite values.
GeoPoint geo_point_from_json(const nlohmann::json &body, const std::string &prefix = "");

} // namespace ride_dispatch
