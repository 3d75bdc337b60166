#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "entity_store.hpp"

namespace ride_dispatch
{

struct DriverMetrics
{
    long driver_id{};
    std::string name;
    std::size_t completed_rides{0};
    int cancelled_rides{0};
    double total_fare{0.0};
    double average_fare{0.0};
    double average_wait_minutes{0.0};
    double average_duration_minutes{0.0};
};

struct SimulationMetrics
{
    std::size_t total_rides{0};
    std::size_t completed_rides{0};
    std::size_t unmatched_rides{0};
    std::size_t cancelled_rides{0};
    std::map<std::string, std::size_t> rides_by_status;
    double average_wait_minutes{0.0};
    double average_duration_minutes{0.0};
    std::vector<DriverMetrics> drivers;
};

SimulationMetrics compute_metrics(const EntityStore &store);

} // namespace ride_dispatch
