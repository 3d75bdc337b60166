#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace ride_dispatch
{

struct DispatchConfig
{
    double initial_radius_km{1.0};
    double radius_step_km{1.0};
    double max_radius_km{20.0};
    std::chrono::seconds interval{10};
    bool parallel{false};
    bool verbose{true};
};

struct EligibilityRules
{
    std::chrono::minutes rider_cooldown{30};
    std::size_t cancellation_streak{2};
    std::size_t history_size{8};
};

struct ServerConfig
{
    std::string host{"0.0.0.0"};
    int port{8080};
};

struct AppConfig
{
    DispatchConfig dispatch;
    EligibilityRules eligibility;
    std::string pricing_key{"default"};
    PricingConfig pricing;
    ServerConfig server;
};

AppConfig config_from_json(const nlohmann::json &root);
AppConfig load_config(const std::string &path);

// Throws std::invalid_argument describing the first offending field.
void validate_config(const AppConfig &config);

} // namespace ride_dispatch
