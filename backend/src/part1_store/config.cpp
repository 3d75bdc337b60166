#include "ride_dispatch/config.hpp"

#include <chrono>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace ride_dispatch
{
namespace
{

using json = nlohmann::json;

const json &section(const json &root, const char *name)
{
    static const json empty = json::object();
    if (!root.contains(name))
    {
        return empty;
    }
    const json &value = root[name];
    if (!value.is_object())
    {
        throw std::invalid_argument(std::string("Config section '") + name + "' must be an object.");
    }
    return value;
}

void require_positive(double value, const char *field)
{
    if (!std::isfinite(value) || value <= 0.0)
    {
        throw std::invalid_argument(std::string("Config field '") + field + "' must be positive.");
    }
}

void require_non_negative(double value, const char *field)
{
    if (!std::isfinite(value) || value < 0.0)
    {
        throw std::invalid_argument(std::string("Config field '") + field + "' must not be negative.");
    }
}

} // namespace

AppConfig config_from_json(const json &root)
{
    if (!root.is_object())
    {
        throw std::invalid_argument("Config root must be a JSON object.");
    }

    AppConfig config;

    const json &dispatch = section(root, "dispatch");
    config.dispatch.initial_radius_km = dispatch.value("initial_radius_km", config.dispatch.initial_radius_km);
    config.dispatch.radius_step_km = dispatch.value("radius_step_km", config.dispatch.radius_step_km);
    config.dispatch.max_radius_km = dispatch.value("max_radius_km", config.dispatch.max_radius_km);
    config.dispatch.interval = std::chrono::seconds(dispatch.value("interval_seconds", 10LL));
    config.dispatch.parallel = dispatch.value("parallel", config.dispatch.parallel);
    config.dispatch.verbose = dispatch.value("verbose", config.dispatch.verbose);

    const json &eligibility = section(root, "eligibility");
    config.eligibility.rider_cooldown = std::chrono::minutes(eligibility.value("rider_cooldown_minutes", 30LL));
    config.eligibility.cancellation_streak = eligibility.value("cancellation_streak", config.eligibility.cancellation_streak);
    config.eligibility.history_size = eligibility.value("history_size", config.eligibility.history_size);

    const json &pricing = section(root, "pricing");
    config.pricing_key = pricing.value("key", config.pricing_key);
    config.pricing.base_fare = pricing.value("base_fare", config.pricing.base_fare);
    config.pricing.rate_per_km = pricing.value("rate_per_km", config.pricing.rate_per_km);
    config.pricing.rate_per_minute = pricing.value("rate_per_minute", config.pricing.rate_per_minute);
    config.pricing.waiting_charge_per_minute = pricing.value("waiting_charge_per_minute", config.pricing.waiting_charge_per_minute);

    const json &server = section(root, "server");
    config.server.host = server.value("host", config.server.host);
    config.server.port = server.value("port", config.server.port);

    validate_config(config);
    return config;
}

AppConfig load_config(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        std::cerr << "Config file " << path << " not found, using defaults." << std::endl;
        AppConfig config;
        validate_config(config);
        return config;
    }

    json root;
    try
    {
        in >> root;
    }
    catch (const json::parse_error &ex)
    {
        throw std::runtime_error("Malformed config file " + path + ": " + ex.what());
    }

    std::cout << "Loaded config from " << path << std::endl;
    return config_from_json(root);
}

void validate_config(const AppConfig &config)
{
    require_positive(config.dispatch.initial_radius_km, "dispatch.initial_radius_km");
    require_positive(config.dispatch.radius_step_km, "dispatch.radius_step_km");
    require_positive(config.dispatch.max_radius_km, "dispatch.max_radius_km");
    if (config.dispatch.max_radius_km < config.dispatch.initial_radius_km)
    {
        throw std::invalid_argument("Config field 'dispatch.max_radius_km' must be >= initial_radius_km.");
    }
    if (config.dispatch.interval.count() <= 0)
    {
        throw std::invalid_argument("Config field 'dispatch.interval_seconds' must be positive.");
    }

    if (config.eligibility.rider_cooldown.count() < 0)
    {
        throw std::invalid_argument("Config field 'eligibility.rider_cooldown_minutes' must not be negative.");
    }
    if (config.eligibility.cancellation_streak == 0)
    {
        throw std::invalid_argument("Config field 'eligibility.cancellation_streak' must be at least 1.");
    }
    if (config.eligibility.history_size < config.eligibility.cancellation_streak)
    {
        throw std::invalid_argument("Config field 'eligibility.history_size' must be >= cancellation_streak.");
    }

    if (config.pricing_key.empty())
    {
        throw std::invalid_argument("Config field 'pricing.key' must not be empty.");
    }
    require_non_negative(config.pricing.base_fare, "pricing.base_fare");
    require_non_negative(config.pricing.rate_per_km, "pricing.rate_per_km");
    require_non_negative(config.pricing.rate_per_minute, "pricing.rate_per_minute");
    require_non_negative(config.pricing.waiting_charge_per_minute, "pricing.waiting_charge_per_minute");

    if (config.server.port <= 0 || config.server.port > 65535)
    {
        throw std::invalid_argument("Config field 'server.port' must be a valid TCP port.");
    }
}

} // namespace ride_dispatch
