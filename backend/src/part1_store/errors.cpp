#include "ride_dispatch/errors.hpp"

#include <string>

namespace ride_dispatch
{

NotFoundError::NotFoundError(const std::string &entity, long id)
    : std::runtime_error(entity + " " + std::to_string(id) + " not found."), id_(id)
{
}

InvalidTransitionError::InvalidTransitionError(long ride_id, RideStatus current, RideStatus target)
    : std::runtime_error("Ride " + std::to_string(ride_id) + " cannot move from " + to_string(current) +
                         " to " + to_string(target) + "."),
      ride_id_(ride_id),
      current_(current),
      target_(target)
{
}

ConfigurationMissingError::ConfigurationMissingError(const std::string &key)
    : std::runtime_error("No pricing configuration found for key '" + key + "'."), key_(key)
{
}

} // namespace ride_dispatch
