#pragma once

#include <stdexcept>
#include <string>

#include "types.hpp"

namespace ride_dispatch
{

class NotFoundError : public std::runtime_error
{
public:
    NotFoundError(const std::string &entity, long id);

    long id() const { return id_; }

private:
    long id_;
};

class InvalidTransitionError : public std::runtime_error
{
public:
    InvalidTransitionError(long ride_id, RideStatus current, RideStatus target);

    long ride_id() const { return ride_id_; }
    RideStatus current() const { return current_; }
    RideStatus target() const { return target_; }

private:
    long ride_id_;
    RideStatus current_;
    RideStatus target_;
};

class ConfigurationMissingError : public std::runtime_error
{
public:
    explicit ConfigurationMissingError(const std::string &key);

    const std::string &key() const { return key_; }

private:
    std::string key_;
};

} // namespace ride_dispatch
