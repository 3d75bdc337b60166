#pragma once

#include "types.hpp"

namespace ride_dispatch
{

constexpr double kEarthRadiusKm = 6371.0;

double haversine_km(double lat1, double lon1, double lat2, double lon2);
double haversine_km(const GeoPoint &from, const GeoPoint &to);

} // namespace ride_dispatch
