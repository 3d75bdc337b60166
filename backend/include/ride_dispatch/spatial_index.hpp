#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "types.hpp"

namespace ride_dispatch
{

struct KDTreeNode
{
    long driver_id{};
    double lat{};
    double lon{};
    int axis{};
    std::unique_ptr<KDTreeNode> left;
    std::unique_ptr<KDTreeNode> right;

    KDTreeNode(long id, double lat_, double lon_, int axis_)
        : driver_id(id), lat(lat_), lon(lon_), axis(axis_) {}
};

struct SpatialHit
{
    long driver_id{};
    double distance_km{};
};

// 2-d kd-tree over driver coordinates (axis 0 = latitude, axis 1 = longitude).
class SpatialIndex
{
public:
    void rebuild(std::vector<std::pair<long, GeoPoint>> points);

    // Every indexed point whose great-circle distance to center is <= radius_km.
    std::vector<SpatialHit> query_radius(const GeoPoint &center, double radius_km) const;

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

private:
    std::unique_ptr<KDTreeNode> root_;
    std::size_t size_{0};
};

} // namespace ride_dispatch
