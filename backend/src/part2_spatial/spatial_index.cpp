#include "ride_dispatch/spatial_index.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>
#include <vector>

#include "ride_dispatch/geometry.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace ride_dispatch
{
namespace
{

using IndexedPoint = std::pair<long, GeoPoint>;

// Lat/lon box (degrees) enclosing the spherical cap of the query.
struct BoundingBox
{
    double min_lat{};
    double max_lat{};
    double min_lon{};
    double max_lon{};
    bool all_lon{false};
};

BoundingBox bounding_box(const GeoPoint &center, double radius_km)
{
    const double angular = radius_km / kEarthRadiusKm;
    const double lat = center.lat * M_PI / 180.0;
    const double lon = center.lon * M_PI / 180.0;

    BoundingBox box;
    double min_lat = lat - angular;
    double max_lat = lat + angular;

    if (min_lat > -M_PI / 2.0 && max_lat < M_PI / 2.0)
    {
        const double delta_lon = std::asin(std::sin(angular) / std::cos(lat));
        const double min_lon = lon - delta_lon;
        const double max_lon = lon + delta_lon;
        // Crossing the antimeridian: fall back to the full longitude band.
        box.all_lon = min_lon < -M_PI || max_lon > M_PI;
        box.min_lon = min_lon * 180.0 / M_PI;
        box.max_lon = max_lon * 180.0 / M_PI;
    }
    else
    {
        // A pole lies inside the cap.
        min_lat = std::max(min_lat, -M_PI / 2.0);
        max_lat = std::min(max_lat, M_PI / 2.0);
        box.all_lon = true;
    }

    box.min_lat = min_lat * 180.0 / M_PI;
    box.max_lat = max_lat * 180.0 / M_PI;
    return box;
}

std::unique_ptr<KDTreeNode> build_kdtree(std::vector<IndexedPoint>::iterator begin,
                                         std::vector<IndexedPoint>::iterator end, int depth)
{
    if (begin == end)
    {
        return nullptr;
    }

    int axis = depth % 2;

    std::sort(begin, end,
              [axis](const IndexedPoint &a, const IndexedPoint &b)
              {
                  return (axis == 0) ? a.second.lat < b.second.lat : a.second.lon < b.second.lon;
              });

    auto median = begin + (end - begin) / 2;
    auto node = std::make_unique<KDTreeNode>(median->first, median->second.lat, median->second.lon, axis);

    node->left = build_kdtree(begin, median, depth + 1);
    node->right = build_kdtree(median + 1, end, depth + 1);

    return node;
}

void kdtree_range_helper(const KDTreeNode *node, const GeoPoint &center, double radius_km,
                         const BoundingBox &box, std::vector<SpatialHit> &hits)
{
    if (!node)
    {
        return;
    }

    const bool inside_lat = node->lat >= box.min_lat && node->lat <= box.max_lat;
    const bool inside_lon = box.all_lon || (node->lon >= box.min_lon && node->lon <= box.max_lon);
    if (inside_lat && inside_lon)
    {
        const double dist = haversine_km(center.lat, center.lon, node->lat, node->lon);
        if (dist <= radius_km)
        {
            hits.push_back({node->driver_id, dist});
        }
    }

    if (node->axis == 0)
    {
        if (box.min_lat <= node->lat)
        {
            kdtree_range_helper(node->left.get(), center, radius_km, box, hits);
        }
        if (box.max_lat >= node->lat)
        {
            kdtree_range_helper(node->right.get(), center, radius_km, box, hits);
        }
        return;
    }

    if (box.all_lon || box.min_lon <= node->lon)
    {
        kdtree_range_helper(node->left.get(), center, radius_km, box, hits);
    }
    if (box.all_lon || box.max_lon >= node->lon)
    {
        kdtree_range_helper(node->right.get(), center, radius_km, box, hits);
    }
}

} // namespace

void SpatialIndex::rebuild(std::vector<std::pair<long, GeoPoint>> points)
{
    size_ = points.size();
    root_ = build_kdtree(points.begin(), points.end(), 0);
}

std::vector<SpatialHit> SpatialIndex::query_radius(const GeoPoint &center, double radius_km) const
{
    std::vector<SpatialHit> hits;
    if (!root_ || radius_km < 0.0)
    {
        return hits;
    }

    const BoundingBox box = bounding_box(center, radius_km);
    kdtree_range_helper(root_.get(), center, radius_km, box, hits);
    return hits;
}

} // namespace ride_dispatch
