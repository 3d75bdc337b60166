#include <gtest/gtest.h>

#include <algorithm>
#include <utility>
#include <vector>

#include "ride_dispatch/geometry.hpp"
#include "ride_dispatch/spatial_index.hpp"
#include "test_support.hpp"

namespace ride_dispatch
{
namespace
{

TEST(GeometryTest, ZeroDistanceForSamePoint)
{
    const GeoPoint bangalore{12.9716, 77.5946};
    EXPECT_DOUBLE_EQ(haversine_km(bangalore, bangalore), 0.0);
}

TEST(GeometryTest, OneDegreeOfLatitude)
{
    EXPECT_NEAR(haversine_km(0.0, 0.0, 1.0, 0.0), 111.195, 0.001);
}

TEST(GeometryTest, KnownCityPair)
{
    // Bangalore to Chennai, roughly 290 km great-circle.
    const double km = haversine_km(12.9716, 77.5946, 13.0827, 80.2707);
    EXPECT_NEAR(km, 290.0, 5.0);
}

TEST(GeometryTest, Symmetric)
{
    const GeoPoint a{12.9, 77.5};
    const GeoPoint b{13.1, 77.8};
    EXPECT_DOUBLE_EQ(haversine_km(a, b), haversine_km(b, a));
}

TEST(SpatialIndexTest, EmptyIndexReturnsNothing)
{
    SpatialIndex index;
    EXPECT_TRUE(index.empty());
    EXPECT_TRUE(index.query_radius({12.97, 77.59}, 50.0).empty());
}

TEST(SpatialIndexTest, RadiusQueryMatchesBruteForce)
{
    const GeoPoint center{12.9716, 77.5946};
    std::vector<std::pair<long, GeoPoint>> points;
    long id = 1;
    for (int i = -10; i <= 10; ++i)
    {
        for (int j = -10; j <= 10; ++j)
        {
            points.push_back({id++, {center.lat + i * 0.02, center.lon + j * 0.02}});
        }
    }

    SpatialIndex index;
    index.rebuild(points);
    ASSERT_EQ(index.size(), points.size());

    for (const double radius : {0.5, 1.0, 3.0, 7.5, 20.0})
    {
        std::vector<long> expected;
        for (const auto &[point_id, point] : points)
        {
            if (haversine_km(center, point) <= radius)
            {
                expected.push_back(point_id);
            }
        }

        std::vector<long> actual;
        for (const auto &hit : index.query_radius(center, radius))
        {
            actual.push_back(hit.driver_id);
            EXPECT_LE(hit.distance_km, radius);
        }

        std::sort(expected.begin(), expected.end());
        std::sort(actual.begin(), actual.end());
        EXPECT_EQ(actual, expected) << "radius " << radius;
    }
}

TEST(SpatialIndexTest, ReportsDistanceToCenter)
{
    const GeoPoint center{12.9716, 77.5946};
    SpatialIndex index;
    index.rebuild({{7, test_support::north_of(center, 2.0)}});

    const auto hits = index.query_radius(center, 2.5);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].driver_id, 7);
    EXPECT_NEAR(hits[0].distance_km, 2.0, 1e-9);

    EXPECT_TRUE(index.query_radius(center, 1.5).empty());
}

TEST(SpatialIndexTest, FindsPointsAcrossAntimeridian)
{
    SpatialIndex index;
    index.rebuild({{1, {0.0, 179.99}}, {2, {0.0, -179.99}}, {3, {0.0, 170.0}}});

    std::vector<long> ids;
    for (const auto &hit : index.query_radius({0.0, 179.995}, 5.0))
    {
        ids.push_back(hit.driver_id);
    }
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<long>{1, 2}));
}

TEST(SpatialIndexTest, RebuildReplacesPreviousPoints)
{
    const GeoPoint center{10.0, 10.0};
    SpatialIndex index;
    index.rebuild({{1, center}});
    index.rebuild({{2, test_support::north_of(center, 0.1)}});

    const auto hits = index.query_radius(center, 1.0);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].driver_id, 2);
}

} // namespace
} // namespace ride_dispatch
