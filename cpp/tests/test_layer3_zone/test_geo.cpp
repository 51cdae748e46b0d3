/**
 * @file test_geo.cpp
 * @brief Haversine distance.
 */
#include "zone/geo.hpp"
#include <gtest/gtest.h>

using namespace zonechat::zone;

TEST(GeoTest, ZeroForSamePoint)
{
    const GeoPoint p{48.8566, 2.3522};
    EXPECT_DOUBLE_EQ(distance_km(p, p), 0.0);
}

TEST(GeoTest, KnownShortDistance)
{
    // 0.05 degrees on both axes near 10N is about 7.8 km.
    EXPECT_NEAR(distance_km({10.0, 10.0}, {10.05, 10.05}), 7.80, 0.05);
}

TEST(GeoTest, OneDegreeOfLatitude)
{
    EXPECT_NEAR(distance_km({0.0, 0.0}, {1.0, 0.0}), 111.19, 0.01);
}

TEST(GeoTest, Symmetric)
{
    const GeoPoint a{51.5074, -0.1278};
    const GeoPoint b{40.7128, -74.0060};
    EXPECT_DOUBLE_EQ(distance_km(a, b), distance_km(b, a));
    EXPECT_NEAR(distance_km(a, b), 5570.0, 10.0);
}

TEST(GeoTest, AntipodesAreFinite)
{
    const double d = distance_km({0.0, 0.0}, {0.0, 180.0});
    EXPECT_NEAR(d, 20015.09, 0.5);
}
