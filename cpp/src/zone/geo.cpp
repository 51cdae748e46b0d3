#include "zone/geo.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace zonechat::zone
{

namespace
{
constexpr double deg_to_rad(double deg) noexcept
{
    return deg * std::numbers::pi / 180.0;
}
} // namespace

double distance_km(const GeoPoint &a, const GeoPoint &b) noexcept
{
    const double dlat = deg_to_rad(b.lat - a.lat);
    const double dlng = deg_to_rad(b.lng - a.lng);
    const double sin_dlat = std::sin(dlat / 2.0);
    const double sin_dlng = std::sin(dlng / 2.0);
    double h = sin_dlat * sin_dlat +
               std::cos(deg_to_rad(a.lat)) * std::cos(deg_to_rad(b.lat)) * sin_dlng * sin_dlng;
    // Rounding can push h slightly past 1 for antipodal points.
    h = std::clamp(h, 0.0, 1.0);
    return 2.0 * kEarthRadiusKm * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

} // namespace zonechat::zone
