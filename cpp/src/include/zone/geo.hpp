#pragma once
/**
 * @file geo.hpp
 * @brief Great-circle distance on a spherical Earth.
 */
#include "zonechat_core_export.h"
#include "zone/types.hpp"

namespace zonechat::zone
{

/// Mean Earth radius used by distance_km().
inline constexpr double kEarthRadiusKm = 6371.0;

/**
 * @brief Haversine distance between @p a and @p b in kilometres.
 * @details Symmetric, zero for identical points, and finite for antipodes.
 */
[[nodiscard]] ZONECHAT_CORE_EXPORT double distance_km(const GeoPoint &a, const GeoPoint &b) noexcept;

} // namespace zonechat::zone
