/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file point.hpp
#pragma once

namespace geobox
{
    /// @brief A 2D coordinate. Plain value type without identity beyond its coordinates.
    struct point
    {
        /// @brief X coordinate (easting / longitude).
        double x {};
        /// @brief Y coordinate (northing / latitude).
        double y {};

        bool operator==(const point& other) const noexcept = default;
    };

} // namespace geobox
