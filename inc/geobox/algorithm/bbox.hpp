/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file bbox.hpp
#pragma once
#ifndef PCH
    #include "geobox/bounding_box.hpp"
    #include "geobox/line_string.hpp"
    #include <iterator>
    #include <optional>
#endif

namespace geobox
{
    /// @brief Calculates the axis-aligned bounding box of a sequence of points.
    /// The extent is reduced in a single forward pass, seeded from the first point, with each axis
    /// handled independently (the extremal x and y need not come from the same point).
    /// @tparam PointRange A forward range whose elements expose `x` and `y` numeric members.
    /// @throws Whatever iterating `points` throws; the reduction itself does not throw.
    /// @param points The points to enclose. Order is irrelevant to the result.
    /// @return `std::nullopt` for an empty range, a degenerate box for a single point, otherwise the
    ///         minimal box containing every point. Results for NaN coordinates are unspecified.
    template <typename PointRange>
    std::optional<bounding_box> calculate_bbox(const PointRange& points) noexcept(false)
    {
        auto it = std::begin(points);
        const auto last = std::end(points);
        if (it == last)
            return std::nullopt;

        const auto& first = *it;
        bounding_box bbox {bounding_box::from_point(point {first.x, first.y})};
        for (++it; it != last; ++it)
        {
            const auto& p = *it;
            bbox.update(p.x, p.y);
        }

        return bbox;
    }

    /// @brief Bounding box of a line string; `std::nullopt` when it has no points.
    std::optional<bounding_box> bbox(const line_string& line) noexcept;

} // namespace geobox
