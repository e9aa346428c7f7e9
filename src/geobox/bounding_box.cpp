/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file bounding_box.cpp
#include "geobox/bounding_box.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace geobox
{
    void bounding_box::update(const double x, const double y) noexcept
    {
        min_x = std::min(min_x, x);
        min_y = std::min(min_y, y);
        max_x = std::max(max_x, x);
        max_y = std::max(max_y, y);
    }

    bool bounding_box::contains(const point& p) const noexcept
    {
        return (p.x >= min_x) && (p.x <= max_x) && (p.y >= min_y) && (p.y <= max_y);
    }

    std::array<point, 4u> bounding_box::corners() const noexcept
    {
        return {point {min_x, min_y}, point {max_x, min_y}, point {max_x, max_y}, point {min_x, max_y}};
    }

    bounding_box bounding_box::translated(const double dx, const double dy) const noexcept
    {
        return {min_x + dx, min_y + dy, max_x + dx, max_y + dy};
    }

    void bounding_box::write_to_stream(std::ostream& os) const noexcept(false)
    {
        const std::ios_base::fmtflags original_flags {os.flags()};
        const std::streamsize original_precision {os.precision()};

        os << std::fixed << std::setprecision(csv_coordinate_precision) << min_x << "," << min_y << "," << max_x << "," << max_y;

        os.flags(original_flags);
        os.precision(original_precision);
    }

    void write_to_stream(std::ostream& os, const std::optional<bounding_box>& bbox) noexcept(false)
    {
        if (!bbox.has_value())
        {
            os << bounding_box::invalid_bbox_csv_marker;
            return;
        }

        bbox->write_to_stream(os);
    }

    std::ostream& operator<<(std::ostream& os, const bounding_box& bbox) noexcept(false)
    {
        return os << "bounding_box{" << bbox.min_x << ", " << bbox.min_y << ", " << bbox.max_x << ", " << bbox.max_y << '}';
    }

} // namespace geobox
