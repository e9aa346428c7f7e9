/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file bbox.cpp
#include "geobox/algorithm/bbox.hpp"

namespace geobox
{
    std::optional<bounding_box> bbox(const line_string& line) noexcept
    {
        return calculate_bbox(line);
    }

} // namespace geobox
