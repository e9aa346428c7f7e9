/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file geometry_processor.cpp
#include "geobox/fgb/geometry_processor.hpp"
#include "flatgeobuf/feature_generated.h" // For FlatGeobuf::Geometry
#include "flatgeobuf/header_generated.h"  // For FlatGeobuf::GeometryType, FlatGeobuf::EnumNameGeometryType
#include "geobox/algorithm/bbox.hpp"
#include <iostream>

namespace geobox::fgb
{
    interleaved_coordinates geometry_processor::coordinates_of(const FlatGeobuf::Geometry& geometry_fbs) noexcept
    {
        const auto* const coords_vector = geometry_fbs.xy();
        if (coords_vector == nullptr)
            return {};

        return {coords_vector->data(), coords_vector->size(), interleaved_coordinates::xy_stride};
    }

    std::optional<bounding_box> geometry_processor::calculate_for_geometry(const FlatGeobuf::Geometry* const geometry_fbs,
                                                                           const FlatGeobuf::GeometryType declared_geometry_type) noexcept
    {
        if (geometry_fbs == nullptr)
            return std::nullopt;

        // Per-geometry types are only written when the header declares Unknown
        const FlatGeobuf::GeometryType actual_geometry_type {
            (declared_geometry_type == FlatGeobuf::GeometryType::Unknown) ? geometry_fbs->type() : declared_geometry_type};

        if (actual_geometry_type != FlatGeobuf::GeometryType::LineString)
        {
            std::cerr << "Warning: Bounding boxes are only computed for LineString geometries. Found: "
                      << FlatGeobuf::EnumNameGeometryType(actual_geometry_type) << std::endl;
            return std::nullopt;
        }

        return calculate_bbox(coordinates_of(*geometry_fbs));
    }

} // namespace geobox::fgb
