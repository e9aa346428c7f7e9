/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file geometry_processor.hpp
#pragma once
#ifndef PCH
    #include "geobox/bounding_box.hpp"
    #include "geobox/interleaved_coordinates.hpp"
    #include <cstdint>
    #include <optional>
#endif

// Forward declarations for FlatGeobuf types
namespace FlatGeobuf
{
    class Geometry;
    enum class GeometryType : std::uint8_t;
}

namespace geobox::fgb
{
    /// @brief A stateless utility class computing bounding boxes of FlatGeobuf line strings.
    /// Geometries are read in place from the FlatBuffer that holds them; nothing is copied, so the
    /// buffer must outlive any view returned from here. Only `LineString` geometries are supported.
    class geometry_processor
    {
    public:
        /// @brief Calculates the bounding box for a FlatGeobuf geometry.
        /// @param geometry_fbs Pointer to the constant FlatBuffer Geometry table. Null yields `std::nullopt`.
        /// @param declared_geometry_type The geometry type declared by the file header. `Unknown` (mixed-type
        ///        files) defers to the type stored on the geometry itself.
        /// @return The extent of the line string, or `std::nullopt` when the geometry is null, has no
        ///         coordinates, or is not a line string (a warning is written to `std::cerr` in that case).
        static std::optional<bounding_box> calculate_for_geometry(const FlatGeobuf::Geometry* geometry_fbs,
                                                                  FlatGeobuf::GeometryType declared_geometry_type) noexcept;

        /// @brief Views the `xy` vector of a geometry as points.
        /// FlatGeobuf keeps Z and M in their own vectors, so `xy` is always packed as XY pairs.
        /// @param geometry_fbs The constant FlatBuffer Geometry table to read coordinates from.
        /// @return The coordinate view, empty when the geometry carries no `xy` vector.
        static interleaved_coordinates coordinates_of(const FlatGeobuf::Geometry& geometry_fbs) noexcept;
    };

} // namespace geobox::fgb
