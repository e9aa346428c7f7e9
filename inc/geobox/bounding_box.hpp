/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file bounding_box.hpp
#pragma once
#ifndef PCH
    #include "geobox/point.hpp"
    #include <array>
    #include <iosfwd>
    #include <optional>
#endif

namespace geobox
{
    /// @brief Represents an axis-aligned 2D bounding box defined by minimum and maximum coordinates.
    /// Invariant: min_x <= max_x and min_y <= max_y. A box built from a single point is degenerate
    /// (zero width and height). "No box" is expressed as an empty std::optional<bounding_box>,
    /// never as a special state of this struct.
    struct bounding_box
    {
        /// @brief Minimum X coordinate of the bounding box.
        double min_x {};
        /// @brief Minimum Y coordinate of the bounding box.
        double min_y {};
        /// @brief Maximum X coordinate of the bounding box.
        double max_x {};
        /// @brief Maximum Y coordinate of the bounding box.
        double max_y {};

        /// @brief String representation for an absent bounding box when writing to CSV.
        static constexpr char const* invalid_bbox_csv_marker {",,,"};
        /// @brief Default precision used when writing coordinate values to a CSV stream.
        static constexpr int csv_coordinate_precision {3};

        /// @brief Creates the degenerate box covering exactly one point.
        static constexpr bounding_box from_point(const point& p) noexcept { return {p.x, p.y, p.x, p.y}; }

        /// @brief Grows the box so that it includes the point (x, y).
        /// NaN coordinates leave the result unspecified.
        /// @param x The X coordinate of the point to include.
        /// @param y The Y coordinate of the point to include.
        void update(const double x, const double y) noexcept;

        /// @brief Inclusive containment test; points on the boundary are contained.
        bool contains(const point& p) const noexcept;

        double width() const noexcept { return max_x - min_x; }
        double height() const noexcept { return max_y - min_y; }

        /// @brief True when the box has zero width or zero height.
        bool is_degenerate() const noexcept { return (min_x == max_x) || (min_y == max_y); }

        /// @brief The four corners, counter-clockwise starting at (min_x, min_y).
        std::array<point, 4u> corners() const noexcept;

        /// @brief Returns a copy of this box shifted by (dx, dy).
        bounding_box translated(const double dx, const double dy) const noexcept;

        /// @brief Writes the bounding box coordinates to an output stream in CSV format.
        /// The output format is "min_x,min_y,max_x,max_y" with `csv_coordinate_precision` decimals.
        /// The stream's formatting flags and precision are restored afterwards.
        /// @param os The output stream (e.g., std::ofstream) to write the formatted string to.
        /// @throws std::ios_base::failure On stream write errors if stream exceptions are enabled for `os`.
        void write_to_stream(std::ostream& os) const noexcept(false);

        bool operator==(const bounding_box& other) const noexcept = default;
    };

    /// @brief Writes an optional bounding box in CSV format.
    /// An absent box is written as `bounding_box::invalid_bbox_csv_marker` so the column count stays stable.
    /// @throws std::ios_base::failure On stream write errors if stream exceptions are enabled for `os`.
    void write_to_stream(std::ostream& os, const std::optional<bounding_box>& bbox) noexcept(false);

    /// @brief Diagnostic representation: "bounding_box{min_x, min_y, max_x, max_y}".
    std::ostream& operator<<(std::ostream& os, const bounding_box& bbox) noexcept(false);

} // namespace geobox
