/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file line_string.hpp
#pragma once
#ifndef PCH
    #include "geobox/point.hpp"
    #include <cstddef>
    #include <initializer_list>
    #include <utility>
    #include <vector>
#endif

namespace geobox
{
    /// @brief An ordered sequence of points describing a path. No closure or area is implied.
    /// May be empty.
    class line_string
    {
    public:
        using container_type = std::vector<point>;
        using const_iterator = container_type::const_iterator;

        line_string() noexcept = default;
        line_string(std::initializer_list<point> points) noexcept(false): points_ {points} {}
        explicit line_string(container_type points) noexcept: points_ {std::move(points)} {}

        const_iterator begin() const noexcept { return points_.begin(); }
        const_iterator end() const noexcept { return points_.end(); }

        bool empty() const noexcept { return points_.empty(); }
        std::size_t size() const noexcept { return points_.size(); }

        /// @brief Read access to the underlying points, in path order.
        const container_type& points() const noexcept { return points_; }

    private:
        container_type points_ {};
    };

} // namespace geobox
