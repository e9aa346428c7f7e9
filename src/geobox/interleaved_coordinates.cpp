/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file interleaved_coordinates.cpp
#include "geobox/interleaved_coordinates.hpp"
#include <stdexcept>
#include <string>

namespace geobox
{
    interleaved_coordinates::interleaved_coordinates(const double* const data, const std::size_t value_count,
                                                     const std::uint32_t stride) noexcept(false):
        data_ {data},
        stride_ {stride}
    {
        if (stride < xy_stride)
            throw std::invalid_argument("interleaved_coordinates: stride must be at least " + std::to_string(xy_stride) + ", got " +
                                        std::to_string(stride));

        // Same walk as stepping i += stride while (i + 1) < value_count: the last tuple only needs its X and Y.
        if ((data_ != nullptr) && (value_count >= xy_stride))
            size_ = ((value_count - xy_stride) / stride_) + 1u;
    }

} // namespace geobox
