/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file interleaved_coordinates.hpp
#pragma once
#ifndef PCH
    #include "geobox/point.hpp"
    #include <cstddef>
    #include <cstdint>
    #include <iterator>
#endif

namespace geobox
{
    /// @brief Non-owning view that presents a flat buffer of interleaved coordinates as a forward range of points.
    /// Each coordinate tuple occupies `stride` doubles (2 for XY, 3 for XYZ, 4 for XYZM) and X and Y are
    /// always the first two values of a tuple. A trailing partial tuple without a Y value is ignored.
    /// The buffer must outlive the view.
    class interleaved_coordinates
    {
    public:
        /// @brief Number of doubles in a plain XY tuple, the smallest supported stride.
        static constexpr std::uint32_t xy_stride {2u};

        class const_iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = point;
            using difference_type = std::ptrdiff_t;
            using pointer = const point*;
            using reference = point;

            const_iterator() noexcept = default;
            const_iterator(const double* const data, const std::uint32_t stride, const std::size_t index) noexcept:
                data_ {data},
                stride_ {stride},
                index_ {index}
            {
            }

            point operator*() const noexcept
            {
                const double* const tuple {data_ + (index_ * stride_)};
                return {tuple[0u], tuple[1u]};
            }

            const_iterator& operator++() noexcept
            {
                ++index_;
                return *this;
            }

            const_iterator operator++(int) noexcept
            {
                const_iterator previous {*this};
                ++index_;
                return previous;
            }

            bool operator==(const const_iterator& other) const noexcept { return (data_ == other.data_) && (index_ == other.index_); }
            bool operator!=(const const_iterator& other) const noexcept { return !(*this == other); }

        private:
            const double* data_ {};
            std::uint32_t stride_ {xy_stride};
            std::size_t index_ {};
        };

        interleaved_coordinates() noexcept = default;

        /// @brief Creates a view over `value_count` doubles starting at `data`.
        /// @param data Start of the coordinate buffer; may be null when `value_count` is 0.
        /// @param value_count Total number of doubles in the buffer (not the number of points).
        /// @param stride Number of doubles per coordinate tuple.
        /// @throws std::invalid_argument If `stride` is below `xy_stride`.
        interleaved_coordinates(const double* data, std::size_t value_count, std::uint32_t stride = xy_stride) noexcept(false);

        const_iterator begin() const noexcept { return {data_, stride_, 0u}; }
        const_iterator end() const noexcept { return {data_, stride_, size_}; }

        bool empty() const noexcept { return size_ == 0u; }
        /// @brief Number of complete points in the view.
        std::size_t size() const noexcept { return size_; }
        std::uint32_t stride() const noexcept { return stride_; }

    private:
        const double* data_ {};
        std::uint32_t stride_ {xy_stride};
        std::size_t size_ {};
    };

} // namespace geobox
