/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file interleaved_coordinates_test.cpp
#include "geobox/interleaved_coordinates.hpp"
#include "geobox/algorithm/bbox.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace geobox
{
    namespace interleaved_coordinates_tests
    {
        bool test_xy_pairs()
        {
            const std::vector<double> xy {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
            const interleaved_coordinates view {xy.data(), xy.size()};
            if (view.size() != 3u)
            {
                std::cerr << "Expected 3 points, got " << view.size() << std::endl;
                return false;
            }

            const std::vector<point> points(view.begin(), view.end());
            return points == std::vector<point> {{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}};
        }

        bool test_xyz_stride_reads_x_and_y()
        {
            const std::vector<double> xyz {1.0, -1.0, 100.0, -5.0, 7.0, -200.0};
            const interleaved_coordinates view {xyz.data(), xyz.size(), 3u};
            const auto result = calculate_bbox(view);
            if (!result.has_value() || (*result != bounding_box {-5.0, -1.0, 1.0, 7.0}))
            {
                std::cerr << "Z values leaked into the XY extent" << std::endl;
                return false;
            }

            return true;
        }

        bool test_trailing_partial_tuple_is_ignored()
        {
            // Last tuple has X only.
            const std::vector<double> xy {0.0, 0.0, 2.0, 2.0, 99.0};
            const interleaved_coordinates view {xy.data(), xy.size()};
            if (view.size() != 2u)
            {
                std::cerr << "Expected the dangling X value to be dropped" << std::endl;
                return false;
            }

            // A short final XYZ tuple still has its X and Y.
            const std::vector<double> xyz {0.0, 0.0, 1.0, 4.0, 5.0};
            return interleaved_coordinates {xyz.data(), xyz.size(), 3u}.size() == 2u;
        }

        bool test_empty_inputs()
        {
            const interleaved_coordinates defaulted {};
            const interleaved_coordinates null_data {nullptr, 4u};
            const std::vector<double> single {1.0};
            const interleaved_coordinates too_short {single.data(), single.size()};

            if (!defaulted.empty() || !null_data.empty() || !too_short.empty())
            {
                std::cerr << "Expected empty coordinate views" << std::endl;
                return false;
            }

            return !calculate_bbox(defaulted).has_value() && (defaulted.begin() == defaulted.end());
        }

        bool test_stride_below_xy_is_rejected()
        {
            const std::vector<double> values {1.0, 2.0};
            try
            {
                const interleaved_coordinates view {values.data(), values.size(), 1u};
                std::cerr << "Expected std::invalid_argument for stride 1, got " << view.size() << " points" << std::endl;
                return false;
            }
            catch (const std::invalid_argument&)
            {
                return true;
            }
        }

        bool run_all_tests()
        {
            const std::pair<const char*, bool (*)()> tests[] = {
                {"xy_pairs", &test_xy_pairs},
                {"xyz_stride_reads_x_and_y", &test_xyz_stride_reads_x_and_y},
                {"trailing_partial_tuple_is_ignored", &test_trailing_partial_tuple_is_ignored},
                {"empty_inputs", &test_empty_inputs},
                {"stride_below_xy_is_rejected", &test_stride_below_xy_is_rejected},
            };

            bool all_passed {true};
            for (const auto& [name, fn]: tests)
                if (!fn())
                {
                    std::cerr << "Test failed: " << name << std::endl;
                    all_passed = false;
                }

            return all_passed;
        }

    } // namespace interleaved_coordinates_tests

} // namespace geobox

int main()
{
    if (geobox::interleaved_coordinates_tests::run_all_tests())
    {
        std::cout << "All interleaved_coordinates tests passed" << std::endl;
        return 0;
    }

    std::cerr << "interleaved_coordinates tests failed" << std::endl;
    return 1;
}
