/**
 * @file region_plan.hpp
 * @brief Fixed set of named photo regions and their crop geometry
 */

#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>
#include <string>
#include <vector>

namespace Stanchion {

/**
 * @brief Named region in normalized photo coordinates (x right, y down, [0,1])
 */
struct RegionSpec {
    std::string name;
    Eigen::AlignedBox2d box;
    std::string focus;          // region-specific instruction paragraph
};

/**
 * @brief Pixel rectangle of a region plus the size it is resampled to
 */
struct RegionCrop {
    std::string name;
    Eigen::AlignedBox2i pixels;
    Eigen::Vector2i target_size = Eigen::Vector2i::Zero();
};

class RegionPlan {
public:
    static constexpr int DEFAULT_MIN_EDGE = 256;
    static constexpr int DEFAULT_MAX_EDGE = 1024;

    /**
     * @brief full, upper-junction, main-junction, lower-junction,
     *        center-shaft, upper-section, base-section (in that order)
     */
    static const std::vector<RegionSpec>& standard();

    /**
     * @brief Scale so the longest edge lies in [min_edge, max_edge]
     *
     * Aspect ratio is kept; sizes already inside the bounds are returned as is.
     */
    static Eigen::Vector2i fit_to_edge_bounds(const Eigen::Vector2i& size, int min_edge, int max_edge);

    static RegionCrop crop_for(const RegionSpec& region, const Eigen::Vector2i& photo_size,
                               int min_edge = DEFAULT_MIN_EDGE, int max_edge = DEFAULT_MAX_EDGE);

    /**
     * @brief Full oracle instruction for one region, hints appended
     */
    static std::string instruction_for(const RegionSpec& region, const std::vector<std::string>& hints);
};

} // namespace Stanchion
