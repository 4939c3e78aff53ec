/**
 * @file vision_oracle.hpp
 * @brief Consumed collaborators: photograph source and vision oracle
 *
 * Acquisition, caching and pixel work live behind these interfaces.
 */

#pragma once

#include <Eigen/Core>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Stanchion {

struct RegionCrop;

/**
 * @brief Opaque handle to one photograph of a subject
 */
struct Photograph {
    std::string subject_id;
    std::string locator;        // understood only by the PhotographSource
    Eigen::Vector2i size = Eigen::Vector2i::Zero();  // width, height in pixels
};

/**
 * @brief Encoded crop of one named region, ready for the oracle
 */
struct RegionImage {
    std::string region;
    Eigen::Vector2i size = Eigen::Vector2i::Zero();
    std::string media_type = "image/jpeg";
    std::vector<uint8_t> bytes;
};

class PhotographSource {
public:
    virtual ~PhotographSource() = default;

    /**
     * @return nullopt when the subject has no photograph
     */
    virtual std::optional<Photograph> fetch(const std::string& subject_id) = 0;

    /**
     * @brief Cut crop.pixels out of the photograph and resample to crop.target_size
     */
    virtual RegionImage crop(const Photograph& photo, const RegionCrop& crop) = 0;
};

/**
 * @brief External multimodal analysis service
 *
 * Unreliable and possibly slow. analyze() may block for a long time and
 * may throw on transport errors; the reply is free text expected to carry
 * material, type, confidence and rationale.
 */
class VisionOracle {
public:
    virtual ~VisionOracle() = default;

    virtual std::string analyze(const RegionImage& image, const std::string& instruction) = 0;
};

} // namespace Stanchion
