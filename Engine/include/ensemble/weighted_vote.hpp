/**
 * @file weighted_vote.hpp
 * @brief Per-axis weighted voting shared by the engine and the region aggregator
 */

#pragma once

#include <core/classification.hpp>
#include <vector>

namespace Stanchion {

enum class VoteAxis {
    Material,
    Type
};

struct AxisOutcome {
    Label winner;
    double winner_score = 0.0;
    double total_score = 0.0;

    /// winner_score / total_score, 0 when every score is 0
    double confidence() const { return total_score > 0.0 ? winner_score / total_score : 0.0; }
};

/**
 * @brief Tally Σ(weight x confidence) per candidate on one axis
 *
 * Equal scores go to the candidate backed by the single highest-weight
 * observation, then to the candidate that appeared first.
 * @pre observations is not empty
 */
AxisOutcome vote_axis(const std::vector<Observation>& observations, VoteAxis axis);

/**
 * @brief Combine observations into one answer
 *
 * One observation is returned unchanged. Otherwise each axis is voted
 * independently and the confidence is the mean of the two axis confidences.
 * @pre observations is not empty
 */
Classification combine_observations(const std::vector<Observation>& observations);

/**
 * @brief min(0.99, confidence + min(0.10, (k - 1) x 0.05)) for k >= 2
 */
double agreement_bonus(double confidence, size_t contributors);

} // namespace Stanchion
