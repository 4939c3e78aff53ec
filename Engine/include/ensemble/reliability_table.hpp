/**
 * @file reliability_table.hpp
 * @brief Source reliability weights used by the ensemble vote
 */

#pragma once

#include <core/classification.hpp>

namespace Stanchion {

/**
 * @brief Weight per source kind
 *
 * The numbers are tuning knobs; the ordering is a contract enforced by
 * validate():
 *   verified > region_consensus > pattern_learned > rule_fallback
 *   rule_fallback < prior_analysis < region_consensus
 */
struct ReliabilityTable {
    double verified = 1.0;
    double region_consensus = 0.9;
    double pattern_learned = 0.6;
    double prior_analysis = 0.55;
    double rule_fallback = 0.5;

    double weight_of(SourceKind kind) const;

    /**
     * @throws ConfigError
     */
    void validate() const;
};

} // namespace Stanchion
