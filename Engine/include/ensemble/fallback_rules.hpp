/**
 * @file fallback_rules.hpp
 * @brief Deterministic id rules, the lowest-trust observation source
 */

#pragma once

#include <core/classification.hpp>
#include <string>

namespace Stanchion {

class FallbackRules {
public:
    /**
     * @brief Always yields a classification:
     *   id % 100 == 0   kov, stĺp svetelného signalizačného zariadenia, 0.65
     *   id % 20 == 0    kov, stĺp značky dvojitý, 0.60
     *   id % 10 == 0    kov, stĺp verejného osvetlenia, 0.55
     *   id > 1000       betón, stĺp značky samostatný, 0.50
     *   other numeric   kov, stĺp značky samostatný, 0.70
     *   non-numeric     kov, stĺp značky samostatný, 0.50
     */
    static Classification classify(const std::string& subject_id);
};

} // namespace Stanchion
