#include <ensemble/reliability_table.hpp>
#include <config/config_error.hpp>
#include <cmath>
#include <string>

namespace Stanchion {

double ReliabilityTable::weight_of(SourceKind kind) const {
    switch (kind) {
        case SourceKind::VerifiedRecord:
        case SourceKind::HumanCorrection: return verified;
        case SourceKind::RegionConsensus: return region_consensus;
        case SourceKind::PatternLearned:  return pattern_learned;
        case SourceKind::PriorAnalysis:
        case SourceKind::Ensemble:        return prior_analysis;
        case SourceKind::RuleFallback:    return rule_fallback;
        case SourceKind::Fallback:        return 0.0;
    }
    return 0.0;
}

void ReliabilityTable::validate() const {
    for (double w : {verified, region_consensus, pattern_learned, prior_analysis, rule_fallback}) {
        if (!std::isfinite(w) || w <= 0.0) {
            throw ConfigError("Reliability weights must be positive, got " + std::to_string(w));
        }
    }
    if (!(verified > region_consensus && region_consensus > pattern_learned && pattern_learned > rule_fallback)) {
        throw ConfigError("Reliability weights must satisfy verified > region_consensus > "
                          "pattern_learned > rule_fallback");
    }
    if (!(rule_fallback < prior_analysis && prior_analysis < region_consensus)) {
        throw ConfigError("prior_analysis weight must lie strictly between rule_fallback and region_consensus");
    }
}

} // namespace Stanchion
