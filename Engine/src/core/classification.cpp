#include <core/classification.hpp>

namespace Stanchion {

const char* to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::VerifiedRecord:  return "verified_record";
        case SourceKind::RegionConsensus: return "region_consensus";
        case SourceKind::PatternLearned:  return "pattern_learned";
        case SourceKind::PriorAnalysis:   return "prior_analysis";
        case SourceKind::RuleFallback:    return "rule_fallback";
        case SourceKind::Ensemble:        return "ensemble";
        case SourceKind::HumanCorrection: return "human_correction";
        case SourceKind::Fallback:        return "fallback";
    }
    return "unknown";
}

std::optional<SourceKind> source_kind_from_string(std::string_view name) {
    static constexpr SourceKind all[] = {
        SourceKind::VerifiedRecord, SourceKind::RegionConsensus, SourceKind::PatternLearned,
        SourceKind::PriorAnalysis, SourceKind::RuleFallback, SourceKind::Ensemble,
        SourceKind::HumanCorrection, SourceKind::Fallback
    };
    for (SourceKind kind : all) {
        if (name == to_string(kind)) return kind;
    }
    return std::nullopt;
}

const char* to_string(BucketType type) {
    switch (type) {
        case BucketType::Mod10:  return "mod10";
        case BucketType::Mod15:  return "mod15";
        case BucketType::Mod20:  return "mod20";
        case BucketType::Div50:  return "div50";
        case BucketType::Div100: return "div100";
    }
    return "unknown";
}

std::optional<BucketType> bucket_type_from_string(std::string_view name) {
    static constexpr BucketType all[] = {
        BucketType::Mod10, BucketType::Mod15, BucketType::Mod20,
        BucketType::Div50, BucketType::Div100
    };
    for (BucketType type : all) {
        if (name == to_string(type)) return type;
    }
    return std::nullopt;
}

} // namespace Stanchion
