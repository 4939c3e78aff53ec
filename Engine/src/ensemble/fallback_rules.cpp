#include <ensemble/fallback_rules.hpp>
#include <storage/pattern_buckets.hpp>

namespace Stanchion {

Classification FallbackRules::classify(const std::string& subject_id) {
    auto id = parse_numeric_id(subject_id);
    if (!id) return {kFallbackMaterial, kFallbackType, 0.50};

    if (*id % 100 == 0) return {"kov", "stĺp svetelného signalizačného zariadenia", 0.65};
    if (*id % 20 == 0)  return {"kov", "stĺp značky dvojitý", 0.60};
    if (*id % 10 == 0)  return {"kov", "stĺp verejného osvetlenia", 0.55};
    if (*id > 1000)     return {"betón", kFallbackType, 0.50};
    return {kFallbackMaterial, kFallbackType, 0.70};
}

} // namespace Stanchion
