#include <storage/pattern_buckets.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <tuple>

namespace Stanchion {

std::optional<uint64_t> parse_numeric_id(std::string_view subject_id) {
    while (!subject_id.empty() && std::isspace(static_cast<unsigned char>(subject_id.front()))) {
        subject_id.remove_prefix(1);
    }
    while (!subject_id.empty() && std::isspace(static_cast<unsigned char>(subject_id.back()))) {
        subject_id.remove_suffix(1);
    }
    if (subject_id.empty()) return std::nullopt;

    uint64_t value = 0;
    const char* first = subject_id.data();
    const char* last = first + subject_id.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

BucketKey bucket_of(BucketType type, uint64_t id) {
    BucketKey key;
    key.type = type;
    switch (type) {
        case BucketType::Mod10:  key.value = id % 10; break;
        case BucketType::Mod15:  key.value = id % 15; break;
        case BucketType::Mod20:  key.value = id % 20; break;
        case BucketType::Div50:  key.value = id / 50; break;
        case BucketType::Div100: key.value = id / 100; break;
    }
    return key;
}

std::vector<BucketKey> buckets_for(std::string_view subject_id) {
    std::vector<BucketKey> keys;
    auto id = parse_numeric_id(subject_id);
    if (!id) return keys;

    static constexpr BucketType order[] = {
        BucketType::Mod10, BucketType::Mod15, BucketType::Mod20,
        BucketType::Div50, BucketType::Div100
    };
    keys.reserve(std::size(order));
    for (BucketType type : order) {
        keys.push_back(bucket_of(type, *id));
    }
    return keys;
}

double derived_confidence(const PatternHypothesis& hypothesis) {
    double saturation = std::min(static_cast<double>(hypothesis.sample_count) / kLearnedSaturationSamples, 1.0);
    return hypothesis.success_rate * saturation;
}

const PatternHypothesis* select_in_bucket(const std::vector<PatternHypothesis>& competing) {
    const PatternHypothesis* best = nullptr;
    for (const auto& h : competing) {
        if (!best) {
            best = &h;
            continue;
        }
        auto rank = [](const PatternHypothesis& x) {
            return std::make_tuple(x.sample_count, x.success_rate, x.last_updated);
        };
        if (rank(h) > rank(*best)) {
            best = &h;
        } else if (rank(h) == rank(*best) &&
                   std::tie(h.material, h.type) < std::tie(best->material, best->type)) {
            best = &h;
        }
    }
    return best;
}

void recompute_success_rates(std::vector<PatternHypothesis>& competing) {
    int64_t total = 0;
    for (const auto& h : competing) total += h.sample_count;
    if (total <= 0) return;
    for (auto& h : competing) {
        h.success_rate = static_cast<double>(h.sample_count) / static_cast<double>(total);
    }
}

std::optional<Classification> best_learned(const std::vector<std::vector<PatternHypothesis>>& per_bucket) {
    std::optional<Classification> best;
    double best_confidence = 0.0;

    for (const auto& competing : per_bucket) {
        const PatternHypothesis* chosen = select_in_bucket(competing);
        if (!chosen) continue;

        double confidence = derived_confidence(*chosen);
        if (!best || confidence > best_confidence) {
            best = Classification{chosen->material, chosen->type, confidence};
            best_confidence = confidence;
        }
    }
    return best;
}

} // namespace Stanchion
