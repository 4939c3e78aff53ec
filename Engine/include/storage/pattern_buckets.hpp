/**
 * @file pattern_buckets.hpp
 * @brief Bucket functions of numeric subject ids and hypothesis selection
 *
 * Buckets are cheap proxy features used when no photograph is available:
 *   mod10, mod15, mod20 = id % n
 *   div50, div100       = id / n
 */

#pragma once

#include <core/classification.hpp>
#include <optional>
#include <string_view>
#include <vector>
#include <cstdint>

namespace Stanchion {

constexpr double kLearnedSaturationSamples = 10.0;

/**
 * @brief Parse a non-negative decimal id (surrounding whitespace allowed)
 * @return nullopt for anything else, including overflow
 */
std::optional<uint64_t> parse_numeric_id(std::string_view subject_id);

/**
 * @brief Buckets of a subject id in the fixed order mod10, mod15, mod20, div50, div100
 *
 * Empty for non-numeric ids.
 */
std::vector<BucketKey> buckets_for(std::string_view subject_id);

BucketKey bucket_of(BucketType type, uint64_t id);

/**
 * @brief success_rate x min(sample_count / 10, 1)
 */
double derived_confidence(const PatternHypothesis& hypothesis);

/**
 * @brief Strongest hypothesis of one bucket
 *
 * Highest sample_count, then success_rate, then most recent update, then
 * lexicographic (material, type) so the result is deterministic.
 */
const PatternHypothesis* select_in_bucket(const std::vector<PatternHypothesis>& competing);

/**
 * @brief Set success_rate = sample_count / bucket total for every entry
 *
 * All entries must share one bucket.
 */
void recompute_success_rates(std::vector<PatternHypothesis>& competing);

/**
 * @brief Pick the answer across buckets
 * @param per_bucket hypotheses per bucket, in buckets_for() order
 * @return highest derived confidence; earlier buckets win ties
 */
std::optional<Classification> best_learned(const std::vector<std::vector<PatternHypothesis>>& per_bucket);

} // namespace Stanchion
