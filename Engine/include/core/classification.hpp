/**
 * @file classification.hpp
 * @brief Data model shared by the store, calibration layer, aggregator and engine
 *
 * Material and type are an open vocabulary: any string the oracle, a rule
 * or a human correction produces is a valid label.
 */

#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace Stanchion {

using Label = std::string;

// =============================================================================
// Fixed fallback answer
// =============================================================================

inline const Label kFallbackMaterial = "kov";
inline const Label kFallbackType = "stĺp značky samostatný";

/// Confidence of the engine's answer when no Observation could be gathered.
inline constexpr double kEngineFallbackConfidence = 0.4;

/// Confidence of the aggregator's answer when every region was discarded.
inline constexpr double kAggregatorFallbackConfidence = 0.3;

// =============================================================================
// Provenance
// =============================================================================

enum class SourceKind {
    VerifiedRecord,    // human-verified record re-used under force_refresh
    RegionConsensus,   // multi-region aggregator output
    PatternLearned,    // bucket hypothesis from corrections
    PriorAnalysis,     // earlier unverified engine decision
    RuleFallback,      // deterministic id rules
    Ensemble,          // written back by the engine
    HumanCorrection,   // written by apply_correction
    Fallback           // fixed fallback answer
};

const char* to_string(SourceKind kind);

/**
 * @brief Parse the persisted provenance name
 * @return nullopt for unknown names
 */
std::optional<SourceKind> source_kind_from_string(std::string_view name);

// =============================================================================
// Records
// =============================================================================

/**
 * @brief (material, type, confidence) answer for one subject
 */
struct Classification {
    Label material;
    Label type;
    double confidence = 0.0;
};

/**
 * @brief One source's proposal for one decision. Never persisted.
 */
struct Observation {
    Label material;
    Label type;
    double confidence = 0.0;
    SourceKind source_kind = SourceKind::RuleFallback;
    double weight = 0.0;
};

struct SubjectRecord {
    std::string subject_id;
    Label material;
    Label type;
    double confidence = 0.0;
    SourceKind source_kind = SourceKind::Ensemble;
    double timestamp = 0.0;     // seconds since epoch
    bool verified = false;
    int64_t correction_count = 0;
};

struct CorrectionEvent {
    std::string id;             // UUID of BLAKE3(fields)
    int64_t sequence = 0;       // store-assigned, strictly increasing
    std::string subject_id;
    Label material_before;
    Label type_before;
    Label material_after;
    Label type_after;
    double timestamp = 0.0;
};

/**
 * @brief Bucket function applied to a numeric subject id
 */
enum class BucketType {
    Mod10,
    Mod15,
    Mod20,
    Div50,
    Div100
};

const char* to_string(BucketType type);
std::optional<BucketType> bucket_type_from_string(std::string_view name);

struct BucketKey {
    BucketType type = BucketType::Mod10;
    uint64_t value = 0;

    bool operator==(const BucketKey& other) const {
        return type == other.type && value == other.value;
    }
    bool operator<(const BucketKey& other) const {
        return type != other.type ? type < other.type : value < other.value;
    }
};

struct PatternHypothesis {
    BucketKey bucket;
    Label material;
    Label type;
    int64_t sample_count = 1;
    double success_rate = 1.0;
    double last_updated = 0.0;
};

/**
 * @brief A prediction whose correctness became known later
 */
struct OutcomeRecord {
    int64_t sequence = 0;
    double predicted_confidence = 0.0;
    bool was_correct = false;
    double timestamp = 0.0;
};

} // namespace Stanchion
