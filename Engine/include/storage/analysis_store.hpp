/**
 * @file analysis_store.hpp
 * @brief Pattern-learning store: subject records, correction log, bucket hypotheses
 *
 * The store exclusively owns SubjectRecord, CorrectionEvent and
 * PatternHypothesis storage and every mutation of them. Each implementation
 * applies a correction as one atomic unit: on any fault nothing is changed.
 */

#pragma once

#include <core/classification.hpp>
#include <stdexcept>
#include <optional>
#include <string>
#include <vector>
#include <map>

namespace Stanchion {

/**
 * @brief Persistent store fault (I/O, connection, constraint)
 */
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ProvenanceStats {
    int64_t count = 0;
    double mean_confidence = 0.0;
};

struct StoreStats {
    int64_t total_records = 0;
    int64_t verified_records = 0;
    int64_t correction_events = 0;
    int64_t hypotheses = 0;
    std::map<std::string, ProvenanceStats> by_source;
};

/**
 * @brief Content-addressed id of a correction event (UUID text)
 */
std::string correction_event_id(const CorrectionEvent& event);

class AnalysisStore {
public:
    virtual ~AnalysisStore() = default;

    /**
     * @brief Upsert a record keyed by subject_id
     * @throws StorageError
     */
    virtual void store_analysis(const SubjectRecord& record) = 0;

    /**
     * @brief Upsert unless the existing record is verified
     *
     * Check and write happen atomically.
     * @return false when a verified record was left untouched
     * @throws StorageError
     */
    virtual bool store_analysis_unless_verified(const SubjectRecord& record) = 0;

    /**
     * @throws StorageError
     */
    virtual std::optional<SubjectRecord> get_analysis(const std::string& subject_id) = 0;

    /**
     * @brief Record a human correction
     *
     * Appends a CorrectionEvent, marks the record verified with confidence
     * 1.0 and bumps its correction_count, and feeds every bucket of a
     * numeric id into pattern learning. Subjects without a record use the
     * fixed fallback answer as their "before" values.
     *
     * @return the appended event
     * @throws StorageError, in which case nothing was applied
     */
    virtual CorrectionEvent apply_correction(const std::string& subject_id,
                                             const Label& material_after,
                                             const Label& type_after) = 0;

    /**
     * @brief Best learned (material, type, confidence) for a subject id
     * @return nullopt for non-numeric ids or when no bucket has a hypothesis
     * @throws StorageError
     */
    virtual std::optional<Classification> query_learned_prediction(const std::string& subject_id) = 0;

    /**
     * @brief All hypotheses competing for one bucket
     */
    virtual std::vector<PatternHypothesis> hypotheses(const BucketKey& bucket) = 0;

    /**
     * @brief Full correction log in sequence order
     */
    virtual std::vector<CorrectionEvent> corrections() = 0;

    /**
     * @brief Every subject record, newest first
     */
    virtual std::vector<SubjectRecord> snapshot() = 0;

    /**
     * @brief Append to the prediction outcome log
     * @return the stored outcome with its sequence assigned
     */
    virtual OutcomeRecord append_outcome(double predicted_confidence, bool was_correct) = 0;

    /**
     * @brief Outcome log in sequence order
     */
    virtual std::vector<OutcomeRecord> outcomes() = 0;

    virtual StoreStats stats() = 0;
};

} // namespace Stanchion
