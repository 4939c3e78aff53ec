/**
 * @file postgres_analysis_store.hpp
 * @brief AnalysisStore backed by the stanchion PostgreSQL schema
 */

#pragma once

#include <export.hpp>
#include <storage/analysis_store.hpp>
#include <database/postgres_connection.hpp>
#include <mutex>

namespace Stanchion {

/**
 * @brief PostgreSQL AnalysisStore
 *
 * Every read-then-write runs in one transaction that first takes
 * pg_advisory_xact_lock on the subject id, so writers for the same subject
 * serialize across processes. Corrections additionally lock each touched
 * bucket (always in bucket order) before recomputing its success rates.
 *
 * The connection is shared by all callers of this store and guarded by an
 * internal mutex. Driver errors surface as StorageError.
 */
class STANCHION_API PostgresAnalysisStore : public AnalysisStore {
public:
    explicit PostgresAnalysisStore(PostgresConnection& db);

    /**
     * @brief Create schema stanchion and its tables if missing
     */
    void ensure_schema();

    void store_analysis(const SubjectRecord& record) override;
    bool store_analysis_unless_verified(const SubjectRecord& record) override;
    std::optional<SubjectRecord> get_analysis(const std::string& subject_id) override;
    CorrectionEvent apply_correction(const std::string& subject_id,
                                     const Label& material_after,
                                     const Label& type_after) override;
    std::optional<Classification> query_learned_prediction(const std::string& subject_id) override;
    std::vector<PatternHypothesis> hypotheses(const BucketKey& bucket) override;
    std::vector<CorrectionEvent> corrections() override;
    std::vector<SubjectRecord> snapshot() override;
    OutcomeRecord append_outcome(double predicted_confidence, bool was_correct) override;
    std::vector<OutcomeRecord> outcomes() override;
    StoreStats stats() override;

private:
    std::optional<SubjectRecord> fetch_record(const std::string& subject_id, bool for_update);
    std::vector<PatternHypothesis> fetch_hypotheses(const BucketKey& bucket);

    PostgresConnection& db_;
    std::mutex mutex_;
};

} // namespace Stanchion
