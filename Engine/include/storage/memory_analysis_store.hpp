/**
 * @file memory_analysis_store.hpp
 * @brief In-process AnalysisStore with staged, all-or-nothing corrections
 */

#pragma once

#include <export.hpp>
#include <storage/analysis_store.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <string_view>
#include <unordered_map>

namespace Stanchion {

/**
 * @brief AnalysisStore held in memory
 *
 * A correction is staged on copies of every row it touches and published
 * only after all stages succeed. The fault hook runs before each write
 * stage ("subject_record", "correction_event", "pattern_hypothesis",
 * "outcome") and may throw StorageError to simulate an I/O fault.
 */
class STANCHION_API MemoryAnalysisStore : public AnalysisStore {
public:
    using FaultHook = std::function<void(std::string_view stage)>;

    MemoryAnalysisStore() = default;

    void set_fault_hook(FaultHook hook);

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
    void check_fault(std::string_view stage) const;

    std::mutex mutex_;
    FaultHook fault_hook_;
    std::unordered_map<std::string, SubjectRecord> records_;
    std::vector<CorrectionEvent> log_;
    std::map<BucketKey, std::vector<PatternHypothesis>> hypotheses_;
    std::vector<OutcomeRecord> outcomes_;
    int64_t next_event_sequence_ = 1;
    int64_t next_outcome_sequence_ = 1;
};

} // namespace Stanchion
