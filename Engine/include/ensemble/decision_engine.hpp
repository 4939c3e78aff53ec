/**
 * @file decision_engine.hpp
 * @brief Ensemble decision engine: gather, weight, vote, write back
 */

#pragma once

#include <export.hpp>
#include <config/engine_config.hpp>
#include <storage/analysis_store.hpp>
#include <storage/subject_lock.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace Stanchion {

class CalibrationTracker;
class PhotographSource;
class RegionAggregator;
class VisionOracle;

struct BatchDecision {
    std::string subject_id;
    Classification result;
};

/**
 * @brief Top-level classification entry point
 *
 * decide() is total: source and store faults are logged and degrade the
 * answer, never the call. Writes for one subject (corrections and the
 * decide write-back) are serialized through a SubjectLockTable; decisions
 * for distinct subjects run independently.
 */
class STANCHION_API DecisionEngine {
public:
    /**
     * @throws ConfigError when config fails validation
     */
    explicit DecisionEngine(AnalysisStore& store, EngineConfig config = {});

    /**
     * @brief Enable the region consensus source
     *
     * Builds a RegionAggregator over oracle and photos with the configured
     * aggregator settings. Calibration hints reach it once set_calibration()
     * has been called, in either order.
     */
    void set_vision(std::shared_ptr<VisionOracle> oracle, std::shared_ptr<PhotographSource> photos);
    void set_calibration(CalibrationTracker* calibration);

    /**
     * @brief Decide (material, type, confidence) for one subject
     *
     * A verified record short-circuits with confidence 1.0 unless
     * force_refresh is set. Otherwise observations from the region
     * aggregator, learned patterns, an unverified prior record and the id
     * rules are combined by weighted vote with an agreement bonus. Results
     * at or above the store threshold are written back unless the record
     * is verified by then.
     */
    Classification decide(const std::string& subject_id, bool force_refresh = false);

    /**
     * @brief Sequential decide over ids; stop is checked between subjects only
     */
    std::vector<BatchDecision> decide_batch(const std::vector<std::string>& subject_ids,
                                            bool force_refresh = false,
                                            const std::atomic<bool>* stop = nullptr);

    /**
     * @brief Apply a human correction and report the prior prediction's outcome
     *
     * The outcome (prior confidence, prior answer == correction) is recorded
     * only when an unverified engine prediction existed.
     * @throws StorageError when the correction could not be applied
     */
    CorrectionEvent correct(const std::string& subject_id, const Label& material, const Label& type);

    /**
     * @brief Observations decide() would vote on, in gathering order
     */
    std::vector<Observation> gather(const std::string& subject_id,
                                    const std::optional<SubjectRecord>& record);

    const EngineConfig& config() const { return config_; }

private:
    Observation make_observation(const Classification& c, SourceKind kind) const;
    void write_back(const std::string& subject_id, const Classification& decision);

    AnalysisStore& store_;
    EngineConfig config_;
    std::shared_ptr<RegionAggregator> aggregator_;
    CalibrationTracker* calibration_ = nullptr;
    SubjectLockTable locks_;
};

} // namespace Stanchion
