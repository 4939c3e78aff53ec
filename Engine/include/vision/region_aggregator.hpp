/**
 * @file region_aggregator.hpp
 * @brief Multi-region majority vote over one photograph
 */

#pragma once

#include <export.hpp>
#include <vision/vision_oracle.hpp>
#include <vision/region_plan.hpp>
#include <vision/oracle_reply_parser.hpp>
#include <core/classification.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Stanchion {

class CalibrationTracker;

struct AggregatorConfig {
    double min_confidence = 0.3;                    // replies at or below are discarded
    std::chrono::milliseconds timeout{45000};       // per region, shared deadline
    int min_edge = RegionPlan::DEFAULT_MIN_EDGE;
    int max_edge = RegionPlan::DEFAULT_MAX_EDGE;
    size_t hint_confusions = 3;
};

enum class RegionStatus {
    Accepted,
    LowConfidence,
    Unparseable,
    Failed,
    TimedOut
};

const char* to_string(RegionStatus status);

struct RegionVote {
    std::string region;
    RegionStatus status = RegionStatus::Failed;
    std::optional<OracleReply> reply;
    std::string detail;
};

struct AggregationResult {
    Classification consensus;
    std::vector<RegionVote> votes;
    size_t survivors = 0;
    bool fallback = false;
};

/**
 * @brief Turns several region-scoped oracle replies into one Observation
 *
 * Region calls run concurrently on their own threads and share one
 * deadline. Aggregation is a barrier: voting starts only after every call
 * has returned, failed, or missed the deadline. A call that misses the
 * deadline keeps running detached and its result is dropped.
 */
class STANCHION_API RegionAggregator {
public:
    RegionAggregator(std::shared_ptr<VisionOracle> oracle,
                     std::shared_ptr<PhotographSource> photos,
                     AggregatorConfig config = {});

    /**
     * @brief Append calibration prompt hints to every region instruction
     */
    void set_calibration(const CalibrationTracker* calibration);

    /**
     * @brief Fetch the subject's photograph and aggregate it
     * @return nullopt when no photograph is available or no region survived;
     *         the zero-survivor fallback is only reported by aggregate()
     */
    std::optional<Classification> observe(const std::string& subject_id);

    AggregationResult aggregate(const Photograph& photo);

    const AggregatorConfig& config() const { return config_; }

private:
    std::vector<std::string> current_hints() const;

    std::shared_ptr<VisionOracle> oracle_;
    std::shared_ptr<PhotographSource> photos_;
    AggregatorConfig config_;
    const CalibrationTracker* calibration_ = nullptr;
};

} // namespace Stanchion
