/**
 * @file calibration_tracker.hpp
 * @brief Confidence calibration bins, confusion tallies and accuracy trend
 *
 * Read-side projections. Outcomes arrive through record_outcome() and are
 * appended to the store's outcome log; confusion tallies are recomputed on
 * demand from the store's correction log. Nothing here writes subject
 * records.
 */

#pragma once

#include <export.hpp>
#include <storage/analysis_store.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace Stanchion {

enum class CalibrationJudgement {
    Calibrated,
    Overconfident,
    Underconfident,
    InsufficientData   // fewer than MIN_BIN_EVIDENCE outcomes
};

enum class AccuracyTrend {
    Improving,
    Declining,
    Stable
};

enum class ConfusionAxis {
    Material,
    Type
};

const char* to_string(CalibrationJudgement judgement);
const char* to_string(AccuracyTrend trend);
const char* to_string(ConfusionAxis axis);

struct CalibrationBin {
    int level_pct = 0;          // 0, 10, ..., 100
    int64_t total = 0;
    int64_t correct = 0;

    double level() const { return level_pct / 100.0; }
    double accuracy() const { return total > 0 ? static_cast<double>(correct) / total : 0.0; }
};

struct ConfusionTally {
    Label before;
    Label after;
    int64_t count = 0;
    int64_t last_sequence = 0;  // most recent event carrying this pair
};

struct AccuracySnapshot {
    double timestamp = 0.0;
    double running_accuracy = 0.0;
};

struct CalibrationReport {
    struct BinReport {
        CalibrationBin bin;
        double error = 0.0;
        CalibrationJudgement judgement = CalibrationJudgement::InsufficientData;
    };

    std::vector<BinReport> bins;
    std::vector<ConfusionTally> material_confusions;
    std::vector<ConfusionTally> type_confusions;
    AccuracyTrend trend = AccuracyTrend::Stable;
    int64_t outcomes = 0;
    double overall_accuracy = 0.0;
};

nlohmann::json to_json(const CalibrationReport& report);

class STANCHION_API CalibrationTracker {
public:
    static constexpr int64_t MIN_BIN_EVIDENCE = 5;
    static constexpr double JUDGEMENT_MARGIN = 0.2;
    static constexpr size_t TREND_WINDOW = 10;
    static constexpr double TREND_THRESHOLD = 0.05;

    explicit CalibrationTracker(AnalysisStore& store);

    /**
     * @brief Replay the store's outcome log into fresh bins and snapshots
     * @throws StorageError
     */
    void load();

    /**
     * @brief Persist an outcome and fold it into the bins and trend series
     * @throws StorageError, in which case nothing is recorded
     */
    void record_outcome(double predicted_confidence, bool was_correct);

    /**
     * @brief Decile key of a confidence: round(clamp(c, 0, 1) x 10) x 10
     */
    static int decile_of(double confidence);

    std::vector<CalibrationBin> bins() const;
    CalibrationBin bin(int level_pct) const;

    /// |accuracy - level|
    static double calibration_error(const CalibrationBin& bin);
    static CalibrationJudgement judge(const CalibrationBin& bin);

    /**
     * @brief n most frequent (before, after) pairs on one axis
     *
     * Events where before == after on that axis are not confusions.
     * Equal counts are ordered by most recent occurrence.
     * @throws StorageError
     */
    std::vector<ConfusionTally> top_confusions(ConfusionAxis axis, size_t n) const;

    static std::vector<ConfusionTally> tally_confusions(const std::vector<CorrectionEvent>& log,
                                                        ConfusionAxis axis, size_t n);

    AccuracyTrend accuracy_trend() const;
    std::vector<AccuracySnapshot> snapshots() const;
    double overall_accuracy() const;

    CalibrationReport report(size_t confusions = 5) const;

    /**
     * @brief Instruction additions for the vision oracle
     *
     * One line per top confusion on each axis, plus a caution when any
     * bin is judged overconfident.
     */
    std::vector<std::string> prompt_hints(size_t confusions = 3) const;

private:
    void fold(const OutcomeRecord& outcome);

    AnalysisStore& store_;
    mutable std::mutex mutex_;
    std::map<int, CalibrationBin> bins_;
    std::vector<AccuracySnapshot> snapshots_;
    int64_t total_ = 0;
    int64_t correct_ = 0;
};

} // namespace Stanchion
