/**
 * @file calibration_tracker.cpp
 * @brief Calibration bins, confusion tallies and the accuracy trend series
 */

#include <calibration/calibration_tracker.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

namespace Stanchion {

const char* to_string(CalibrationJudgement judgement) {
    switch (judgement) {
        case CalibrationJudgement::Calibrated:       return "calibrated";
        case CalibrationJudgement::Overconfident:    return "overconfident";
        case CalibrationJudgement::Underconfident:   return "underconfident";
        case CalibrationJudgement::InsufficientData: return "insufficient_data";
    }
    return "unknown";
}

const char* to_string(AccuracyTrend trend) {
    switch (trend) {
        case AccuracyTrend::Improving: return "improving";
        case AccuracyTrend::Declining: return "declining";
        case AccuracyTrend::Stable:    return "stable";
    }
    return "unknown";
}

const char* to_string(ConfusionAxis axis) {
    return axis == ConfusionAxis::Material ? "material" : "type";
}

CalibrationTracker::CalibrationTracker(AnalysisStore& store) : store_(store) {}

int CalibrationTracker::decile_of(double confidence) {
    double clamped = std::clamp(confidence, 0.0, 1.0);
    return static_cast<int>(std::lround(clamped * 10.0)) * 10;
}

void CalibrationTracker::fold(const OutcomeRecord& outcome) {
    int key = decile_of(outcome.predicted_confidence);
    CalibrationBin& b = bins_[key];
    b.level_pct = key;
    b.total += 1;
    if (outcome.was_correct) b.correct += 1;

    total_ += 1;
    if (outcome.was_correct) correct_ += 1;

    AccuracySnapshot snapshot;
    snapshot.timestamp = outcome.timestamp;
    snapshot.running_accuracy = static_cast<double>(correct_) / static_cast<double>(total_);
    snapshots_.push_back(snapshot);
}

void CalibrationTracker::load() {
    auto log = store_.outcomes();

    std::lock_guard<std::mutex> lock(mutex_);
    bins_.clear();
    snapshots_.clear();
    total_ = 0;
    correct_ = 0;
    snapshots_.reserve(log.size());
    for (const auto& outcome : log) {
        fold(outcome);
    }
    Logger::debug("Calibration replayed " + std::to_string(log.size()) + " outcomes");
}

void CalibrationTracker::record_outcome(double predicted_confidence, bool was_correct) {
    std::lock_guard<std::mutex> lock(mutex_);
    OutcomeRecord outcome = store_.append_outcome(predicted_confidence, was_correct);
    fold(outcome);
}

std::vector<CalibrationBin> CalibrationTracker::bins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CalibrationBin> result;
    result.reserve(bins_.size());
    for (const auto& [key, b] : bins_) result.push_back(b);
    return result;
}

CalibrationBin CalibrationTracker::bin(int level_pct) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bins_.find(level_pct);
    if (it != bins_.end()) return it->second;

    CalibrationBin empty;
    empty.level_pct = level_pct;
    return empty;
}

double CalibrationTracker::calibration_error(const CalibrationBin& bin) {
    return std::abs(bin.accuracy() - bin.level());
}

CalibrationJudgement CalibrationTracker::judge(const CalibrationBin& bin) {
    if (bin.total < MIN_BIN_EVIDENCE) return CalibrationJudgement::InsufficientData;

    double gap = bin.level() - bin.accuracy();
    if (gap > JUDGEMENT_MARGIN) return CalibrationJudgement::Overconfident;
    if (-gap > JUDGEMENT_MARGIN) return CalibrationJudgement::Underconfident;
    return CalibrationJudgement::Calibrated;
}

std::vector<ConfusionTally> CalibrationTracker::tally_confusions(const std::vector<CorrectionEvent>& log,
                                                                 ConfusionAxis axis, size_t n) {
    std::map<std::pair<Label, Label>, ConfusionTally> tallies;

    for (const auto& event : log) {
        const Label& before = axis == ConfusionAxis::Material ? event.material_before : event.type_before;
        const Label& after = axis == ConfusionAxis::Material ? event.material_after : event.type_after;
        if (before == after) continue;

        ConfusionTally& t = tallies[{before, after}];
        t.before = before;
        t.after = after;
        t.count += 1;
        t.last_sequence = std::max(t.last_sequence, event.sequence);
    }

    std::vector<ConfusionTally> ranked;
    ranked.reserve(tallies.size());
    for (auto& [pair, t] : tallies) ranked.push_back(std::move(t));

    std::sort(ranked.begin(), ranked.end(), [](const ConfusionTally& a, const ConfusionTally& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.last_sequence > b.last_sequence;
    });
    if (ranked.size() > n) ranked.resize(n);
    return ranked;
}

std::vector<ConfusionTally> CalibrationTracker::top_confusions(ConfusionAxis axis, size_t n) const {
    return tally_confusions(store_.corrections(), axis, n);
}

AccuracyTrend CalibrationTracker::accuracy_trend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshots_.size() < 2 * TREND_WINDOW) return AccuracyTrend::Stable;

    auto mean = [](auto first, auto last) {
        double sum = std::accumulate(first, last, 0.0, [](double acc, const AccuracySnapshot& s) {
            return acc + s.running_accuracy;
        });
        return sum / static_cast<double>(std::distance(first, last));
    };

    const auto window = static_cast<std::ptrdiff_t>(TREND_WINDOW);
    auto recent_begin = snapshots_.end() - window;
    auto prior_begin = recent_begin - window;
    double recent = mean(recent_begin, snapshots_.end());
    double prior = mean(prior_begin, recent_begin);

    if (recent - prior > TREND_THRESHOLD) return AccuracyTrend::Improving;
    if (prior - recent > TREND_THRESHOLD) return AccuracyTrend::Declining;
    return AccuracyTrend::Stable;
}

std::vector<AccuracySnapshot> CalibrationTracker::snapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_;
}

double CalibrationTracker::overall_accuracy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_ > 0 ? static_cast<double>(correct_) / static_cast<double>(total_) : 0.0;
}

CalibrationReport CalibrationTracker::report(size_t confusions) const {
    CalibrationReport out;
    for (const auto& b : bins()) {
        CalibrationReport::BinReport entry;
        entry.bin = b;
        entry.error = calibration_error(b);
        entry.judgement = judge(b);
        out.bins.push_back(entry);
    }

    auto log = store_.corrections();
    out.material_confusions = tally_confusions(log, ConfusionAxis::Material, confusions);
    out.type_confusions = tally_confusions(log, ConfusionAxis::Type, confusions);
    out.trend = accuracy_trend();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.outcomes = total_;
    }
    out.overall_accuracy = overall_accuracy();
    return out;
}

std::vector<std::string> CalibrationTracker::prompt_hints(size_t confusions) const {
    std::vector<std::string> hints;

    auto log = store_.corrections();
    for (ConfusionAxis axis : {ConfusionAxis::Material, ConfusionAxis::Type}) {
        for (const auto& t : tally_confusions(log, axis, confusions)) {
            hints.push_back("Do not confuse " + t.before + " with " + t.after +
                            " (seen " + std::to_string(t.count) + " times).");
        }
    }

    auto current = bins();
    bool overconfident = std::any_of(current.begin(), current.end(), [](const CalibrationBin& b) {
        return judge(b) == CalibrationJudgement::Overconfident;
    });
    if (overconfident) {
        hints.push_back("Answers tend to be overconfident. Use confidence above 0.8 only when "
                        "the visual evidence is unambiguous.");
    }
    return hints;
}

nlohmann::json to_json(const CalibrationReport& report) {
    nlohmann::json bins = nlohmann::json::array();
    for (const auto& entry : report.bins) {
        bins.push_back({
            {"level", entry.bin.level_pct},
            {"total", entry.bin.total},
            {"correct", entry.bin.correct},
            {"accuracy", entry.bin.accuracy()},
            {"calibration_error", entry.error},
            {"judgement", to_string(entry.judgement)}
        });
    }

    auto confusions = [](const std::vector<ConfusionTally>& tallies) {
        nlohmann::json rows = nlohmann::json::array();
        for (const auto& t : tallies) {
            rows.push_back({{"before", t.before}, {"after", t.after}, {"count", t.count}});
        }
        return rows;
    };

    return {
        {"bins", bins},
        {"material_confusions", confusions(report.material_confusions)},
        {"type_confusions", confusions(report.type_confusions)},
        {"trend", to_string(report.trend)},
        {"outcomes", report.outcomes},
        {"overall_accuracy", report.overall_accuracy}
    };
}

} // namespace Stanchion
