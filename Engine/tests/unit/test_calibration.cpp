/**
 * @file test_calibration.cpp
 * @brief Calibration bins, judgements, confusion tallies and trend
 */

#include <gtest/gtest.h>
#include <calibration/calibration_tracker.hpp>
#include <storage/memory_analysis_store.hpp>
#include <utils/json_output.hpp>

using namespace Stanchion;

class CalibrationTest : public ::testing::Test {
protected:
    void record_many(double confidence, int total, int correct) {
        for (int i = 0; i < total; ++i) tracker.record_outcome(confidence, i < correct);
    }

    void correction(const std::string& id, const std::string& before_material, const std::string& before_type,
                    const std::string& after_material, const std::string& after_type) {
        SubjectRecord prior;
        prior.subject_id = id;
        prior.material = before_material;
        prior.type = before_type;
        prior.confidence = 0.7;
        store.store_analysis(prior);
        store.apply_correction(id, after_material, after_type);
    }

    MemoryAnalysisStore store;
    CalibrationTracker tracker{store};
};

TEST_F(CalibrationTest, DecileKeys) {
    EXPECT_EQ(CalibrationTracker::decile_of(0.0), 0);
    EXPECT_EQ(CalibrationTracker::decile_of(0.04), 0);
    EXPECT_EQ(CalibrationTracker::decile_of(0.06), 10);
    EXPECT_EQ(CalibrationTracker::decile_of(0.94), 90);
    EXPECT_EQ(CalibrationTracker::decile_of(0.96), 100);
    EXPECT_EQ(CalibrationTracker::decile_of(1.0), 100);
    EXPECT_EQ(CalibrationTracker::decile_of(-0.3), 0);
    EXPECT_EQ(CalibrationTracker::decile_of(1.7), 100);
}

TEST_F(CalibrationTest, RecordOutcomeFillsBins) {
    tracker.record_outcome(0.87, true);
    tracker.record_outcome(0.91, false);
    tracker.record_outcome(0.42, true);

    CalibrationBin high = tracker.bin(90);
    EXPECT_EQ(high.total, 2);
    EXPECT_EQ(high.correct, 1);
    EXPECT_EQ(tracker.bin(40).total, 1);
    EXPECT_EQ(tracker.bin(70).total, 0);
    EXPECT_EQ(tracker.bins().size(), 2u);
    EXPECT_EQ(store.outcomes().size(), 3u);
}

TEST_F(CalibrationTest, OverconfidentBin) {
    record_many(0.9, 20, 10);

    CalibrationBin b = tracker.bin(90);
    EXPECT_DOUBLE_EQ(b.accuracy(), 0.5);
    EXPECT_NEAR(CalibrationTracker::calibration_error(b), 0.4, 1e-12);
    EXPECT_EQ(CalibrationTracker::judge(b), CalibrationJudgement::Overconfident);
}

TEST_F(CalibrationTest, UnderconfidentBin) {
    record_many(0.3, 10, 10);
    EXPECT_EQ(CalibrationTracker::judge(tracker.bin(30)), CalibrationJudgement::Underconfident);
}

TEST_F(CalibrationTest, CalibratedBin) {
    record_many(0.8, 10, 8);
    EXPECT_EQ(CalibrationTracker::judge(tracker.bin(80)), CalibrationJudgement::Calibrated);
}

TEST_F(CalibrationTest, SmallBinsAreNotJudged) {
    record_many(0.9, 4, 0);
    EXPECT_EQ(CalibrationTracker::judge(tracker.bin(90)), CalibrationJudgement::InsufficientData);
}

TEST_F(CalibrationTest, FailedPersistenceRecordsNothing) {
    store.set_fault_hook([](std::string_view stage) {
        if (stage == "outcome") throw StorageError("read-only");
    });
    EXPECT_THROW(tracker.record_outcome(0.9, true), StorageError);
    EXPECT_EQ(tracker.bin(90).total, 0);
    EXPECT_TRUE(tracker.snapshots().empty());
}

TEST_F(CalibrationTest, LoadReplaysOutcomeLog) {
    record_many(0.9, 20, 10);
    record_many(0.5, 6, 3);

    CalibrationTracker restarted(store);
    restarted.load();
    EXPECT_EQ(restarted.bin(90).total, 20);
    EXPECT_EQ(restarted.bin(90).correct, 10);
    EXPECT_EQ(restarted.bin(50).total, 6);
    EXPECT_EQ(restarted.snapshots().size(), 26u);
    EXPECT_DOUBLE_EQ(restarted.overall_accuracy(), 13.0 / 26.0);
}

TEST_F(CalibrationTest, TopConfusionsMostFrequentFirst) {
    correction("1", "kov", "A", "betón", "A");
    correction("2", "kov", "A", "betón", "A");
    correction("3", "kov", "A", "betón", "B");
    correction("4", "drevo", "A", "kov", "A");
    correction("5", "kov", "A", "kov", "A");    // confirmation, not a confusion

    auto materials = tracker.top_confusions(ConfusionAxis::Material, 5);
    ASSERT_EQ(materials.size(), 2u);
    EXPECT_EQ(materials[0].before, "kov");
    EXPECT_EQ(materials[0].after, "betón");
    EXPECT_EQ(materials[0].count, 3);
    EXPECT_EQ(materials[1].before, "drevo");

    auto types = tracker.top_confusions(ConfusionAxis::Type, 5);
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0].before, "A");
    EXPECT_EQ(types[0].after, "B");

    EXPECT_EQ(tracker.top_confusions(ConfusionAxis::Material, 1).size(), 1u);
}

TEST_F(CalibrationTest, ConfusionTiesPreferMostRecent) {
    auto event = [](int64_t seq, const std::string& before, const std::string& after) {
        CorrectionEvent e;
        e.sequence = seq;
        e.material_before = before;
        e.material_after = after;
        e.type_before = e.type_after = "T";
        return e;
    };
    std::vector<CorrectionEvent> log = {
        event(1, "kov", "betón"),
        event(2, "drevo", "plást"),
        event(3, "kov", "betón"),
        event(4, "drevo", "plást"),
        event(5, "plást", "kov")
    };

    auto ranked = CalibrationTracker::tally_confusions(log, ConfusionAxis::Material, 3);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].before, "drevo");
    EXPECT_EQ(ranked[0].last_sequence, 4);
    EXPECT_EQ(ranked[1].before, "kov");
    EXPECT_EQ(ranked[2].before, "plást");
}

TEST_F(CalibrationTest, TrendNeedsTwentySnapshots) {
    for (int i = 0; i < 19; ++i) tracker.record_outcome(0.7, i >= 10);
    EXPECT_EQ(tracker.accuracy_trend(), AccuracyTrend::Stable);
}

TEST_F(CalibrationTest, TrendImproving) {
    for (int i = 0; i < 10; ++i) tracker.record_outcome(0.7, false);
    for (int i = 0; i < 10; ++i) tracker.record_outcome(0.7, true);
    EXPECT_EQ(tracker.accuracy_trend(), AccuracyTrend::Improving);
}

TEST_F(CalibrationTest, TrendDeclining) {
    for (int i = 0; i < 10; ++i) tracker.record_outcome(0.7, true);
    for (int i = 0; i < 10; ++i) tracker.record_outcome(0.7, false);
    EXPECT_EQ(tracker.accuracy_trend(), AccuracyTrend::Declining);
}

TEST_F(CalibrationTest, TrendStable) {
    for (int i = 0; i < 30; ++i) tracker.record_outcome(0.7, true);
    EXPECT_EQ(tracker.accuracy_trend(), AccuracyTrend::Stable);
}

TEST_F(CalibrationTest, PromptHintsCarryConfusionsAndOverconfidence) {
    correction("1", "kov", "A", "betón", "A");
    correction("2", "kov", "A", "betón", "A");
    EXPECT_EQ(tracker.prompt_hints().size(), 1u);

    record_many(0.9, 10, 2);
    auto hints = tracker.prompt_hints();
    ASSERT_EQ(hints.size(), 2u);
    EXPECT_EQ(hints[0], "Do not confuse kov with betón (seen 2 times).");
    EXPECT_NE(hints[1].find("overconfident"), std::string::npos);
}

TEST_F(CalibrationTest, ReportSerializesToJson) {
    record_many(0.9, 20, 10);
    correction("1", "kov", "A", "betón", "B");

    CalibrationReport report = tracker.report();
    ASSERT_EQ(report.bins.size(), 1u);
    EXPECT_EQ(report.bins[0].judgement, CalibrationJudgement::Overconfident);
    EXPECT_EQ(report.outcomes, 20);

    nlohmann::json j = to_json(report);
    EXPECT_EQ(j["bins"][0]["level"], 90);
    EXPECT_EQ(j["bins"][0]["judgement"], "overconfident");
    EXPECT_EQ(j["material_confusions"][0]["after"], "betón");
    EXPECT_EQ(j["type_confusions"][0]["count"], 1);
    EXPECT_EQ(j["trend"], "stable");
}

TEST_F(CalibrationTest, ReportWithInvalidUtf8LabelStillDumps) {
    correction("1", "kov", "A", "bet\xf3n", "A");

    std::string text;
    ASSERT_NO_THROW(text = dump_report(to_json(tracker.report())));

    nlohmann::json j = nlohmann::json::parse(text);
    EXPECT_EQ(j["material_confusions"][0]["before"], "kov");
    EXPECT_NE(j["material_confusions"][0]["after"].get<std::string>().find("\xEF\xBF\xBD"), std::string::npos);
}
