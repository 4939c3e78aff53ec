/**
 * @file test_memory_store.cpp
 * @brief Pattern-learning store semantics on the in-memory implementation
 */

#include <gtest/gtest.h>
#include <storage/memory_analysis_store.hpp>
#include <storage/pattern_buckets.hpp>
#include <atomic>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace Stanchion;

namespace {

SubjectRecord record(const std::string& id, const std::string& material, const std::string& type,
                     double confidence, double timestamp = 1000.0) {
    SubjectRecord r;
    r.subject_id = id;
    r.material = material;
    r.type = type;
    r.confidence = confidence;
    r.source_kind = SourceKind::Ensemble;
    r.timestamp = timestamp;
    return r;
}

const PatternHypothesis* find(const std::vector<PatternHypothesis>& competing,
                              const std::string& material, const std::string& type) {
    for (const auto& h : competing) {
        if (h.material == material && h.type == type) return &h;
    }
    return nullptr;
}

} // namespace

class MemoryStoreTest : public ::testing::Test {
protected:
    MemoryAnalysisStore store;
};

TEST_F(MemoryStoreTest, StoreThenGetRoundTrips) {
    store.store_analysis(record("120", "kov", "stĺp značky dvojitý", 0.72));

    auto loaded = store.get_analysis("120");
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->material, "kov");
    EXPECT_EQ(loaded->type, "stĺp značky dvojitý");
    EXPECT_DOUBLE_EQ(loaded->confidence, 0.72);
    EXPECT_FALSE(loaded->verified);

    EXPECT_FALSE(store.get_analysis("121"));
}

TEST_F(MemoryStoreTest, StoreUpsertsByKey) {
    store.store_analysis(record("7", "kov", "A", 0.6));
    store.store_analysis(record("7", "betón", "B", 0.8));
    EXPECT_EQ(store.get_analysis("7")->material, "betón");
    EXPECT_EQ(store.snapshot().size(), 1u);
}

TEST_F(MemoryStoreTest, CorrectionOfUnknownSubjectUsesFallbackBefore) {
    CorrectionEvent event = store.apply_correction("55", "betón", "Y");
    EXPECT_EQ(event.material_before, kFallbackMaterial);
    EXPECT_EQ(event.type_before, kFallbackType);
    EXPECT_EQ(event.material_after, "betón");
    EXPECT_EQ(event.sequence, 1);
    EXPECT_EQ(event.id.size(), 36u);

    auto r = store.get_analysis("55");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r->verified);
    EXPECT_DOUBLE_EQ(r->confidence, 1.0);
    EXPECT_EQ(r->correction_count, 1);
    EXPECT_EQ(r->source_kind, SourceKind::HumanCorrection);
}

TEST_F(MemoryStoreTest, CorrectionRecordsPriorValues) {
    store.store_analysis(record("56", "kov", "A", 0.7));
    CorrectionEvent first = store.apply_correction("56", "betón", "B");
    EXPECT_EQ(first.material_before, "kov");
    EXPECT_EQ(first.type_before, "A");

    CorrectionEvent second = store.apply_correction("56", "drevo", "C");
    EXPECT_EQ(second.material_before, "betón");
    EXPECT_GT(second.sequence, first.sequence);
    EXPECT_NE(second.id, first.id);
    EXPECT_EQ(store.get_analysis("56")->correction_count, 2);
    EXPECT_EQ(store.corrections().size(), 2u);
}

TEST_F(MemoryStoreTest, RepeatedCorrectionGrowsOneHypothesis) {
    store.apply_correction("120", "betón", "Y");
    auto competing = store.hypotheses(BucketKey{BucketType::Mod10, 0});
    ASSERT_EQ(competing.size(), 1u);
    EXPECT_EQ(competing[0].sample_count, 1);

    for (int i = 0; i < 4; ++i) store.apply_correction("120", "betón", "Y");

    competing = store.hypotheses(BucketKey{BucketType::Mod10, 0});
    ASSERT_EQ(competing.size(), 1u);
    EXPECT_EQ(competing[0].sample_count, 5);
    EXPECT_DOUBLE_EQ(competing[0].success_rate, 1.0);

    auto learned = store.query_learned_prediction("120");
    ASSERT_TRUE(learned);
    EXPECT_EQ(learned->material, "betón");
    EXPECT_EQ(learned->type, "Y");
    EXPECT_DOUBLE_EQ(learned->confidence, 0.5);
}

TEST_F(MemoryStoreTest, CompetingHypothesesShareABucket) {
    for (int i = 0; i < 5; ++i) store.apply_correction("120", "betón", "Y");
    store.apply_correction("140", "kov", "Z");

    auto competing = store.hypotheses(BucketKey{BucketType::Mod10, 0});
    ASSERT_EQ(competing.size(), 2u);
    const auto* beton = find(competing, "betón", "Y");
    const auto* kov = find(competing, "kov", "Z");
    ASSERT_TRUE(beton && kov);
    EXPECT_DOUBLE_EQ(beton->success_rate, 5.0 / 6.0);
    EXPECT_DOUBLE_EQ(kov->success_rate, 1.0 / 6.0);

    // id 10 only shares bucket mod10 = 0 with the corrected ids
    auto learned = store.query_learned_prediction("10");
    ASSERT_TRUE(learned);
    EXPECT_EQ(learned->material, "betón");
    EXPECT_NEAR(learned->confidence, (5.0 / 6.0) * 0.5, 1e-12);

    for (int i = 0; i < 5; ++i) store.apply_correction("140", "kov", "Z");
    learned = store.query_learned_prediction("10");
    ASSERT_TRUE(learned);
    EXPECT_EQ(learned->material, "kov");
    EXPECT_EQ(learned->type, "Z");
    EXPECT_NEAR(learned->confidence, (6.0 / 11.0) * 0.6, 1e-12);
}

TEST_F(MemoryStoreTest, NonNumericIdsSkipPatternLearning) {
    store.apply_correction("SK-17", "drevo", "A");
    EXPECT_EQ(store.stats().hypotheses, 0);
    EXPECT_EQ(store.corrections().size(), 1u);
    EXPECT_TRUE(store.get_analysis("SK-17")->verified);
    EXPECT_FALSE(store.query_learned_prediction("SK-17"));
    EXPECT_FALSE(store.query_learned_prediction("120"));
}

TEST_F(MemoryStoreTest, FaultDuringCorrectionLeavesNoTrace) {
    store.store_analysis(record("120", "kov", "A", 0.6));
    store.apply_correction("120", "betón", "Y");

    int calls = 0;
    store.set_fault_hook([&](std::string_view stage) {
        // Fail on the third bucket so earlier buckets are already staged
        if (stage == "pattern_hypothesis" && ++calls == 3) throw StorageError("disk full");
    });

    EXPECT_THROW(store.apply_correction("120", "kov", "Z"), StorageError);

    auto r = store.get_analysis("120");
    EXPECT_EQ(r->material, "betón");
    EXPECT_EQ(r->correction_count, 1);
    EXPECT_EQ(store.corrections().size(), 1u);
    for (const auto& key : buckets_for("120")) {
        auto competing = store.hypotheses(key);
        ASSERT_EQ(competing.size(), 1u);
        EXPECT_EQ(competing[0].material, "betón");
        EXPECT_DOUBLE_EQ(competing[0].success_rate, 1.0);
    }

    store.set_fault_hook(nullptr);
    CorrectionEvent event = store.apply_correction("120", "kov", "Z");
    EXPECT_EQ(event.sequence, 2);
}

TEST_F(MemoryStoreTest, FaultOnStoreAnalysisPropagates) {
    store.set_fault_hook([](std::string_view stage) {
        if (stage == "subject_record") throw StorageError("io error");
    });
    EXPECT_THROW(store.store_analysis(record("1", "kov", "A", 0.9)), StorageError);
    EXPECT_FALSE(store.get_analysis("1"));
}

TEST_F(MemoryStoreTest, RejectsConfidenceOutsideUnitInterval) {
    EXPECT_THROW(store.store_analysis(record("1", "kov", "A", std::nan(""))), StorageError);
    EXPECT_THROW(store.store_analysis(record("1", "kov", "A", 1.5)), StorageError);
    EXPECT_THROW(store.store_analysis_unless_verified(record("1", "kov", "A", -0.1)), StorageError);
    EXPECT_THROW(store.store_analysis_unless_verified(
                     record("1", "kov", "A", std::numeric_limits<double>::infinity())),
                 StorageError);
    EXPECT_FALSE(store.get_analysis("1"));

    store.store_analysis(record("1", "kov", "A", 1.0));
    EXPECT_DOUBLE_EQ(store.get_analysis("1")->confidence, 1.0);
}

TEST_F(MemoryStoreTest, ConditionalUpsertNeverTouchesVerified) {
    store.apply_correction("77", "betón", "B");

    EXPECT_FALSE(store.store_analysis_unless_verified(record("77", "kov", "A", 0.95)));
    auto r = store.get_analysis("77");
    EXPECT_TRUE(r->verified);
    EXPECT_EQ(r->material, "betón");
}

TEST_F(MemoryStoreTest, ConditionalUpsertKeepsCorrectionCount) {
    SubjectRecord prior = record("78", "kov", "A", 0.6);
    prior.correction_count = 3;
    store.store_analysis(prior);

    EXPECT_TRUE(store.store_analysis_unless_verified(record("78", "betón", "B", 0.8)));
    auto r = store.get_analysis("78");
    EXPECT_EQ(r->material, "betón");
    EXPECT_EQ(r->correction_count, 3);
    EXPECT_FALSE(r->verified);
}

TEST_F(MemoryStoreTest, SnapshotIsNewestFirst) {
    store.store_analysis(record("a", "kov", "A", 0.6, 100.0));
    store.store_analysis(record("b", "kov", "A", 0.6, 300.0));
    store.store_analysis(record("c", "kov", "A", 0.6, 200.0));

    auto rows = store.snapshot();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].subject_id, "b");
    EXPECT_EQ(rows[1].subject_id, "c");
    EXPECT_EQ(rows[2].subject_id, "a");
}

TEST_F(MemoryStoreTest, StatsGroupByProvenance) {
    store.store_analysis(record("1", "kov", "A", 0.6));
    store.store_analysis(record("2", "kov", "A", 0.8));
    store.apply_correction("3", "betón", "B");

    StoreStats stats = store.stats();
    EXPECT_EQ(stats.total_records, 3);
    EXPECT_EQ(stats.verified_records, 1);
    EXPECT_EQ(stats.correction_events, 1);
    EXPECT_EQ(stats.hypotheses, 5);
    EXPECT_EQ(stats.by_source["ensemble"].count, 2);
    EXPECT_NEAR(stats.by_source["ensemble"].mean_confidence, 0.7, 1e-12);
    EXPECT_EQ(stats.by_source["human_correction"].count, 1);
}

TEST_F(MemoryStoreTest, OutcomesAreSequenced) {
    auto first = store.append_outcome(0.9, true);
    auto second = store.append_outcome(0.4, false);
    EXPECT_EQ(first.sequence, 1);
    EXPECT_EQ(second.sequence, 2);

    auto log = store.outcomes();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_DOUBLE_EQ(log[1].predicted_confidence, 0.4);
    EXPECT_FALSE(log[1].was_correct);
}

TEST_F(MemoryStoreTest, ConcurrentCorrectionsOfOneSubjectDoNotInterleave) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < kPerThread; ++i) store.apply_correction("300", "kov", "A");
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(store.get_analysis("300")->correction_count, kThreads * kPerThread);
    auto log = store.corrections();
    ASSERT_EQ(log.size(), static_cast<size_t>(kThreads * kPerThread));
    for (size_t i = 1; i < log.size(); ++i) {
        EXPECT_GT(log[i].sequence, log[i - 1].sequence);
    }
    EXPECT_EQ(store.hypotheses(BucketKey{BucketType::Mod10, 0})[0].sample_count, kThreads * kPerThread);
}
