/**
 * @file test_postgres_store.cpp
 * @brief Pattern-learning store against a live PostgreSQL database
 *
 * Connects with STANCHION_TEST_CONNINFO (default "dbname=stanchion_test").
 * Tests are skipped when the database is unavailable. Every test starts from
 * empty stanchion tables.
 */

#include <gtest/gtest.h>
#include <database/postgres_connection.hpp>
#include <storage/postgres_analysis_store.hpp>
#include <storage/pattern_buckets.hpp>
#include <cstdlib>
#include <memory>

using namespace Stanchion;

namespace {

std::string test_conninfo() {
    const char* env = std::getenv("STANCHION_TEST_CONNINFO");
    return env ? env : "dbname=stanchion_test";
}

SubjectRecord record(const std::string& id, const std::string& material, const std::string& type,
                     double confidence, double timestamp) {
    SubjectRecord r;
    r.subject_id = id;
    r.material = material;
    r.type = type;
    r.confidence = confidence;
    r.source_kind = SourceKind::Ensemble;
    r.timestamp = timestamp;
    return r;
}

} // namespace

class PostgresStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        try {
            db = std::make_unique<PostgresConnection>(test_conninfo());
        } catch (const std::exception& e) {
            GTEST_SKIP() << "Database not available - skipping integration test: " << e.what();
        }
        store = std::make_unique<PostgresAnalysisStore>(*db);
        store->ensure_schema();
        db->execute("TRUNCATE stanchion.subject_record, stanchion.correction_event, "
                    "stanchion.pattern_hypothesis, stanchion.calibration_outcome RESTART IDENTITY");
    }

    std::unique_ptr<PostgresConnection> db;
    std::unique_ptr<PostgresAnalysisStore> store;
};

TEST_F(PostgresStoreTest, RecordRoundTrip) {
    store->store_analysis(record("S-1", "betón", "stĺp verejného osvetlenia", 0.72, 1700000000.5));

    auto loaded = store->get_analysis("S-1");
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->material, "betón");
    EXPECT_EQ(loaded->type, "stĺp verejného osvetlenia");
    EXPECT_NEAR(loaded->confidence, 0.72, 1e-9);
    EXPECT_EQ(loaded->source_kind, SourceKind::Ensemble);
    EXPECT_NEAR(loaded->timestamp, 1700000000.5, 1e-3);
    EXPECT_FALSE(loaded->verified);

    EXPECT_FALSE(store->get_analysis("S-2"));
}

TEST_F(PostgresStoreTest, CorrectionWithoutRecordUsesFallbackBefore) {
    CorrectionEvent event = store->apply_correction("17", "drevo", "stĺp informatívny");
    EXPECT_EQ(event.material_before, kFallbackMaterial);
    EXPECT_EQ(event.type_before, kFallbackType);
    EXPECT_EQ(event.id.size(), 36u);

    auto loaded = store->get_analysis("17");
    ASSERT_TRUE(loaded);
    EXPECT_TRUE(loaded->verified);
    EXPECT_DOUBLE_EQ(loaded->confidence, 1.0);
    EXPECT_EQ(loaded->source_kind, SourceKind::HumanCorrection);
    EXPECT_EQ(loaded->correction_count, 1);

    auto log = store->corrections();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].id, event.id);
}

TEST_F(PostgresStoreTest, FiveCorrectionsLearnHalfConfidence) {
    for (int i = 0; i < 5; ++i) store->apply_correction("120", "betón", "X");

    auto learned = store->query_learned_prediction("130");
    ASSERT_TRUE(learned);
    EXPECT_EQ(learned->material, "betón");
    EXPECT_NEAR(learned->confidence, 0.5, 1e-9);

    EXPECT_FALSE(store->query_learned_prediction("abc"));
    EXPECT_EQ(store->get_analysis("120")->correction_count, 5);
}

TEST_F(PostgresStoreTest, CompetingHypothesesShareTheirBucket) {
    for (int i = 0; i < 5; ++i) store->apply_correction("20", "betón", "A");
    store->apply_correction("30", "kov", "A");

    // mod10, div50 and div100 of 10 each hold five betón against one kov
    auto learned = store->query_learned_prediction("10");
    ASSERT_TRUE(learned);
    EXPECT_EQ(learned->material, "betón");
    EXPECT_NEAR(learned->confidence, (5.0 / 6.0) * 0.5, 1e-9);

    auto competing = store->hypotheses(bucket_of(BucketType::Mod10, 10));
    ASSERT_EQ(competing.size(), 2u);
    double total = 0.0;
    for (const auto& h : competing) total += h.success_rate;
    EXPECT_NEAR(total, 1.0, 1e-9);
}

TEST_F(PostgresStoreTest, UnlessVerifiedKeepsCorrections) {
    store->apply_correction("5", "drevo", "A");
    EXPECT_FALSE(store->store_analysis_unless_verified(record("5", "kov", "B", 0.9, 1.0)));
    EXPECT_EQ(store->get_analysis("5")->material, "drevo");

    store->store_analysis(record("6", "kov", "A", 0.6, 1.0));
    EXPECT_TRUE(store->store_analysis_unless_verified(record("6", "betón", "A", 0.8, 2.0)));
    EXPECT_EQ(store->get_analysis("6")->material, "betón");
}

TEST_F(PostgresStoreTest, OutcomesAppendInOrder) {
    OutcomeRecord first = store->append_outcome(0.8, true);
    OutcomeRecord second = store->append_outcome(0.4, false);
    EXPECT_LT(first.sequence, second.sequence);

    auto log = store->outcomes();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_NEAR(log[0].predicted_confidence, 0.8, 1e-9);
    EXPECT_TRUE(log[0].was_correct);
    EXPECT_FALSE(log[1].was_correct);
}

TEST_F(PostgresStoreTest, StatsGroupBySource) {
    store->store_analysis(record("a", "kov", "A", 0.6, 1.0));
    store->store_analysis(record("b", "kov", "A", 0.8, 2.0));
    store->apply_correction("c", "kov", "A");

    StoreStats stats = store->stats();
    EXPECT_EQ(stats.total_records, 3);
    EXPECT_EQ(stats.verified_records, 1);
    EXPECT_EQ(stats.correction_events, 1);
    EXPECT_EQ(stats.hypotheses, 0);
    EXPECT_EQ(stats.by_source["ensemble"].count, 2);
    EXPECT_NEAR(stats.by_source["ensemble"].mean_confidence, 0.7, 1e-9);
    EXPECT_EQ(stats.by_source["human_correction"].count, 1);

    auto rows = store->snapshot();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[2].subject_id, "a");
}
