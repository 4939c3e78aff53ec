/**
 * @file postgres_analysis_store.cpp
 * @brief PostgreSQL implementation of the pattern-learning store
 */

#include <storage/postgres_analysis_store.hpp>
#include <storage/pattern_buckets.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Stanchion {

namespace {

constexpr const char* k_record_columns =
    "subject_id, material, type, confidence, source_kind, recorded_at, verified, correction_count";

std::string format_double(double value) {
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    return oss.str();
}

const char* format_bool(bool value) {
    return value ? "true" : "false";
}

bool parse_bool(const std::string& text) {
    return text == "t" || text == "true";
}

SubjectRecord record_from_row(const PostgresConnection::Row& row) {
    SubjectRecord record;
    record.subject_id = row[0];
    record.material = row[1];
    record.type = row[2];
    record.confidence = std::stod(row[3]);
    auto kind = source_kind_from_string(row[4]);
    if (!kind) {
        Logger::warn("Unknown source_kind '" + row[4] + "' for subject " + row[0]);
    }
    record.source_kind = kind.value_or(SourceKind::Ensemble);
    record.timestamp = std::stod(row[5]);
    record.verified = parse_bool(row[6]);
    record.correction_count = std::stoll(row[7]);
    return record;
}

std::vector<std::string> record_params(const SubjectRecord& record) {
    return {
        record.subject_id,
        record.material,
        record.type,
        format_double(record.confidence),
        to_string(record.source_kind),
        format_double(record.timestamp),
        format_bool(record.verified),
        std::to_string(record.correction_count)
    };
}

// Runs body under the connection mutex; driver errors become StorageError.
template <typename Body>
auto guarded(std::mutex& mutex, const char* operation, Body&& body) -> decltype(body()) {
    std::lock_guard<std::mutex> lock(mutex);
    try {
        return body();
    } catch (const StorageError&) {
        throw;
    } catch (const std::exception& e) {
        throw StorageError(std::string(operation) + ": " + e.what());
    }
}

} // anonymous namespace

PostgresAnalysisStore::PostgresAnalysisStore(PostgresConnection& db) : db_(db) {}

void PostgresAnalysisStore::ensure_schema() {
    guarded(mutex_, "ensure_schema", [&] {
        PostgresConnection::Transaction tx(db_);
        db_.execute("CREATE SCHEMA IF NOT EXISTS stanchion");
        db_.execute(R"(
            CREATE TABLE IF NOT EXISTS stanchion.subject_record (
                subject_id       TEXT PRIMARY KEY,
                material         TEXT NOT NULL,
                type             TEXT NOT NULL,
                confidence       DOUBLE PRECISION NOT NULL CHECK (confidence >= 0 AND confidence <= 1),
                source_kind      TEXT NOT NULL,
                recorded_at      DOUBLE PRECISION NOT NULL,
                verified         BOOLEAN NOT NULL DEFAULT FALSE,
                correction_count BIGINT NOT NULL DEFAULT 0 CHECK (correction_count >= 0)
            ))");
        db_.execute(R"(
            CREATE TABLE IF NOT EXISTS stanchion.correction_event (
                seq             BIGSERIAL PRIMARY KEY,
                id              UUID NOT NULL UNIQUE,
                subject_id      TEXT NOT NULL,
                material_before TEXT NOT NULL,
                type_before     TEXT NOT NULL,
                material_after  TEXT NOT NULL,
                type_after      TEXT NOT NULL,
                recorded_at     DOUBLE PRECISION NOT NULL
            ))");
        db_.execute(R"(
            CREATE INDEX IF NOT EXISTS correction_event_subject_idx
                ON stanchion.correction_event (subject_id))");
        db_.execute(R"(
            CREATE TABLE IF NOT EXISTS stanchion.pattern_hypothesis (
                bucket_type  TEXT NOT NULL,
                bucket_value BIGINT NOT NULL,
                material     TEXT NOT NULL,
                type         TEXT NOT NULL,
                sample_count BIGINT NOT NULL CHECK (sample_count >= 1),
                success_rate DOUBLE PRECISION NOT NULL CHECK (success_rate >= 0 AND success_rate <= 1),
                last_updated DOUBLE PRECISION NOT NULL,
                PRIMARY KEY (bucket_type, bucket_value, material, type)
            ))");
        db_.execute(R"(
            CREATE TABLE IF NOT EXISTS stanchion.calibration_outcome (
                seq                  BIGSERIAL PRIMARY KEY,
                predicted_confidence DOUBLE PRECISION NOT NULL,
                was_correct          BOOLEAN NOT NULL,
                recorded_at          DOUBLE PRECISION NOT NULL
            ))");
        tx.commit();
    });
    Logger::debug("Schema stanchion ready");
}

void PostgresAnalysisStore::store_analysis(const SubjectRecord& record) {
    guarded(mutex_, "store_analysis", [&] {
        db_.execute(std::string("INSERT INTO stanchion.subject_record (") + k_record_columns + R"()
            VALUES ($1, $2, $3, $4, $5, $6, $7, $8)
            ON CONFLICT (subject_id) DO UPDATE SET
                material = EXCLUDED.material,
                type = EXCLUDED.type,
                confidence = EXCLUDED.confidence,
                source_kind = EXCLUDED.source_kind,
                recorded_at = EXCLUDED.recorded_at,
                verified = EXCLUDED.verified,
                correction_count = EXCLUDED.correction_count)",
            record_params(record));
    });
}

bool PostgresAnalysisStore::store_analysis_unless_verified(const SubjectRecord& record) {
    return guarded(mutex_, "store_analysis_unless_verified", [&] {
        // The WHERE on the conflict arm makes check-and-write a single statement.
        long affected = db_.execute_count(std::string("INSERT INTO stanchion.subject_record (") + k_record_columns + R"()
            VALUES ($1, $2, $3, $4, $5, $6, $7, $8)
            ON CONFLICT (subject_id) DO UPDATE SET
                material = EXCLUDED.material,
                type = EXCLUDED.type,
                confidence = EXCLUDED.confidence,
                source_kind = EXCLUDED.source_kind,
                recorded_at = EXCLUDED.recorded_at
            WHERE NOT stanchion.subject_record.verified)",
            record_params(record));
        return affected > 0;
    });
}

std::optional<SubjectRecord> PostgresAnalysisStore::fetch_record(const std::string& subject_id, bool for_update) {
    std::optional<SubjectRecord> record;
    std::string sql = std::string("SELECT ") + k_record_columns +
                      " FROM stanchion.subject_record WHERE subject_id = $1";
    if (for_update) sql += " FOR UPDATE";

    db_.query(sql, {subject_id}, [&](const PostgresConnection::Row& row) {
        record = record_from_row(row);
    });
    return record;
}

std::optional<SubjectRecord> PostgresAnalysisStore::get_analysis(const std::string& subject_id) {
    return guarded(mutex_, "get_analysis", [&] {
        return fetch_record(subject_id, false);
    });
}

CorrectionEvent PostgresAnalysisStore::apply_correction(const std::string& subject_id,
                                                        const Label& material_after,
                                                        const Label& type_after) {
    return guarded(mutex_, "apply_correction", [&] {
        PostgresConnection::Transaction tx(db_);
        db_.execute("SELECT pg_advisory_xact_lock(hashtextextended($1, 0))", {subject_id});

        const double now = Timer::now_epoch();
        auto existing = fetch_record(subject_id, true);

        auto seq = db_.query_single(
            "SELECT nextval(pg_get_serial_sequence('stanchion.correction_event', 'seq'))");
        if (!seq) throw StorageError("apply_correction: correction_event sequence unavailable");

        CorrectionEvent event;
        event.sequence = std::stoll(*seq);
        event.subject_id = subject_id;
        event.material_before = existing ? existing->material : kFallbackMaterial;
        event.type_before = existing ? existing->type : kFallbackType;
        event.material_after = material_after;
        event.type_after = type_after;
        event.timestamp = now;
        event.id = correction_event_id(event);

        db_.execute(R"(
            INSERT INTO stanchion.correction_event
                (seq, id, subject_id, material_before, type_before, material_after, type_after, recorded_at)
            VALUES ($1, $2, $3, $4, $5, $6, $7, $8))",
            {std::to_string(event.sequence), event.id, event.subject_id,
             event.material_before, event.type_before,
             event.material_after, event.type_after,
             format_double(event.timestamp)});

        SubjectRecord record;
        record.subject_id = subject_id;
        record.material = material_after;
        record.type = type_after;
        record.confidence = 1.0;
        record.source_kind = SourceKind::HumanCorrection;
        record.timestamp = now;
        record.verified = true;
        record.correction_count = (existing ? existing->correction_count : 0) + 1;

        db_.execute(std::string("INSERT INTO stanchion.subject_record (") + k_record_columns + R"()
            VALUES ($1, $2, $3, $4, $5, $6, $7, $8)
            ON CONFLICT (subject_id) DO UPDATE SET
                material = EXCLUDED.material,
                type = EXCLUDED.type,
                confidence = EXCLUDED.confidence,
                source_kind = EXCLUDED.source_kind,
                recorded_at = EXCLUDED.recorded_at,
                verified = EXCLUDED.verified,
                correction_count = EXCLUDED.correction_count)",
            record_params(record));

        for (const BucketKey& key : buckets_for(subject_id)) {
            std::string type_name = to_string(key.type);
            std::string value = std::to_string(key.value);

            db_.execute("SELECT pg_advisory_xact_lock(hashtextextended($1, 0))",
                        {"bucket:" + type_name + ":" + value});

            db_.execute(R"(
                INSERT INTO stanchion.pattern_hypothesis
                    (bucket_type, bucket_value, material, type, sample_count, success_rate, last_updated)
                VALUES ($1, $2, $3, $4, 1, 1.0, $5)
                ON CONFLICT (bucket_type, bucket_value, material, type) DO UPDATE SET
                    sample_count = stanchion.pattern_hypothesis.sample_count + 1,
                    last_updated = EXCLUDED.last_updated)",
                {type_name, value, material_after, type_after, format_double(now)});

            db_.execute(R"(
                UPDATE stanchion.pattern_hypothesis h
                SET success_rate = h.sample_count::double precision / t.total
                FROM (SELECT SUM(sample_count) AS total
                      FROM stanchion.pattern_hypothesis
                      WHERE bucket_type = $1 AND bucket_value = $2) t
                WHERE h.bucket_type = $1 AND h.bucket_value = $2)",
                {type_name, value});
        }

        tx.commit();
        return event;
    });
}

std::vector<PatternHypothesis> PostgresAnalysisStore::fetch_hypotheses(const BucketKey& bucket) {
    std::vector<PatternHypothesis> competing;
    db_.query(R"(
        SELECT material, type, sample_count, success_rate, last_updated
        FROM stanchion.pattern_hypothesis
        WHERE bucket_type = $1 AND bucket_value = $2
        ORDER BY material, type)",
        {to_string(bucket.type), std::to_string(bucket.value)},
        [&](const PostgresConnection::Row& row) {
            PatternHypothesis h;
            h.bucket = bucket;
            h.material = row[0];
            h.type = row[1];
            h.sample_count = std::stoll(row[2]);
            h.success_rate = std::stod(row[3]);
            h.last_updated = std::stod(row[4]);
            competing.push_back(std::move(h));
        });
    return competing;
}

std::optional<Classification> PostgresAnalysisStore::query_learned_prediction(const std::string& subject_id) {
    auto keys = buckets_for(subject_id);
    if (keys.empty()) return std::nullopt;

    return guarded(mutex_, "query_learned_prediction", [&] {
        std::vector<std::vector<PatternHypothesis>> per_bucket;
        per_bucket.reserve(keys.size());
        for (const BucketKey& key : keys) {
            per_bucket.push_back(fetch_hypotheses(key));
        }
        return best_learned(per_bucket);
    });
}

std::vector<PatternHypothesis> PostgresAnalysisStore::hypotheses(const BucketKey& bucket) {
    return guarded(mutex_, "hypotheses", [&] {
        return fetch_hypotheses(bucket);
    });
}

std::vector<CorrectionEvent> PostgresAnalysisStore::corrections() {
    return guarded(mutex_, "corrections", [&] {
        std::vector<CorrectionEvent> log;
        db_.query(R"(
            SELECT seq, id, subject_id, material_before, type_before, material_after, type_after, recorded_at
            FROM stanchion.correction_event
            ORDER BY seq)",
            [&](const PostgresConnection::Row& row) {
                CorrectionEvent event;
                event.sequence = std::stoll(row[0]);
                event.id = row[1];
                event.subject_id = row[2];
                event.material_before = row[3];
                event.type_before = row[4];
                event.material_after = row[5];
                event.type_after = row[6];
                event.timestamp = std::stod(row[7]);
                log.push_back(std::move(event));
            });
        return log;
    });
}

std::vector<SubjectRecord> PostgresAnalysisStore::snapshot() {
    return guarded(mutex_, "snapshot", [&] {
        std::vector<SubjectRecord> rows;
        db_.query(std::string("SELECT ") + k_record_columns +
                  " FROM stanchion.subject_record ORDER BY recorded_at DESC, subject_id",
                  [&](const PostgresConnection::Row& row) {
                      rows.push_back(record_from_row(row));
                  });
        return rows;
    });
}

OutcomeRecord PostgresAnalysisStore::append_outcome(double predicted_confidence, bool was_correct) {
    return guarded(mutex_, "append_outcome", [&] {
        OutcomeRecord outcome;
        outcome.predicted_confidence = predicted_confidence;
        outcome.was_correct = was_correct;
        outcome.timestamp = Timer::now_epoch();

        auto seq = db_.query_single(R"(
            INSERT INTO stanchion.calibration_outcome (predicted_confidence, was_correct, recorded_at)
            VALUES ($1, $2, $3)
            RETURNING seq)",
            {format_double(predicted_confidence), format_bool(was_correct), format_double(outcome.timestamp)});
        if (!seq) throw StorageError("append_outcome: no sequence returned");
        outcome.sequence = std::stoll(*seq);
        return outcome;
    });
}

std::vector<OutcomeRecord> PostgresAnalysisStore::outcomes() {
    return guarded(mutex_, "outcomes", [&] {
        std::vector<OutcomeRecord> log;
        db_.query(R"(
            SELECT seq, predicted_confidence, was_correct, recorded_at
            FROM stanchion.calibration_outcome
            ORDER BY seq)",
            [&](const PostgresConnection::Row& row) {
                OutcomeRecord outcome;
                outcome.sequence = std::stoll(row[0]);
                outcome.predicted_confidence = std::stod(row[1]);
                outcome.was_correct = parse_bool(row[2]);
                outcome.timestamp = std::stod(row[3]);
                log.push_back(outcome);
            });
        return log;
    });
}

StoreStats PostgresAnalysisStore::stats() {
    return guarded(mutex_, "stats", [&] {
        StoreStats stats;
        db_.query(R"(
            SELECT count(*), count(*) FILTER (WHERE verified)
            FROM stanchion.subject_record)",
            [&](const PostgresConnection::Row& row) {
                stats.total_records = std::stoll(row[0]);
                stats.verified_records = std::stoll(row[1]);
            });

        auto events = db_.query_single("SELECT count(*) FROM stanchion.correction_event");
        stats.correction_events = events ? std::stoll(*events) : 0;

        auto hypotheses = db_.query_single("SELECT count(*) FROM stanchion.pattern_hypothesis");
        stats.hypotheses = hypotheses ? std::stoll(*hypotheses) : 0;

        db_.query(R"(
            SELECT source_kind, count(*), avg(confidence)
            FROM stanchion.subject_record
            GROUP BY source_kind
            ORDER BY source_kind)",
            [&](const PostgresConnection::Row& row) {
                ProvenanceStats provenance;
                provenance.count = std::stoll(row[1]);
                provenance.mean_confidence = std::stod(row[2]);
                stats.by_source[row[0]] = provenance;
            });
        return stats;
    });
}

} // namespace Stanchion
