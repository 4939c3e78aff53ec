#include <storage/memory_analysis_store.hpp>
#include <storage/pattern_buckets.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace Stanchion {

void MemoryAnalysisStore::set_fault_hook(FaultHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    fault_hook_ = std::move(hook);
}

void MemoryAnalysisStore::check_fault(std::string_view stage) const {
    if (fault_hook_) fault_hook_(stage);
}

namespace {

// Same bounds as the subject_record CHECK constraint
void require_valid_confidence(const SubjectRecord& record) {
    if (!std::isfinite(record.confidence) || record.confidence < 0.0 || record.confidence > 1.0) {
        throw StorageError("confidence out of range for subject " + record.subject_id + ": " +
                           std::to_string(record.confidence));
    }
}

} // anonymous namespace

void MemoryAnalysisStore::store_analysis(const SubjectRecord& record) {
    require_valid_confidence(record);
    std::lock_guard<std::mutex> lock(mutex_);
    check_fault("subject_record");
    records_[record.subject_id] = record;
}

bool MemoryAnalysisStore::store_analysis_unless_verified(const SubjectRecord& record) {
    require_valid_confidence(record);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(record.subject_id);
    if (it != records_.end() && it->second.verified) return false;

    check_fault("subject_record");
    SubjectRecord updated = record;
    if (it != records_.end()) {
        updated.verified = it->second.verified;
        updated.correction_count = it->second.correction_count;
    }
    records_[record.subject_id] = std::move(updated);
    return true;
}

std::optional<SubjectRecord> MemoryAnalysisStore::get_analysis(const std::string& subject_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(subject_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

CorrectionEvent MemoryAnalysisStore::apply_correction(const std::string& subject_id,
                                                      const Label& material_after,
                                                      const Label& type_after) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double now = Timer::now_epoch();

    // Stage 1: correction event
    check_fault("correction_event");
    auto existing = records_.find(subject_id);

    CorrectionEvent event;
    event.sequence = next_event_sequence_;
    event.subject_id = subject_id;
    event.material_before = existing != records_.end() ? existing->second.material : kFallbackMaterial;
    event.type_before = existing != records_.end() ? existing->second.type : kFallbackType;
    event.material_after = material_after;
    event.type_after = type_after;
    event.timestamp = now;
    event.id = correction_event_id(event);

    // Stage 2: verified subject record
    check_fault("subject_record");
    SubjectRecord record;
    if (existing != records_.end()) record = existing->second;
    record.subject_id = subject_id;
    record.material = material_after;
    record.type = type_after;
    record.confidence = 1.0;
    record.source_kind = SourceKind::HumanCorrection;
    record.timestamp = now;
    record.verified = true;
    record.correction_count += 1;

    // Stage 3: bucket hypotheses (numeric ids only)
    std::vector<std::pair<BucketKey, std::vector<PatternHypothesis>>> staged;
    for (const BucketKey& key : buckets_for(subject_id)) {
        check_fault("pattern_hypothesis");

        std::vector<PatternHypothesis> competing;
        auto found = hypotheses_.find(key);
        if (found != hypotheses_.end()) competing = found->second;

        auto match = std::find_if(competing.begin(), competing.end(), [&](const PatternHypothesis& h) {
            return h.material == material_after && h.type == type_after;
        });
        if (match != competing.end()) {
            match->sample_count += 1;
            match->last_updated = now;
        } else {
            PatternHypothesis created;
            created.bucket = key;
            created.material = material_after;
            created.type = type_after;
            created.sample_count = 1;
            created.last_updated = now;
            competing.push_back(std::move(created));
        }
        recompute_success_rates(competing);
        staged.emplace_back(key, std::move(competing));
    }

    // Publish
    log_.reserve(log_.size() + 1);
    log_.push_back(event);
    records_[subject_id] = std::move(record);
    for (auto& [key, competing] : staged) {
        hypotheses_[key] = std::move(competing);
    }
    ++next_event_sequence_;

    return event;
}

std::optional<Classification> MemoryAnalysisStore::query_learned_prediction(const std::string& subject_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::vector<PatternHypothesis>> per_bucket;
    for (const BucketKey& key : buckets_for(subject_id)) {
        auto found = hypotheses_.find(key);
        per_bucket.push_back(found != hypotheses_.end() ? found->second : std::vector<PatternHypothesis>{});
    }
    return best_learned(per_bucket);
}

std::vector<PatternHypothesis> MemoryAnalysisStore::hypotheses(const BucketKey& bucket) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = hypotheses_.find(bucket);
    if (found == hypotheses_.end()) return {};
    return found->second;
}

std::vector<CorrectionEvent> MemoryAnalysisStore::corrections() {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

std::vector<SubjectRecord> MemoryAnalysisStore::snapshot() {
    std::vector<SubjectRecord> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rows.reserve(records_.size());
        for (const auto& [id, record] : records_) rows.push_back(record);
    }
    std::sort(rows.begin(), rows.end(), [](const SubjectRecord& a, const SubjectRecord& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return a.subject_id < b.subject_id;
    });
    return rows;
}

OutcomeRecord MemoryAnalysisStore::append_outcome(double predicted_confidence, bool was_correct) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_fault("outcome");

    OutcomeRecord outcome;
    outcome.sequence = next_outcome_sequence_++;
    outcome.predicted_confidence = predicted_confidence;
    outcome.was_correct = was_correct;
    outcome.timestamp = Timer::now_epoch();
    outcomes_.push_back(outcome);
    return outcome;
}

std::vector<OutcomeRecord> MemoryAnalysisStore::outcomes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

StoreStats MemoryAnalysisStore::stats() {
    std::lock_guard<std::mutex> lock(mutex_);

    StoreStats stats;
    stats.total_records = static_cast<int64_t>(records_.size());
    stats.correction_events = static_cast<int64_t>(log_.size());
    for (const auto& [key, competing] : hypotheses_) {
        stats.hypotheses += static_cast<int64_t>(competing.size());
    }

    std::map<std::string, double> confidence_sums;
    for (const auto& [id, record] : records_) {
        if (record.verified) ++stats.verified_records;
        std::string source = to_string(record.source_kind);
        stats.by_source[source].count += 1;
        confidence_sums[source] += record.confidence;
    }
    for (auto& [source, provenance] : stats.by_source) {
        provenance.mean_confidence = confidence_sums[source] / static_cast<double>(provenance.count);
    }
    return stats;
}

} // namespace Stanchion
