/**
 * @file decision_engine.cpp
 * @brief Ensemble decision engine
 */

#include <ensemble/decision_engine.hpp>
#include <ensemble/fallback_rules.hpp>
#include <ensemble/weighted_vote.hpp>
#include <calibration/calibration_tracker.hpp>
#include <vision/region_aggregator.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace Stanchion {

namespace {

std::string describe(const Classification& c) {
    std::ostringstream out;
    out << c.material << " / " << c.type << " @ " << std::fixed << std::setprecision(3) << c.confidence;
    return out.str();
}

} // anonymous namespace

DecisionEngine::DecisionEngine(AnalysisStore& store, EngineConfig config)
    : store_(store), config_(std::move(config)) {
    config_.validate();
}

void DecisionEngine::set_vision(std::shared_ptr<VisionOracle> oracle, std::shared_ptr<PhotographSource> photos) {
    aggregator_ = std::make_shared<RegionAggregator>(std::move(oracle), std::move(photos), config_.aggregator);
    aggregator_->set_calibration(calibration_);
}

void DecisionEngine::set_calibration(CalibrationTracker* calibration) {
    calibration_ = calibration;
    if (aggregator_) aggregator_->set_calibration(calibration_);
}

Observation DecisionEngine::make_observation(const Classification& c, SourceKind kind) const {
    Observation obs;
    obs.material = c.material;
    obs.type = c.type;
    obs.confidence = std::isfinite(c.confidence) ? std::clamp(c.confidence, 0.0, 1.0) : 0.0;
    obs.source_kind = kind;
    obs.weight = config_.weights.weight_of(kind);
    return obs;
}

std::vector<Observation> DecisionEngine::gather(const std::string& subject_id,
                                                const std::optional<SubjectRecord>& record) {
    std::vector<Observation> observations;

    // Only reachable under force_refresh; verified records otherwise short-circuit
    if (record && record->verified) {
        observations.push_back(make_observation(
            {record->material, record->type, record->confidence}, SourceKind::VerifiedRecord));
    }

    if (aggregator_) {
        try {
            if (auto consensus = aggregator_->observe(subject_id)) {
                observations.push_back(make_observation(*consensus, SourceKind::RegionConsensus));
            }
        } catch (const std::exception& e) {
            Logger::warn("Region aggregation failed for " + subject_id + ": " + e.what());
        }
    }

    try {
        if (auto learned = store_.query_learned_prediction(subject_id)) {
            observations.push_back(make_observation(*learned, SourceKind::PatternLearned));
        }
    } catch (const std::exception& e) {
        Logger::warn("Learned pattern lookup failed for " + subject_id + ": " + e.what());
    }

    if (record && !record->verified) {
        observations.push_back(make_observation(
            {record->material, record->type, record->confidence}, SourceKind::PriorAnalysis));
    }

    if (config_.enable_rule_source) {
        observations.push_back(make_observation(FallbackRules::classify(subject_id), SourceKind::RuleFallback));
    }

    for (const auto& obs : observations) {
        Logger::debug("  " + std::string(to_string(obs.source_kind)) + ": " +
                      describe({obs.material, obs.type, obs.confidence}));
    }
    return observations;
}

Classification DecisionEngine::decide(const std::string& subject_id, bool force_refresh) {
    std::optional<SubjectRecord> record;
    try {
        record = store_.get_analysis(subject_id);
    } catch (const std::exception& e) {
        Logger::warn("Prior record unavailable for " + subject_id + ": " + e.what());
    }

    if (!force_refresh && record && record->verified) {
        Classification verified{record->material, record->type, 1.0};
        Logger::info("Subject " + subject_id + ": " + describe(verified) + " (verified)");
        return verified;
    }

    auto observations = gather(subject_id, record);

    Classification decision;
    if (observations.empty()) {
        decision = Classification{kFallbackMaterial, kFallbackType, kEngineFallbackConfidence};
        Logger::info("Subject " + subject_id + ": " + describe(decision) + " (fallback, no observations)");
    } else {
        decision = combine_observations(observations);
        decision.confidence = std::clamp(agreement_bonus(decision.confidence, observations.size()), 0.0, 1.0);
        Logger::info("Subject " + subject_id + ": " + describe(decision) + " from " +
                     std::to_string(observations.size()) + " observation(s)");
    }

    if (decision.confidence >= config_.store_threshold) {
        write_back(subject_id, decision);
    }
    return decision;
}

void DecisionEngine::write_back(const std::string& subject_id, const Classification& decision) {
    SubjectRecord record;
    record.subject_id = subject_id;
    record.material = decision.material;
    record.type = decision.type;
    record.confidence = decision.confidence;
    record.source_kind = SourceKind::Ensemble;
    record.timestamp = Timer::now_epoch();
    record.verified = false;

    auto lock = locks_.acquire(subject_id);
    try {
        if (!store_.store_analysis_unless_verified(record)) {
            Logger::debug("Kept verified record for " + subject_id);
        }
    } catch (const std::exception& e) {
        Logger::warn("Could not store decision for " + subject_id + ": " + e.what());
    }
}

std::vector<BatchDecision> DecisionEngine::decide_batch(const std::vector<std::string>& subject_ids,
                                                        bool force_refresh,
                                                        const std::atomic<bool>* stop) {
    std::vector<BatchDecision> results;
    results.reserve(subject_ids.size());
    Timer timer;

    for (size_t i = 0; i < subject_ids.size(); ++i) {
        if (stop && stop->load()) {
            Logger::warn("Batch stopped after " + std::to_string(i) + " of " +
                         std::to_string(subject_ids.size()) + " subjects");
            break;
        }

        results.push_back({subject_ids[i], decide(subject_ids[i], force_refresh)});

        if ((i + 1) % 10 == 0) {
            Logger::step("Decided " + std::to_string(i + 1) + "/" + std::to_string(subject_ids.size()) +
                         " subjects (" + std::to_string(static_cast<long>(timer.elapsed_sec())) + " s)");
        }
    }
    return results;
}

CorrectionEvent DecisionEngine::correct(const std::string& subject_id, const Label& material, const Label& type) {
    auto lock = locks_.acquire(subject_id);

    std::optional<SubjectRecord> prior = store_.get_analysis(subject_id);
    CorrectionEvent event = store_.apply_correction(subject_id, material, type);
    Logger::success("Corrected " + subject_id + ": " + event.material_before + " / " + event.type_before +
                    " -> " + material + " / " + type);

    if (calibration_ && prior && !prior->verified) {
        bool was_correct = prior->material == material && prior->type == type;
        try {
            calibration_->record_outcome(prior->confidence, was_correct);
        } catch (const std::exception& e) {
            Logger::warn("Could not record calibration outcome for " + subject_id + ": " + e.what());
        }
    }
    return event;
}

} // namespace Stanchion
