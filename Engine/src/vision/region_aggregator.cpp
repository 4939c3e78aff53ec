/**
 * @file region_aggregator.cpp
 * @brief Concurrent region analysis with a barrier before voting
 */

#include <vision/region_aggregator.hpp>
#include <calibration/calibration_tracker.hpp>
#include <ensemble/weighted_vote.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <future>
#include <iomanip>
#include <sstream>
#include <thread>

namespace Stanchion {

const char* to_string(RegionStatus status) {
    switch (status) {
        case RegionStatus::Accepted:      return "accepted";
        case RegionStatus::LowConfidence: return "low_confidence";
        case RegionStatus::Unparseable:   return "unparseable";
        case RegionStatus::Failed:        return "failed";
        case RegionStatus::TimedOut:      return "timed_out";
    }
    return "unknown";
}

RegionAggregator::RegionAggregator(std::shared_ptr<VisionOracle> oracle,
                                   std::shared_ptr<PhotographSource> photos,
                                   AggregatorConfig config)
    : oracle_(std::move(oracle)), photos_(std::move(photos)), config_(config) {}

void RegionAggregator::set_calibration(const CalibrationTracker* calibration) {
    calibration_ = calibration;
}

std::vector<std::string> RegionAggregator::current_hints() const {
    if (!calibration_) return {};
    try {
        return calibration_->prompt_hints(config_.hint_confusions);
    } catch (const std::exception& e) {
        Logger::warn(std::string("Calibration hints unavailable: ") + e.what());
        return {};
    }
}

std::optional<Classification> RegionAggregator::observe(const std::string& subject_id) {
    if (!oracle_ || !photos_) return std::nullopt;

    auto photo = photos_->fetch(subject_id);
    if (!photo) {
        Logger::debug("No photograph for subject " + subject_id);
        return std::nullopt;
    }
    AggregationResult result = aggregate(*photo);
    if (result.fallback) {
        Logger::debug("No usable region analysis for subject " + subject_id);
        return std::nullopt;
    }
    return result.consensus;
}

AggregationResult RegionAggregator::aggregate(const Photograph& photo) {
    Timer timer;
    const auto& regions = RegionPlan::standard();
    const auto hints = current_hints();

    AggregationResult result;
    result.votes.resize(regions.size());

    // Issue every region call before waiting on any of them
    std::vector<std::optional<std::future<std::string>>> pending(regions.size());
    for (size_t i = 0; i < regions.size(); ++i) {
        const RegionSpec& region = regions[i];
        RegionVote& vote = result.votes[i];
        vote.region = region.name;

        RegionImage image;
        try {
            RegionCrop crop = RegionPlan::crop_for(region, photo.size, config_.min_edge, config_.max_edge);
            image = photos_->crop(photo, crop);
        } catch (const std::exception& e) {
            vote.status = RegionStatus::Failed;
            vote.detail = std::string("crop failed: ") + e.what();
            continue;
        }

        auto promise = std::make_shared<std::promise<std::string>>();
        pending[i] = promise->get_future();
        std::string instruction = RegionPlan::instruction_for(region, hints);

        std::thread([oracle = oracle_, promise, image = std::move(image),
                     instruction = std::move(instruction)]() {
            try {
                promise->set_value(oracle->analyze(image, instruction));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();
    }

    // Barrier: all calls settle against one deadline
    const auto deadline = std::chrono::steady_clock::now() + config_.timeout;
    std::vector<Observation> survivors;

    for (size_t i = 0; i < regions.size(); ++i) {
        RegionVote& vote = result.votes[i];
        if (!pending[i]) continue;

        auto& future = *pending[i];
        if (future.wait_until(deadline) != std::future_status::ready) {
            vote.status = RegionStatus::TimedOut;
            vote.detail = "no reply before deadline";
            continue;
        }

        std::string text;
        try {
            text = future.get();
        } catch (const std::exception& e) {
            vote.status = RegionStatus::Failed;
            vote.detail = e.what();
            continue;
        }

        vote.reply = parse_oracle_reply(text);
        if (!vote.reply) {
            vote.status = RegionStatus::Unparseable;
            continue;
        }
        if (vote.reply->confidence <= config_.min_confidence) {
            vote.status = RegionStatus::LowConfidence;
            continue;
        }

        vote.status = RegionStatus::Accepted;
        Observation obs;
        obs.material = vote.reply->material;
        obs.type = vote.reply->type;
        obs.confidence = vote.reply->confidence;
        obs.source_kind = SourceKind::RegionConsensus;
        obs.weight = vote.reply->confidence;
        survivors.push_back(std::move(obs));
    }

    for (const auto& vote : result.votes) {
        std::ostringstream line;
        line << "  " << vote.region << ": " << to_string(vote.status);
        if (vote.reply) {
            line << " " << vote.reply->material << " / " << vote.reply->type
                 << " @ " << std::fixed << std::setprecision(2) << vote.reply->confidence;
        }
        if (!vote.detail.empty()) line << " (" << vote.detail << ")";
        if (vote.status == RegionStatus::Failed || vote.status == RegionStatus::TimedOut) {
            Logger::warn("Region " + vote.region + " " + to_string(vote.status) + ": " + vote.detail);
        }
        Logger::debug(line.str());
    }

    result.survivors = survivors.size();
    if (survivors.empty()) {
        result.fallback = true;
        result.consensus = Classification{kFallbackMaterial, kFallbackType, kAggregatorFallbackConfidence};
    } else {
        result.consensus = combine_observations(survivors);
    }

    std::ostringstream summary;
    summary << "Region vote for " << photo.subject_id << ": " << result.consensus.material
            << " / " << result.consensus.type << " @ " << std::fixed << std::setprecision(3)
            << result.consensus.confidence << " (" << result.survivors << "/" << regions.size()
            << " regions, " << std::setprecision(0) << timer.elapsed_ms() << " ms)";
    Logger::info(summary.str());

    return result;
}

} // namespace Stanchion
