#include <ensemble/weighted_vote.hpp>
#include <algorithm>
#include <stdexcept>

namespace Stanchion {

namespace {

struct Candidate {
    Label value;
    double score = 0.0;
    double max_weight = 0.0;    // heaviest single observation proposing it
};

} // anonymous namespace

AxisOutcome vote_axis(const std::vector<Observation>& observations, VoteAxis axis) {
    if (observations.empty()) {
        throw std::invalid_argument("vote_axis requires at least one observation");
    }

    // Gathering order is preserved for the final tie-break
    std::vector<Candidate> candidates;
    for (const auto& obs : observations) {
        const Label& value = axis == VoteAxis::Material ? obs.material : obs.type;
        auto it = std::find_if(candidates.begin(), candidates.end(),
                               [&](const Candidate& c) { return c.value == value; });
        if (it == candidates.end()) {
            candidates.push_back(Candidate{value, 0.0, obs.weight});
            it = candidates.end() - 1;
        }
        it->score += obs.weight * obs.confidence;
        it->max_weight = std::max(it->max_weight, obs.weight);
    }

    AxisOutcome outcome;
    const Candidate* best = nullptr;
    for (const auto& c : candidates) {
        outcome.total_score += c.score;
        if (!best || c.score > best->score ||
            (c.score == best->score && c.max_weight > best->max_weight)) {
            best = &c;
        }
    }
    outcome.winner = best->value;
    outcome.winner_score = best->score;
    return outcome;
}

Classification combine_observations(const std::vector<Observation>& observations) {
    if (observations.empty()) {
        throw std::invalid_argument("combine_observations requires at least one observation");
    }
    if (observations.size() == 1) {
        const auto& only = observations.front();
        return Classification{only.material, only.type, only.confidence};
    }

    AxisOutcome material = vote_axis(observations, VoteAxis::Material);
    AxisOutcome type = vote_axis(observations, VoteAxis::Type);

    Classification result;
    result.material = material.winner;
    result.type = type.winner;
    result.confidence = std::clamp((material.confidence() + type.confidence()) / 2.0, 0.0, 1.0);
    return result;
}

double agreement_bonus(double confidence, size_t contributors) {
    if (contributors < 2) return confidence;
    double bonus = std::min(0.10, static_cast<double>(contributors - 1) * 0.05);
    return std::min(0.99, confidence + bonus);
}

} // namespace Stanchion
