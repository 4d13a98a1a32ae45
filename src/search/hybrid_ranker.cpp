#include <drape/search/hybrid_ranker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace drape::search {

double roundScore(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

HybridRanker::HybridRanker(const HybridRankerConfig& config) : config_(config) {}

double HybridRanker::averageRelevance(const ScoredGroup& group,
                                      const std::unordered_map<ItemId, double>& relevance) const {
    // Members retrieval never scored count as 0.0
    double sum = 0.0;
    size_t known = 0;
    for (const auto& id : group.itemIds) {
        auto it = relevance.find(id);
        if (it == relevance.end() || !std::isfinite(it->second)) {
            continue;
        }
        sum += it->second;
        ++known;
    }
    if (known == 0) {
        return config_.neutralRelevance;
    }
    return sum / static_cast<double>(group.itemIds.size());
}

double HybridRanker::composerConfidence(const ScoredGroup& group) const {
    if (!group.composerConfidence || !std::isfinite(*group.composerConfidence)) {
        return config_.neutralConfidence;
    }
    return *group.composerConfidence;
}

std::vector<RankedGroup> HybridRanker::rank(
    const std::vector<ScoredGroup>& groups,
    const std::unordered_map<ItemId, double>& relevance) const {
    std::vector<RankedGroup> out;
    out.reserve(groups.size());
    for (const auto& group : groups) {
        double avg = averageRelevance(group, relevance);
        double conf = composerConfidence(group);
        double fused = fusedScore(avg, conf);

        RankedGroup ranked;
        ranked.group = group;
        ranked.relevance = roundScore(avg);
        ranked.composerConfidence = roundScore(conf);
        ranked.fusedScore = roundScore(fused);
        out.push_back(std::move(ranked));
    }

    // Order on the displayed score so equal-looking groups keep composer order
    std::stable_sort(out.begin(), out.end(), [](const RankedGroup& a, const RankedGroup& b) {
        return a.fusedScore > b.fusedScore;
    });

    int rank = 1;
    for (auto& r : out) {
        r.rank = rank;
        r.group.groupId = rank;
        spdlog::debug("Rank {}: '{}' fused={:.3f} (relevance={:.3f}, confidence={:.3f})", rank,
                      r.group.name, r.fusedScore, r.relevance, r.composerConfidence);
        ++rank;
    }
    return out;
}

} // namespace drape::search
