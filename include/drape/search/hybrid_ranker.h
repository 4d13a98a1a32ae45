#pragma once

#include <drape/core/types.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace drape::search {

/**
 * @brief An item set proposed by the external composer
 */
struct ScoredGroup {
    int groupId = 0;
    std::string name;
    std::string description;
    std::vector<ItemId> itemIds;
    std::optional<double> composerConfidence; // absent or non-finite -> neutral
};

/**
 * @brief ScoredGroup after fusion; groupId equals rank
 */
struct RankedGroup {
    ScoredGroup group;
    int rank = 0;
    double relevance = 0.0;          // mean retrieval relevance, 3 decimals
    double composerConfidence = 0.0; // 3 decimals
    double fusedScore = 0.0;         // 3 decimals
};

/**
 * @brief Configuration for hybrid ranking
 */
struct HybridRankerConfig {
    double relevanceWeight = 0.6;
    double confidenceWeight = 0.4;

    // Used when no member of a group has a retrieval score
    double neutralRelevance = 0.5;
    // Used when the composer gives no usable confidence
    double neutralConfidence = 0.5;
};

/**
 * @brief Fuses retrieval relevance with composer confidence into a final order
 */
class HybridRanker {
public:
    explicit HybridRanker(const HybridRankerConfig& config = {});

    void setConfig(const HybridRankerConfig& config) { config_ = config; }

    const HybridRankerConfig& getConfig() const { return config_; }

    /**
     * @brief Mean relevance over all members, unscored members counting as 0.0
     *
     * The neutral value applies only when no member has a known score.
     */
    double averageRelevance(const ScoredGroup& group,
                            const std::unordered_map<ItemId, double>& relevance) const;

    double composerConfidence(const ScoredGroup& group) const;

    double fusedScore(double avgRelevance, double confidence) const {
        return config_.relevanceWeight * avgRelevance + config_.confidenceWeight * confidence;
    }

    /**
     * @brief Stable-sort groups by fused score and assign ranks 1..M
     *
     * Equal fused scores keep the composer's order. Empty input gives empty output.
     */
    std::vector<RankedGroup> rank(const std::vector<ScoredGroup>& groups,
                                  const std::unordered_map<ItemId, double>& relevance) const;

private:
    HybridRankerConfig config_;
};

// Round half away from zero to 3 decimals
double roundScore(double value);

} // namespace drape::search
