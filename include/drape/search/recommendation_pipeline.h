#pragma once

#include <drape/config/engine_config.h>
#include <drape/core/types.h>
#include <drape/search/cooldown_tracker.h>
#include <drape/search/hybrid_ranker.h>
#include <drape/search/mmr_selector.h>
#include <drape/vector/similarity_store.h>

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace drape::search {

// Maps text to an embedding; std::nullopt when the model gives nothing back
using EmbeddingFunction = std::function<std::optional<vector::Embedding>(const std::string&)>;

struct ComposerRequest {
    std::string query;
    TenantId tenant;
    std::vector<Candidate> candidates; // diversified, most preferred first
};

// Proposes scored item groups from the candidates
using ComposerFunction =
    std::function<std::optional<std::vector<ScoredGroup>>(const ComposerRequest&)>;

enum class OutcomeStatus {
    Ok,
    BackendUnavailable,
    BackendTimeout,
    NoCandidates,
    EmbeddingUnavailable,
    ComposerEmpty,
    Cancelled
};

constexpr const char* outcomeStatusName(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Ok: return "ok";
        case OutcomeStatus::BackendUnavailable: return "backend_unavailable";
        case OutcomeStatus::BackendTimeout: return "backend_timeout";
        case OutcomeStatus::NoCandidates: return "no_candidates";
        case OutcomeStatus::EmbeddingUnavailable: return "embedding_unavailable";
        case OutcomeStatus::ComposerEmpty: return "composer_empty";
        case OutcomeStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

struct RecommendationRequest {
    TenantId tenant;
    std::string query;
    // When set the embedding function is not consulted for the query
    std::optional<vector::Embedding> queryEmbedding;
    std::optional<std::string> profileSummary;
    std::vector<ItemId> excludeIds; // on top of the cooldown set
    // Id for the stored recommendation embedding; generated when absent
    std::optional<ItemId> recommendationId;
};

struct RecommendationOutcome {
    OutcomeStatus status = OutcomeStatus::Ok;
    std::vector<RankedGroup> groups;
    std::vector<Candidate> candidates; // what the composer saw
    std::string message;
    bool historyCommitted = false;

    bool ok() const { return status == OutcomeStatus::Ok; }
};

// "<query>. User style: <summary, at most 500 bytes>" or "... General style"
std::string buildQueryContext(std::string_view query,
                              const std::optional<std::string>& profileSummary);

// Text embedded for a finalized recommendation; later used as an MMR penalty source
std::string buildRecommendationText(std::string_view query,
                                    const std::vector<std::string>& descriptions,
                                    const std::vector<ItemId>& itemIds);

/**
 * @brief End-to-end recommendation flow for one request
 *
 * cooldown -> timed k-NN search -> similarity floor -> MMR -> composer -> hybrid ranking
 * -> history commit. Backend trouble degrades the outcome status instead of failing;
 * nothing is written unless a ranked result exists and the request was not cancelled.
 */
class RecommendationPipeline {
public:
    RecommendationPipeline(std::shared_ptr<vector::ISimilarityStore> store,
                           std::shared_ptr<IRecommendationHistory> history,
                           config::EngineConfig config, EmbeddingFunction embed,
                           ComposerFunction compose);
    ~RecommendationPipeline();

    RecommendationPipeline(const RecommendationPipeline&) = delete;
    RecommendationPipeline& operator=(const RecommendationPipeline&) = delete;

    RecommendationOutcome recommend(const RecommendationRequest& request,
                                    std::stop_token stop = {});

    /**
     * @brief Retrieval and diversification only
     *
     * Fills `candidates` and leaves `groups` empty; nothing is committed.
     */
    RecommendationOutcome retrieve(const TenantId& tenant, const vector::Embedding& query,
                                   const std::vector<ItemId>& excludeIds = {},
                                   std::stop_token stop = {});

    const config::EngineConfig& config() const { return config_; }

private:
    bool commit(const RecommendationRequest& request, const std::vector<RankedGroup>& ranked);

    std::shared_ptr<vector::ISimilarityStore> store_;
    std::shared_ptr<IRecommendationHistory> history_;
    config::EngineConfig config_;
    EmbeddingFunction embed_;
    ComposerFunction compose_;
    CooldownTracker cooldown_;
    HybridRanker ranker_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::atomic<uint64_t> nextRecommendation_{1};
};

} // namespace drape::search
