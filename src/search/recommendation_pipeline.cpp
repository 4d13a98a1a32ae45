#include <drape/search/recommendation_pipeline.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <future>
#include <unordered_map>
#include <unordered_set>

namespace drape::search {

namespace {

constexpr size_t kMaxProfileSummary = 500;
constexpr const char* kInsufficientItems = "insufficient distinct items";

// Runs fn on the pool and waits at most `timeout`. An abandoned task keeps running on its
// own copies; its result is discarded.
template <typename T, typename Fn>
Result<T> runWithTimeout(boost::asio::thread_pool& pool, std::chrono::milliseconds timeout,
                         const char* what, Fn fn) {
    if (timeout.count() == 0) {
        try {
            return fn();
        } catch (const std::exception& e) {
            spdlog::warn("{} failed: {}", what, e.what());
            return Error{ErrorCode::InternalError, e.what()};
        }
    }

    auto task = std::make_shared<std::packaged_task<Result<T>()>>(std::move(fn));
    auto future = task->get_future();
    boost::asio::post(pool, [task]() { (*task)(); });

    if (future.wait_for(timeout) != std::future_status::ready) {
        spdlog::warn("{} timed out after {} ms", what, timeout.count());
        return Error{ErrorCode::Timeout, fmt::format("{} timed out", what)};
    }
    try {
        return future.get();
    } catch (const std::exception& e) {
        spdlog::warn("{} failed: {}", what, e.what());
        return Error{ErrorCode::InternalError, e.what()};
    }
}

OutcomeStatus statusForBackendError(const Error& error) {
    return error.code == ErrorCode::Timeout ? OutcomeStatus::BackendTimeout
                                            : OutcomeStatus::BackendUnavailable;
}

RecommendationOutcome makeOutcome(OutcomeStatus status, std::string message) {
    RecommendationOutcome outcome;
    outcome.status = status;
    outcome.message = std::move(message);
    return outcome;
}

RecommendationOutcome cancelled() {
    return makeOutcome(OutcomeStatus::Cancelled, "request cancelled");
}

std::optional<vector::Embedding> callEmbedding(const EmbeddingFunction& embed,
                                               const std::string& text) {
    if (!embed) {
        return std::nullopt;
    }
    try {
        auto result = embed(text);
        if (result && result->empty()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::warn("Embedding function failed: {}", e.what());
        return std::nullopt;
    }
}

} // namespace

std::string buildQueryContext(std::string_view query,
                              const std::optional<std::string>& profileSummary) {
    if (!profileSummary || profileSummary->empty()) {
        return fmt::format("{}. User style: General style", query);
    }
    return fmt::format("{}. User style: {}", query,
                       std::string_view(*profileSummary).substr(0, kMaxProfileSummary));
}

std::string buildRecommendationText(std::string_view query,
                                    const std::vector<std::string>& descriptions,
                                    const std::vector<ItemId>& itemIds) {
    std::string text = fmt::format("Query: {} | Outfits recommended:", query);
    for (const auto& d : descriptions) {
        text += " | ";
        text += d;
    }
    text += fmt::format(" | Items used: {}", fmt::join(itemIds, ", "));
    return text;
}

RecommendationPipeline::RecommendationPipeline(std::shared_ptr<vector::ISimilarityStore> store,
                                               std::shared_ptr<IRecommendationHistory> history,
                                               config::EngineConfig config,
                                               EmbeddingFunction embed, ComposerFunction compose)
    : store_(std::move(store)),
      history_(std::move(history)),
      config_(std::move(config)),
      embed_(std::move(embed)),
      compose_(std::move(compose)),
      cooldown_(history_),
      ranker_(config_.ranking),
      pool_(std::make_unique<boost::asio::thread_pool>(
          std::max<size_t>(1, config_.retrieval.workerThreads))) {}

RecommendationPipeline::~RecommendationPipeline() {
    if (pool_) {
        pool_->stop();
        pool_->join();
    }
}

RecommendationOutcome RecommendationPipeline::retrieve(const TenantId& tenant,
                                                       const vector::Embedding& query,
                                                       const std::vector<ItemId>& excludeIds,
                                                       std::stop_token stop) {
    if (stop.stop_requested()) {
        return cancelled();
    }
    if (!store_) {
        return makeOutcome(OutcomeStatus::BackendUnavailable, "similarity store not configured");
    }

    const vector::PartitionKey items{tenant, vector::ItemClass::Item};
    const auto& retrieval = config_.retrieval;

    auto cooled = cooldown_.recentlyUsedIds(tenant, config_.cooldown.lookback,
                                            config_.cooldown.maxIds);
    std::unordered_set<ItemId> exclude(cooled.begin(), cooled.end());
    exclude.insert(excludeIds.begin(), excludeIds.end());
    spdlog::debug("Retrieval for {}: excluding {} ids ({} from cooldown)",
                  items.name(config_.store.partitionPrefix), exclude.size(), cooled.size());

    auto hits = runWithTimeout<std::vector<vector::SimilarityHit>>(
        *pool_, retrieval.searchTimeout, "Similarity search",
        [store = store_, items, query, limit = retrieval.searchLimit, exclude]() {
            return store->search(items, query, limit, exclude);
        });
    if (!hits) {
        spdlog::warn("Retrieval degraded for tenant {}: {}", tenant, hits.error().message);
        return makeOutcome(statusForBackendError(hits.error()), hits.error().message);
    }
    if (stop.stop_requested()) {
        return cancelled();
    }

    std::vector<ItemId> ids;
    std::unordered_map<ItemId, double> relevance;
    for (const auto& hit : hits.value()) {
        if (hit.similarity < retrieval.minSimilarity) {
            continue;
        }
        ids.push_back(hit.id);
        relevance.emplace(hit.id, hit.similarity);
    }
    if (ids.empty()) {
        spdlog::info("No candidates above similarity {:.2f} for tenant {} ({} raw hits)",
                     retrieval.minSimilarity, tenant, hits.value().size());
        return makeOutcome(OutcomeStatus::NoCandidates, kInsufficientItems);
    }

    auto records = runWithTimeout<std::vector<vector::ItemRecord>>(
        *pool_, retrieval.searchTimeout, "Candidate fetch",
        [store = store_, items, ids]() { return store->fetch(items, ids); });
    if (!records) {
        spdlog::warn("Candidate fetch degraded for tenant {}: {}", tenant,
                     records.error().message);
        return makeOutcome(statusForBackendError(records.error()), records.error().message);
    }

    std::vector<Candidate> candidates;
    candidates.reserve(records.value().size());
    for (auto& record : records.value()) {
        Candidate c;
        c.id = record.id;
        c.relevance = relevance[record.id];
        if (!record.embedding.empty()) {
            c.embedding = std::move(record.embedding);
        }
        c.metadata = std::move(record.metadata);
        candidates.push_back(std::move(c));
    }

    std::vector<vector::Embedding> recentEmbeddings;
    if (retrieval.recentRecommendations > 0) {
        const vector::PartitionKey recs{tenant, vector::ItemClass::Recommendation};
        auto recent = runWithTimeout<std::vector<vector::ItemRecord>>(
            *pool_, retrieval.searchTimeout, "Recent recommendation lookup",
            [store = store_, recs, n = retrieval.recentRecommendations]() {
                return store->recent(recs, n);
            });
        if (recent) {
            for (auto& r : recent.value()) {
                if (!r.embedding.empty()) {
                    recentEmbeddings.push_back(std::move(r.embedding));
                }
            }
        } else {
            spdlog::warn("Recent recommendations unavailable for tenant {}: {}", tenant,
                         recent.error().message);
        }
    }
    if (stop.stop_requested()) {
        return cancelled();
    }

    auto diverse = selectDiverse(candidates, query, recentEmbeddings, config_.mmr);
    if (diverse.empty()) {
        spdlog::info("All {} candidates for tenant {} lacked usable embeddings",
                     candidates.size(), tenant);
        return makeOutcome(OutcomeStatus::NoCandidates, kInsufficientItems);
    }

    RecommendationOutcome outcome;
    outcome.status = OutcomeStatus::Ok;
    outcome.candidates = std::move(diverse);
    outcome.message = fmt::format("{} candidates selected", outcome.candidates.size());
    return outcome;
}

RecommendationOutcome RecommendationPipeline::recommend(const RecommendationRequest& request,
                                                        std::stop_token stop) {
    if (stop.stop_requested()) {
        return cancelled();
    }

    std::optional<vector::Embedding> query = request.queryEmbedding;
    if (!query) {
        query = callEmbedding(embed_, buildQueryContext(request.query, request.profileSummary));
    }
    if (!query) {
        spdlog::warn("No query embedding for tenant {}", request.tenant);
        return makeOutcome(OutcomeStatus::EmbeddingUnavailable, "query embedding unavailable");
    }

    auto outcome = retrieve(request.tenant, *query, request.excludeIds, stop);
    if (!outcome.ok()) {
        return outcome;
    }
    if (stop.stop_requested()) {
        return cancelled();
    }

    std::optional<std::vector<ScoredGroup>> groups;
    if (compose_) {
        try {
            groups = compose_(ComposerRequest{request.query, request.tenant, outcome.candidates});
        } catch (const std::exception& e) {
            spdlog::warn("Composer failed for tenant {}: {}", request.tenant, e.what());
        }
    }
    if (!groups || groups->empty()) {
        spdlog::info("Composer returned no groups for tenant {}", request.tenant);
        outcome.status = OutcomeStatus::ComposerEmpty;
        outcome.message = "no outfits could be composed";
        return outcome;
    }

    std::unordered_map<ItemId, double> relevance;
    for (const auto& c : outcome.candidates) {
        relevance.emplace(c.id, c.relevance);
    }
    auto ranked = ranker_.rank(*groups, relevance);

    if (stop.stop_requested()) {
        return cancelled();
    }

    outcome.historyCommitted = commit(request, ranked);
    outcome.groups = std::move(ranked);
    outcome.message = fmt::format("Generated {} outfit recommendations", outcome.groups.size());
    spdlog::info("Recommendation for tenant {}: {} groups from {} candidates", request.tenant,
                 outcome.groups.size(), outcome.candidates.size());
    return outcome;
}

bool RecommendationPipeline::commit(const RecommendationRequest& request,
                                    const std::vector<RankedGroup>& ranked) {
    if (!history_) {
        spdlog::warn("No recommendation history configured; tenant {} will not cool down",
                     request.tenant);
        return false;
    }

    RecentOutputRecord record;
    record.tenant = request.tenant;
    record.query = request.query;
    std::vector<std::string> descriptions;
    std::vector<ItemId> usedIds;
    std::unordered_set<ItemId> seen;
    for (const auto& r : ranked) {
        record.groups.push_back(r.group.itemIds);
        descriptions.push_back(r.group.description.empty() ? r.group.name
                                                           : r.group.description);
        for (const auto& id : r.group.itemIds) {
            if (seen.insert(id).second) {
                usedIds.push_back(id);
            }
        }
    }

    auto appended = history_->append(std::move(record));
    if (!appended) {
        spdlog::error("Failed to record recommendation history for tenant {}: {}",
                      request.tenant, appended.error().message);
        return false;
    }

    auto text = buildRecommendationText(request.query, descriptions, usedIds);
    auto embedding = callEmbedding(embed_, text);
    if (!embedding) {
        spdlog::debug("No embedding for recommendation text; diversity history not updated");
        return true;
    }

    ItemId recId = request.recommendationId.value_or(fmt::format(
        "rec_{}_{}",
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count(),
        nextRecommendation_.fetch_add(1, std::memory_order_relaxed)));

    std::map<std::string, std::string> metadata{
        {"query", request.query}, {"items", fmt::format("{}", fmt::join(usedIds, ","))}};
    if (auto stored = vector::addRecommendation(*store_, request.tenant, recId, *embedding,
                                                std::move(metadata));
        !stored) {
        spdlog::warn("Failed to store recommendation embedding {}: {}", recId,
                     stored.error().message);
    }
    return true;
}

} // namespace drape::search
