#include <drape/search/recommendation_pipeline.h>
#include <drape/vector/in_memory_store.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/test_helpers.h"

using namespace drape;
using namespace drape::search;
using drape::tests::axis;
using drape::tests::planar;
using drape::tests::withSimilarity;
using drape::vector::Embedding;
using drape::vector::ItemClass;
using drape::vector::PartitionKey;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class MockSimilarityStore : public vector::ISimilarityStore {
public:
    MOCK_METHOD(Result<void>, initialize, (), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(bool, isInitialized, (), (const, override));
    MOCK_METHOD(Result<void>, upsert,
                (const PartitionKey& key, const ItemId& id, const Embedding& embedding,
                 (const std::map<std::string, std::string>& metadata)),
                (override));
    MOCK_METHOD(Result<std::vector<vector::SimilarityHit>>, search,
                (const PartitionKey& key, const Embedding& query, size_t limit,
                 const std::unordered_set<ItemId>& exclude_ids),
                (override));
    MOCK_METHOD(Result<std::vector<vector::ItemRecord>>, fetch,
                (const PartitionKey& key, const std::vector<ItemId>& ids), (override));
    MOCK_METHOD(Result<std::vector<vector::ItemRecord>>, recent,
                (const PartitionKey& key, size_t limit), (override));
    MOCK_METHOD(Result<size_t>, count, (const PartitionKey& key), (override));
    MOCK_METHOD(Result<void>, remove, (const PartitionKey& key, const ItemId& id), (override));
    MOCK_METHOD(size_t, embeddingDim, (), (const, override));
};

class FailingHistory : public IRecommendationHistory {
public:
    Result<void> append(RecentOutputRecord) override {
        return Error{ErrorCode::DatabaseError, "disk full"};
    }
    Result<std::vector<RecentOutputRecord>> recent(const TenantId&, size_t) const override {
        return std::vector<RecentOutputRecord>{};
    }
};

// One single-item group per candidate, all with the same confidence
ComposerFunction singleItemComposer(std::atomic<int>* calls = nullptr) {
    return [calls](const ComposerRequest& request) -> std::optional<std::vector<ScoredGroup>> {
        if (calls) {
            calls->fetch_add(1);
        }
        std::vector<ScoredGroup> groups;
        for (const auto& c : request.candidates) {
            ScoredGroup g;
            g.name = "look with " + c.id;
            g.description = "outfit built around " + c.id;
            g.itemIds = {c.id};
            g.composerConfidence = 0.5;
            groups.push_back(g);
        }
        return groups;
    };
}

std::vector<std::string> candidateIds(const RecommendationOutcome& outcome) {
    std::vector<std::string> ids;
    for (const auto& c : outcome.candidates) {
        ids.push_back(c.id);
    }
    return ids;
}

} // namespace

class RecommendationPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<vector::InMemoryStore>(4);
        ASSERT_TRUE(store_->initialize());
        history_ = std::make_shared<InMemoryRecommendationHistory>();

        config_.store.type = "memory";
        config_.store.embeddingDim = 4;
        config_.retrieval.searchLimit = 4;
        config_.retrieval.minSimilarity = 0.3;
        config_.retrieval.searchTimeout = std::chrono::milliseconds(1000);
        config_.mmr.k = 4;
    }

    // Five items with similarities 0.95, 0.85, 0.8, 0.4 and 0.1 to axis(0)
    void seedScenario() {
        const std::vector<std::pair<std::string, double>> items{
            {"i95", 0.95}, {"i85", 0.85}, {"i80", 0.80}, {"i40", 0.40}, {"i10", 0.10}};
        for (const auto& [id, sim] : items) {
            ASSERT_TRUE(vector::addWardrobeItem(*store_, tenant_, id, withSimilarity(sim)));
        }
    }

    std::unique_ptr<RecommendationPipeline>
    makePipeline(ComposerFunction compose = singleItemComposer(),
                 EmbeddingFunction embed = [](const std::string&) {
                     return std::optional<Embedding>(axis(0));
                 }) {
        return std::make_unique<RecommendationPipeline>(store_, history_, config_,
                                                        std::move(embed), std::move(compose));
    }

    RecommendationRequest request(std::optional<Embedding> query = axis(0)) {
        RecommendationRequest r;
        r.tenant = tenant_;
        r.query = "smart casual dinner";
        r.queryEmbedding = std::move(query);
        return r;
    }

    size_t storedRecommendations() {
        return store_->count(PartitionKey{tenant_, ItemClass::Recommendation}).value();
    }

    std::string tenant_ = "jane@example.com";
    std::shared_ptr<vector::InMemoryStore> store_;
    std::shared_ptr<InMemoryRecommendationHistory> history_;
    config::EngineConfig config_;
};

TEST_F(RecommendationPipelineTest, EndToEndKeepsRelevantItemsAboveFloor) {
    seedScenario();
    auto pipeline = makePipeline();

    auto outcome = pipeline->recommend(request());
    ASSERT_EQ(outcome.status, OutcomeStatus::Ok) << outcome.message;

    auto ids = candidateIds(outcome);
    EXPECT_EQ(std::count(ids.begin(), ids.end(), "i10"), 0);
    for (const char* expected : {"i95", "i85", "i80"}) {
        EXPECT_EQ(std::count(ids.begin(), ids.end(), expected), 1) << expected;
    }
    ASSERT_FALSE(outcome.candidates.empty());
    EXPECT_EQ(outcome.candidates.front().id, "i95");
    EXPECT_NEAR(outcome.candidates.front().relevance, 0.95, 1e-5);

    ASSERT_EQ(outcome.groups.size(), outcome.candidates.size());
    EXPECT_EQ(outcome.groups[0].rank, 1);
    EXPECT_EQ(outcome.groups[0].group.itemIds, (std::vector<ItemId>{"i95"}));
    EXPECT_TRUE(outcome.historyCommitted);
    EXPECT_EQ(history_->size(tenant_), 1u);
    EXPECT_EQ(storedRecommendations(), 1u);
}

TEST_F(RecommendationPipelineTest, RetrieveDoesNotCommit) {
    seedScenario();
    auto pipeline = makePipeline();

    auto outcome = pipeline->retrieve(tenant_, axis(0));
    ASSERT_TRUE(outcome.ok());
    EXPECT_FALSE(outcome.candidates.empty());
    EXPECT_TRUE(outcome.groups.empty());
    EXPECT_EQ(history_->size(tenant_), 0u);
}

TEST_F(RecommendationPipelineTest, UsedItemsCoolDownOnNextRequest) {
    seedScenario();
    auto pipeline = makePipeline();

    auto first = pipeline->recommend(request());
    ASSERT_TRUE(first.ok());

    // Every item above the floor was handed out; only the 0.1 item remains
    auto second = pipeline->recommend(request());
    EXPECT_EQ(second.status, OutcomeStatus::NoCandidates);
    EXPECT_EQ(second.message, "insufficient distinct items");
    EXPECT_EQ(history_->size(tenant_), 1u);
}

TEST_F(RecommendationPipelineTest, ExplicitExclusionsAreHonoured) {
    seedScenario();
    auto pipeline = makePipeline();

    auto req = request();
    req.excludeIds = {"i95", "i80"};
    auto outcome = pipeline->recommend(req);
    ASSERT_TRUE(outcome.ok());
    auto ids = candidateIds(outcome);
    EXPECT_EQ(std::count(ids.begin(), ids.end(), "i95"), 0);
    EXPECT_EQ(std::count(ids.begin(), ids.end(), "i80"), 0);
    EXPECT_EQ(outcome.candidates.front().id, "i85");
}

TEST_F(RecommendationPipelineTest, NothingAboveFloorReportsNoCandidates) {
    seedScenario();
    std::atomic<int> composerCalls{0};
    auto pipeline = makePipeline(singleItemComposer(&composerCalls));

    auto outcome = pipeline->recommend(request(axis(2)));
    EXPECT_EQ(outcome.status, OutcomeStatus::NoCandidates);
    EXPECT_EQ(outcome.message, "insufficient distinct items");
    EXPECT_TRUE(outcome.candidates.empty());
    EXPECT_EQ(composerCalls.load(), 0);
    EXPECT_EQ(history_->size(tenant_), 0u);
}

TEST_F(RecommendationPipelineTest, QueryTextIsEmbeddedWithStyleContext) {
    seedScenario();
    std::vector<std::string> embedded;
    auto pipeline = makePipeline(singleItemComposer(), [&embedded](const std::string& text) {
        embedded.push_back(text);
        return std::optional<Embedding>(axis(0));
    });

    auto req = request(std::nullopt);
    req.profileSummary = "minimalist, neutral tones";
    auto outcome = pipeline->recommend(req);
    ASSERT_TRUE(outcome.ok());

    // Query context first, then the finalized recommendation text
    ASSERT_EQ(embedded.size(), 2u);
    EXPECT_EQ(embedded[0], "smart casual dinner. User style: minimalist, neutral tones");
    EXPECT_EQ(embedded[1].rfind("Query: smart casual dinner | Outfits recommended: | ", 0), 0u);
}

TEST_F(RecommendationPipelineTest, MissingQueryEmbeddingStopsEarly) {
    seedScenario();
    std::atomic<int> composerCalls{0};
    auto pipeline = makePipeline(singleItemComposer(&composerCalls),
                                 [](const std::string&) { return std::optional<Embedding>{}; });

    auto outcome = pipeline->recommend(request(std::nullopt));
    EXPECT_EQ(outcome.status, OutcomeStatus::EmbeddingUnavailable);
    EXPECT_EQ(composerCalls.load(), 0);
    EXPECT_EQ(history_->size(tenant_), 0u);
}

TEST_F(RecommendationPipelineTest, EmptyComposerResultCommitsNothing) {
    seedScenario();
    auto pipeline = makePipeline([](const ComposerRequest&) {
        return std::optional<std::vector<ScoredGroup>>(std::vector<ScoredGroup>{});
    });

    auto outcome = pipeline->recommend(request());
    EXPECT_EQ(outcome.status, OutcomeStatus::ComposerEmpty);
    EXPECT_TRUE(outcome.groups.empty());
    EXPECT_FALSE(outcome.candidates.empty());
    EXPECT_FALSE(outcome.historyCommitted);
    EXPECT_EQ(history_->size(tenant_), 0u);
    EXPECT_EQ(storedRecommendations(), 0u);
}

TEST_F(RecommendationPipelineTest, ThrowingComposerIsTreatedAsEmpty) {
    seedScenario();
    auto pipeline = makePipeline([](const ComposerRequest&) -> std::optional<std::vector<ScoredGroup>> {
        throw std::runtime_error("model overloaded");
    });

    auto outcome = pipeline->recommend(request());
    EXPECT_EQ(outcome.status, OutcomeStatus::ComposerEmpty);
    EXPECT_EQ(history_->size(tenant_), 0u);
}

TEST_F(RecommendationPipelineTest, CancelledBeforeStartDoesNothing) {
    seedScenario();
    std::atomic<int> composerCalls{0};
    auto pipeline = makePipeline(singleItemComposer(&composerCalls));

    std::stop_source source;
    source.request_stop();
    auto outcome = pipeline->recommend(request(), source.get_token());
    EXPECT_EQ(outcome.status, OutcomeStatus::Cancelled);
    EXPECT_EQ(composerCalls.load(), 0);
    EXPECT_EQ(history_->size(tenant_), 0u);
}

TEST_F(RecommendationPipelineTest, CancelledDuringCompositionCommitsNothing) {
    seedScenario();
    std::stop_source source;
    auto inner = singleItemComposer();
    auto pipeline = makePipeline([&source, inner](const ComposerRequest& req) {
        source.request_stop();
        return inner(req);
    });

    auto outcome = pipeline->recommend(request(), source.get_token());
    EXPECT_EQ(outcome.status, OutcomeStatus::Cancelled);
    EXPECT_EQ(history_->size(tenant_), 0u);
    EXPECT_EQ(storedRecommendations(), 0u);
}

TEST_F(RecommendationPipelineTest, RecentRecommendationsSteerDiversity) {
    ASSERT_TRUE(vector::addWardrobeItem(*store_, tenant_, "close", planar(30)));
    ASSERT_TRUE(vector::addWardrobeItem(*store_, tenant_, "other", planar(70)));
    config_.mmr.k = 1;

    {
        auto pipeline = makePipeline();
        auto outcome = pipeline->retrieve(tenant_, planar(45));
        ASSERT_TRUE(outcome.ok());
        ASSERT_EQ(outcome.candidates.size(), 1u);
        EXPECT_EQ(outcome.candidates[0].id, "close");
    }

    ASSERT_TRUE(vector::addRecommendation(*store_, tenant_, "rec1", planar(30)));
    auto pipeline = makePipeline();
    auto outcome = pipeline->retrieve(tenant_, planar(45));
    ASSERT_TRUE(outcome.ok());
    ASSERT_EQ(outcome.candidates.size(), 1u);
    EXPECT_EQ(outcome.candidates[0].id, "other");
}

TEST_F(RecommendationPipelineTest, HistoryFailureStillReturnsRanking) {
    seedScenario();
    auto pipeline = std::make_unique<RecommendationPipeline>(
        store_, std::make_shared<FailingHistory>(), config_,
        [](const std::string&) { return std::optional<Embedding>(axis(0)); },
        singleItemComposer());

    auto outcome = pipeline->recommend(request());
    EXPECT_EQ(outcome.status, OutcomeStatus::Ok);
    EXPECT_FALSE(outcome.groups.empty());
    EXPECT_FALSE(outcome.historyCommitted);
    EXPECT_EQ(storedRecommendations(), 0u);
}

TEST_F(RecommendationPipelineTest, UnavailableBackendDegrades) {
    auto mock = std::make_shared<NiceMock<MockSimilarityStore>>();
    EXPECT_CALL(*mock, search(_, _, _, _))
        .WillOnce(Return(Result<std::vector<vector::SimilarityHit>>(
            Error{ErrorCode::Unavailable, "database is locked"})));

    RecommendationPipeline pipeline(mock, history_, config_, nullptr, singleItemComposer());
    auto outcome = pipeline.recommend(request());
    EXPECT_EQ(outcome.status, OutcomeStatus::BackendUnavailable);
    EXPECT_TRUE(outcome.candidates.empty());
    EXPECT_EQ(history_->size(tenant_), 0u);
}

TEST_F(RecommendationPipelineTest, SlowBackendTimesOut) {
    auto mock = std::make_shared<NiceMock<MockSimilarityStore>>();
    EXPECT_CALL(*mock, search(_, _, _, _))
        .WillOnce([](const PartitionKey&, const Embedding&, size_t,
                     const std::unordered_set<ItemId>&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return Result<std::vector<vector::SimilarityHit>>(
                std::vector<vector::SimilarityHit>{});
        });
    config_.retrieval.searchTimeout = std::chrono::milliseconds(20);

    RecommendationPipeline pipeline(mock, history_, config_, nullptr, singleItemComposer());
    auto start = std::chrono::steady_clock::now();
    auto outcome = pipeline.recommend(request());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.status, OutcomeStatus::BackendTimeout);
    EXPECT_TRUE(outcome.candidates.empty());
    EXPECT_LT(elapsed, std::chrono::milliseconds(250));
    EXPECT_EQ(history_->size(tenant_), 0u);
}

TEST(RecommendationTextTest, QueryContextFallsBackToGeneralStyle) {
    EXPECT_EQ(buildQueryContext("beach day", std::nullopt), "beach day. User style: General style");
    EXPECT_EQ(buildQueryContext("beach day", std::string()),
              "beach day. User style: General style");

    std::string longSummary(800, 's');
    auto context = buildQueryContext("q", longSummary);
    EXPECT_EQ(context, "q. User style: " + std::string(500, 's'));
}

TEST(RecommendationTextTest, RecommendationTextListsOutfitsAndItems) {
    auto text = buildRecommendationText("office", {"navy blazer look", "grey knit look"},
                                        {"12", "7", "3"});
    EXPECT_EQ(text, "Query: office | Outfits recommended: | navy blazer look | grey knit look | "
                    "Items used: 12, 7, 3");
}
