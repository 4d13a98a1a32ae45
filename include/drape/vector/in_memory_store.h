#pragma once

#include <drape/vector/similarity_store.h>

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace drape::vector {

/**
 * @brief Exact-scan store kept in process memory
 *
 * Partitions are locked independently so tenants never contend with each other
 * beyond the brief lookup of their partition.
 */
class InMemoryStore : public ISimilarityStore {
public:
    // embedding_dim == 0 accepts any non-empty dimension
    explicit InMemoryStore(size_t embedding_dim = 0);
    ~InMemoryStore() override = default;

    InMemoryStore(const InMemoryStore&) = delete;
    InMemoryStore& operator=(const InMemoryStore&) = delete;

    Result<void> initialize() override;
    void close() override;
    bool isInitialized() const override;

    Result<void> upsert(const PartitionKey& key, const ItemId& id, const Embedding& embedding,
                        const std::map<std::string, std::string>& metadata = {}) override;

    Result<std::vector<SimilarityHit>>
    search(const PartitionKey& key, const Embedding& query, size_t limit,
           const std::unordered_set<ItemId>& exclude_ids = {}) override;

    Result<std::vector<ItemRecord>> fetch(const PartitionKey& key,
                                          const std::vector<ItemId>& ids) override;

    Result<std::vector<ItemRecord>> recent(const PartitionKey& key, size_t limit) override;

    Result<size_t> count(const PartitionKey& key) override;

    Result<void> remove(const PartitionKey& key, const ItemId& id) override;

    size_t embeddingDim() const override { return embedding_dim_; }

private:
    struct Partition {
        mutable std::shared_mutex mutex;
        std::unordered_map<ItemId, ItemRecord> records;
    };

    std::shared_ptr<Partition> findPartition(const PartitionKey& key) const;
    std::shared_ptr<Partition> getOrCreatePartition(const PartitionKey& key);

    size_t embedding_dim_;
    std::atomic<bool> initialized_{false};
    std::atomic<uint64_t> next_sequence_{1};

    mutable std::shared_mutex partitions_mutex_;
    std::unordered_map<PartitionKey, std::shared_ptr<Partition>, PartitionKeyHash> partitions_;
};

/**
 * @brief Store used when similarity search is disabled
 */
class NullStore : public ISimilarityStore {
public:
    explicit NullStore(size_t embedding_dim = 0) : embedding_dim_(embedding_dim) {}

    Result<void> initialize() override;
    void close() override {}
    bool isInitialized() const override { return true; }

    Result<void> upsert(const PartitionKey& key, const ItemId& id, const Embedding& embedding,
                        const std::map<std::string, std::string>& metadata = {}) override;

    Result<std::vector<SimilarityHit>>
    search(const PartitionKey& key, const Embedding& query, size_t limit,
           const std::unordered_set<ItemId>& exclude_ids = {}) override;

    Result<std::vector<ItemRecord>> fetch(const PartitionKey& key,
                                          const std::vector<ItemId>& ids) override;

    Result<std::vector<ItemRecord>> recent(const PartitionKey& key, size_t limit) override;

    Result<size_t> count(const PartitionKey& key) override;

    Result<void> remove(const PartitionKey& key, const ItemId& id) override;

    size_t embeddingDim() const override { return embedding_dim_; }

private:
    size_t embedding_dim_;
};

} // namespace drape::vector
