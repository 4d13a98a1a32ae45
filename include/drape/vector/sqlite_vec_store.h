#pragma once

#include <drape/vector/similarity_store.h>

#include <sqlite3.h>
#include <mutex>

namespace drape::vector {

/**
 * @brief SQLite + sqlite-vec implementation of ISimilarityStore
 *
 * Embeddings live in a vec0 virtual table; the partition columns, item ids,
 * metadata and recency sequence live in a regular table sharing the rowid.
 * Nearest-neighbour queries scan the partition with vec_distance_cosine.
 */
class SqliteVecStore : public ISimilarityStore {
public:
    explicit SqliteVecStore(StoreConfig config);
    ~SqliteVecStore() override;

    SqliteVecStore(const SqliteVecStore&) = delete;
    SqliteVecStore& operator=(const SqliteVecStore&) = delete;

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

    size_t embeddingDim() const override { return config_.embeddingDim; }

private:
    /**
     * @brief Register the vec0 module on the open connection
     */
    Result<void> loadSqliteVecExtension();

    Result<void> createTables();

    /**
     * @brief Execute a SQL statement with error handling
     */
    Result<void> executeSQL(const std::string& sql);

    /**
     * @brief Map a SQLite result code to an Error; connectivity codes become Unavailable
     */
    Error sqliteError(int rc, const std::string& context) const;

    Result<sqlite3_int64> findRowid(const PartitionKey& key, const ItemId& id);

    Result<std::vector<ItemRecord>> readRecords(sqlite3_stmt* stmt);

    StoreConfig config_;
    sqlite3* db_;
    bool initialized_;
    mutable std::mutex mutex_;
};

} // namespace drape::vector
