#pragma once

#include <drape/core/types.h>
#include <drape/vector/embedding_math.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace drape::vector {

/**
 * @brief Kind of record held by a partition
 */
enum class ItemClass {
    Profile,       // user profile embedding
    Item,          // wardrobe item embedding
    Recommendation // embedding of a finalized recommendation
};

constexpr const char* itemClassName(ItemClass cls) {
    switch (cls) {
        case ItemClass::Profile: return "user_profiles";
        case ItemClass::Item: return "wardrobe_items";
        case ItemClass::Recommendation: return "recommendations";
    }
    return "unknown";
}

/**
 * @brief Reduce a tenant identifier to a storage-safe token
 *
 * E-mail tenants keep their local part; characters outside [A-Za-z0-9_-]
 * become '_'; an empty tenant maps to "default".
 */
std::string sanitizeTenant(std::string_view tenant);

/**
 * @brief (tenant, item class) scope of every store operation
 */
struct PartitionKey {
    TenantId tenant;
    ItemClass itemClass = ItemClass::Item;

    PartitionKey() = default;
    PartitionKey(TenantId t, ItemClass cls) : tenant(std::move(t)), itemClass(cls) {}

    // <prefix>_<sanitized tenant>_<class name>
    std::string name(std::string_view prefix = "drape") const;

    bool operator==(const PartitionKey&) const = default;
};

struct PartitionKeyHash {
    size_t operator()(const PartitionKey& key) const noexcept {
        size_t h = std::hash<std::string>{}(key.tenant);
        return h ^ (static_cast<size_t>(key.itemClass) + 0x9e3779b97f4a7c15ULL + (h << 6) +
                    (h >> 2));
    }
};

/**
 * @brief Stored (id, embedding, metadata) tuple
 *
 * An empty embedding on a fetched record means the stored form could not be parsed.
 */
struct ItemRecord {
    ItemId id;
    Embedding embedding;
    std::map<std::string, std::string> metadata;
    uint64_t sequence = 0; // insertion/update order within the store
};

struct SimilarityHit {
    ItemId id;
    double similarity = 0.0;
};

/**
 * @brief Backend selection and shape
 */
struct StoreConfig {
    std::string type = "sqlite_vec"; // sqlite_vec | memory | none
    std::string databasePath = "drape_vectors.db";
    size_t embeddingDim = 1536;
    std::string partitionPrefix = "drape";
};

/**
 * @brief Abstract interface for partitioned similarity storage
 *
 * Every operation is scoped to one PartitionKey. Connectivity problems are reported as
 * ErrorCode::Unavailable so callers can degrade instead of failing the request.
 */
class ISimilarityStore {
public:
    virtual ~ISimilarityStore() = default;

    virtual Result<void> initialize() = 0;
    virtual void close() = 0;
    virtual bool isInitialized() const = 0;

    /**
     * @brief Insert or replace a record; refreshes its recency
     */
    virtual Result<void> upsert(const PartitionKey& key, const ItemId& id,
                                const Embedding& embedding,
                                const std::map<std::string, std::string>& metadata = {}) = 0;

    /**
     * @brief k-nearest-neighbour query
     *
     * @param query Query embedding
     * @param limit Maximum number of hits
     * @param exclude_ids Ids never returned
     * @return Hits in non-increasing similarity order. No similarity floor is applied here.
     */
    virtual Result<std::vector<SimilarityHit>>
    search(const PartitionKey& key, const Embedding& query, size_t limit,
           const std::unordered_set<ItemId>& exclude_ids = {}) = 0;

    /**
     * @brief Batch lookup; unknown ids are skipped
     */
    virtual Result<std::vector<ItemRecord>> fetch(const PartitionKey& key,
                                                  const std::vector<ItemId>& ids) = 0;

    /**
     * @brief Up to `limit` most recently upserted records, newest first
     */
    virtual Result<std::vector<ItemRecord>> recent(const PartitionKey& key, size_t limit) = 0;

    virtual Result<size_t> count(const PartitionKey& key) = 0;

    virtual Result<void> remove(const PartitionKey& key, const ItemId& id) = 0;

    virtual size_t embeddingDim() const = 0;
};

enum class SimilarityStoreType {
    SqliteVec, // sqlite-vec extension (default)
    InMemory,  // process-local, for tests and embedded use
    None       // disabled; writes are dropped, reads are empty
};

std::optional<SimilarityStoreType> parseStoreType(std::string_view name);

/**
 * @brief Build a store for the configured backend type
 *
 * Unknown type names fall back to the null store with a warning.
 */
Result<std::unique_ptr<ISimilarityStore>> createSimilarityStore(const StoreConfig& config);

// Domain helpers mapping wardrobe concepts onto partitions

Result<void> addUserProfile(ISimilarityStore& store, const TenantId& tenant, const ItemId& user_id,
                            const Embedding& embedding,
                            std::map<std::string, std::string> metadata = {});

Result<void> addWardrobeItem(ISimilarityStore& store, const TenantId& tenant, const ItemId& item_id,
                             const Embedding& embedding,
                             std::map<std::string, std::string> metadata = {});

Result<void> addRecommendation(ISimilarityStore& store, const TenantId& tenant,
                               const ItemId& rec_id, const Embedding& embedding,
                               std::map<std::string, std::string> metadata = {});

} // namespace drape::vector
