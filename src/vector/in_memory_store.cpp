#include <drape/vector/in_memory_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace drape::vector {

InMemoryStore::InMemoryStore(size_t embedding_dim) : embedding_dim_(embedding_dim) {}

Result<void> InMemoryStore::initialize() {
    if (initialized_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Store already initialized"};
    }
    spdlog::debug("InMemoryStore initialized (dim={})", embedding_dim_);
    return Result<void>();
}

void InMemoryStore::close() {
    if (!initialized_.exchange(false)) {
        return;
    }
    std::unique_lock lock(partitions_mutex_);
    partitions_.clear();
    spdlog::debug("InMemoryStore closed");
}

bool InMemoryStore::isInitialized() const {
    return initialized_.load();
}

std::shared_ptr<InMemoryStore::Partition>
InMemoryStore::findPartition(const PartitionKey& key) const {
    std::shared_lock lock(partitions_mutex_);
    auto it = partitions_.find(key);
    return it == partitions_.end() ? nullptr : it->second;
}

std::shared_ptr<InMemoryStore::Partition>
InMemoryStore::getOrCreatePartition(const PartitionKey& key) {
    if (auto existing = findPartition(key)) {
        return existing;
    }
    std::unique_lock lock(partitions_mutex_);
    auto& slot = partitions_[key];
    if (!slot) {
        slot = std::make_shared<Partition>();
    }
    return slot;
}

Result<void> InMemoryStore::upsert(const PartitionKey& key, const ItemId& id,
                                   const Embedding& embedding,
                                   const std::map<std::string, std::string>& metadata) {
    if (!isInitialized()) {
        return Error{ErrorCode::Unavailable, "In-memory store not initialized"};
    }
    if (id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Item id must not be empty"};
    }
    if (embedding.empty()) {
        return Error{ErrorCode::InvalidArgument, "Embedding must not be empty"};
    }
    if (embedding_dim_ != 0 && !isValidEmbedding(embedding, embedding_dim_)) {
        return Error{ErrorCode::InvalidArgument,
                     "Embedding dimension " + std::to_string(embedding.size()) +
                         " does not match store dimension " + std::to_string(embedding_dim_)};
    }
    if (isZeroVector(embedding)) {
        return Error{ErrorCode::InvalidArgument, "Embedding for " + id + " has zero magnitude"};
    }

    auto partition = getOrCreatePartition(key);
    ItemRecord record;
    record.id = id;
    record.embedding = embedding;
    record.metadata = metadata;

    std::unique_lock lock(partition->mutex);
    record.sequence = next_sequence_.fetch_add(1);
    partition->records[id] = std::move(record);
    return Result<void>();
}

Result<std::vector<SimilarityHit>>
InMemoryStore::search(const PartitionKey& key, const Embedding& query, size_t limit,
                      const std::unordered_set<ItemId>& exclude_ids) {
    if (!isInitialized()) {
        return Error{ErrorCode::Unavailable, "In-memory store not initialized"};
    }
    if (limit == 0) {
        return std::vector<SimilarityHit>{};
    }
    if (embedding_dim_ != 0 && query.size() != embedding_dim_) {
        spdlog::warn("Query dimension {} does not match store dimension {} for {}; no matches",
                     query.size(), embedding_dim_, key.name());
        return std::vector<SimilarityHit>{};
    }

    auto partition = findPartition(key);
    if (!partition) {
        return std::vector<SimilarityHit>{};
    }

    struct Scored {
        SimilarityHit hit;
        uint64_t sequence;
    };
    std::vector<Scored> scored;
    {
        std::shared_lock lock(partition->mutex);
        scored.reserve(partition->records.size());
        for (const auto& [id, record] : partition->records) {
            if (exclude_ids.contains(id)) {
                continue;
            }
            scored.push_back({{id, cosineSimilarity(query, record.embedding)}, record.sequence});
        }
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.hit.similarity != b.hit.similarity) {
            return a.hit.similarity > b.hit.similarity;
        }
        return a.sequence < b.sequence;
    });

    std::vector<SimilarityHit> hits;
    hits.reserve(std::min(limit, scored.size()));
    for (auto& s : scored) {
        if (hits.size() >= limit) {
            break;
        }
        hits.push_back(std::move(s.hit));
    }
    return hits;
}

Result<std::vector<ItemRecord>> InMemoryStore::fetch(const PartitionKey& key,
                                                     const std::vector<ItemId>& ids) {
    if (!isInitialized()) {
        return Error{ErrorCode::Unavailable, "In-memory store not initialized"};
    }
    std::vector<ItemRecord> out;
    auto partition = findPartition(key);
    if (!partition) {
        return out;
    }

    std::shared_lock lock(partition->mutex);
    out.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = partition->records.find(id);
        if (it != partition->records.end()) {
            out.push_back(it->second);
        }
    }
    return out;
}

Result<std::vector<ItemRecord>> InMemoryStore::recent(const PartitionKey& key, size_t limit) {
    if (!isInitialized()) {
        return Error{ErrorCode::Unavailable, "In-memory store not initialized"};
    }
    std::vector<ItemRecord> out;
    auto partition = findPartition(key);
    if (!partition || limit == 0) {
        return out;
    }

    {
        std::shared_lock lock(partition->mutex);
        out.reserve(partition->records.size());
        for (const auto& [id, record] : partition->records) {
            out.push_back(record);
        }
    }
    std::sort(out.begin(), out.end(), [](const ItemRecord& a, const ItemRecord& b) {
        return a.sequence > b.sequence;
    });
    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

Result<size_t> InMemoryStore::count(const PartitionKey& key) {
    if (!isInitialized()) {
        return Error{ErrorCode::Unavailable, "In-memory store not initialized"};
    }
    auto partition = findPartition(key);
    if (!partition) {
        return size_t{0};
    }
    std::shared_lock lock(partition->mutex);
    return partition->records.size();
}

Result<void> InMemoryStore::remove(const PartitionKey& key, const ItemId& id) {
    if (!isInitialized()) {
        return Error{ErrorCode::Unavailable, "In-memory store not initialized"};
    }
    auto partition = findPartition(key);
    if (!partition) {
        return Error{ErrorCode::NotFound, "No record " + id + " in " + key.name()};
    }
    std::unique_lock lock(partition->mutex);
    if (partition->records.erase(id) == 0) {
        return Error{ErrorCode::NotFound, "No record " + id + " in " + key.name()};
    }
    return Result<void>();
}

// NullStore

Result<void> NullStore::initialize() {
    spdlog::warn("Similarity store disabled; retrieval will return no candidates");
    return Result<void>();
}

Result<void> NullStore::upsert(const PartitionKey& key, const ItemId& id, const Embedding&,
                               const std::map<std::string, std::string>&) {
    spdlog::debug("NullStore dropping upsert of {} into {}", id, key.name());
    return Result<void>();
}

Result<std::vector<SimilarityHit>> NullStore::search(const PartitionKey&, const Embedding&,
                                                     size_t, const std::unordered_set<ItemId>&) {
    return std::vector<SimilarityHit>{};
}

Result<std::vector<ItemRecord>> NullStore::fetch(const PartitionKey&,
                                                 const std::vector<ItemId>&) {
    return std::vector<ItemRecord>{};
}

Result<std::vector<ItemRecord>> NullStore::recent(const PartitionKey&, size_t) {
    return std::vector<ItemRecord>{};
}

Result<size_t> NullStore::count(const PartitionKey&) {
    return size_t{0};
}

Result<void> NullStore::remove(const PartitionKey&, const ItemId&) {
    return Result<void>();
}

} // namespace drape::vector
