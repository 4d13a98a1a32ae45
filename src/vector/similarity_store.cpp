#include <drape/vector/in_memory_store.h>
#include <drape/vector/similarity_store.h>
#ifdef DRAPE_HAVE_SQLITE_VEC
#include <drape/vector/sqlite_vec_store.h>
#endif

#include <spdlog/spdlog.h>

#include <cctype>

namespace drape::vector {

namespace {
constexpr size_t kMaxMetadataText = 500;

void truncateField(std::map<std::string, std::string>& metadata, const std::string& field) {
    auto it = metadata.find(field);
    if (it != metadata.end() && it->second.size() > kMaxMetadataText) {
        it->second.resize(kMaxMetadataText);
    }
}
} // namespace

std::string sanitizeTenant(std::string_view tenant) {
    auto at = tenant.find('@');
    if (at != std::string_view::npos) {
        tenant = tenant.substr(0, at);
    }
    if (tenant.empty()) {
        return "default";
    }

    std::string out;
    out.reserve(tenant.size());
    for (unsigned char c : tenant) {
        out.push_back(std::isalnum(c) || c == '_' || c == '-' ? static_cast<char>(c) : '_');
    }
    return out;
}

std::string PartitionKey::name(std::string_view prefix) const {
    std::string out(prefix);
    out += '_';
    out += sanitizeTenant(tenant);
    out += '_';
    out += itemClassName(itemClass);
    return out;
}

std::optional<SimilarityStoreType> parseStoreType(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (unsigned char c : name) {
        lower.push_back(static_cast<char>(std::tolower(c)));
    }
    if (lower == "sqlite_vec" || lower == "sqlite-vec" || lower == "sqlite") {
        return SimilarityStoreType::SqliteVec;
    }
    if (lower == "memory" || lower == "in_memory" || lower == "inmemory") {
        return SimilarityStoreType::InMemory;
    }
    if (lower == "none" || lower == "disabled") {
        return SimilarityStoreType::None;
    }
    return std::nullopt;
}

Result<std::unique_ptr<ISimilarityStore>> createSimilarityStore(const StoreConfig& config) {
    auto type = parseStoreType(config.type);
    if (!type) {
        spdlog::warn("Unknown vector store type '{}', similarity search disabled", config.type);
        type = SimilarityStoreType::None;
    }

    std::unique_ptr<ISimilarityStore> store;
    switch (*type) {
        case SimilarityStoreType::SqliteVec:
#ifdef DRAPE_HAVE_SQLITE_VEC
            store = std::make_unique<SqliteVecStore>(config);
            break;
#else
            return Error{ErrorCode::NotSupported, "drape was built without sqlite-vec support"};
#endif
        case SimilarityStoreType::InMemory:
            store = std::make_unique<InMemoryStore>(config.embeddingDim);
            break;
        case SimilarityStoreType::None:
            store = std::make_unique<NullStore>(config.embeddingDim);
            break;
    }
    return store;
}

Result<void> addUserProfile(ISimilarityStore& store, const TenantId& tenant, const ItemId& user_id,
                            const Embedding& embedding,
                            std::map<std::string, std::string> metadata) {
    metadata["user_id"] = user_id;
    return store.upsert(PartitionKey{tenant, ItemClass::Profile}, user_id, embedding,
                        metadata);
}

Result<void> addWardrobeItem(ISimilarityStore& store, const TenantId& tenant, const ItemId& item_id,
                             const Embedding& embedding,
                             std::map<std::string, std::string> metadata) {
    metadata["item_id"] = item_id;
    truncateField(metadata, "summary_text");
    truncateField(metadata, "embedding_source");
    return store.upsert(PartitionKey{tenant, ItemClass::Item}, item_id, embedding, metadata);
}

Result<void> addRecommendation(ISimilarityStore& store, const TenantId& tenant,
                               const ItemId& rec_id, const Embedding& embedding,
                               std::map<std::string, std::string> metadata) {
    metadata["rec_id"] = rec_id;
    truncateField(metadata, "query");
    return store.upsert(PartitionKey{tenant, ItemClass::Recommendation}, rec_id, embedding,
                        metadata);
}

} // namespace drape::vector
