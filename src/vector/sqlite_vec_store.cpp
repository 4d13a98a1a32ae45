#include <drape/vector/sqlite_vec_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <unordered_map>

extern "C" {
#include "sqlite-vec.h"
}

namespace drape::vector {

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

inline int stepWithRetry(sqlite3_stmt* stmt, int max_attempts = 20) {
    int attempt = 0;
    while (true) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            int exp = attempt;
            if (exp > 7)
                exp = 7;
            int sleep_ms = 10 * (1 << exp);
            ++attempt;
            if (attempt <= max_attempts) {
                spdlog::warn("sqlite3_step busy/locked (rc={}): retry {}/{} after {} ms", rc,
                             attempt, max_attempts, sleep_ms);
                sqlite3_sleep(sleep_ms);
                continue;
            }
        }
        return rc;
    }
}

// Rolls back unless commit() succeeded
class TransactionGuard {
public:
    explicit TransactionGuard(sqlite3* db) : db_(db), committed_(false) {}

    ~TransactionGuard() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    int commit() {
        int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
        if (rc == SQLITE_OK) {
            committed_ = true;
        }
        return rc;
    }

private:
    sqlite3* db_;
    bool committed_;
};

std::string metadataToJson(const std::map<std::string, std::string>& metadata) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& [k, v] : metadata) {
        obj[k] = v;
    }
    return obj.dump();
}

std::map<std::string, std::string> metadataFromJson(const char* text) {
    std::map<std::string, std::string> out;
    if (!text) {
        return out;
    }
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        spdlog::debug("Ignoring malformed metadata column: {}", text);
        return out;
    }
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        out[it.key()] = it->is_string() ? it->get<std::string>() : it->dump();
    }
    return out;
}

std::string idsToJson(const std::vector<ItemId>& ids) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& id : ids) {
        arr.push_back(id);
    }
    return arr.dump();
}

const char* columnText(sqlite3_stmt* stmt, int col) {
    return reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
}

} // namespace

SqliteVecStore::SqliteVecStore(StoreConfig config)
    : config_(std::move(config)), db_(nullptr), initialized_(false) {}

SqliteVecStore::~SqliteVecStore() {
    close();
}

Result<void> SqliteVecStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return Error{ErrorCode::InvalidState, "Store already initialized"};
    }
    if (config_.embeddingDim == 0) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimension must be positive"};
    }

    int rc = sqlite3_open(config_.databasePath.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        return Error{ErrorCode::Unavailable, "Failed to open database: " + error};
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 10000);
    spdlog::info("Vector database opened: {}", config_.databasePath);

    for (const char* pragma : {"PRAGMA temp_store=MEMORY", "PRAGMA journal_mode=WAL",
                               "PRAGMA synchronous=NORMAL"}) {
        auto applied = executeSQL(pragma);
        if (!applied) {
            spdlog::warn("{} failed: {}. Continuing with defaults.", pragma,
                         applied.error().message);
        }
    }

    auto result = loadSqliteVecExtension();
    if (!result) {
        sqlite3_close(db_);
        db_ = nullptr;
        return Error{ErrorCode::DatabaseError,
                     "Failed to load sqlite-vec extension: " + result.error().message};
    }

    result = createTables();
    if (!result) {
        sqlite3_close(db_);
        db_ = nullptr;
        return result;
    }

    initialized_ = true;
    spdlog::info("SqliteVecStore initialized (dim={})", config_.embeddingDim);
    return Result<void>();
}

void SqliteVecStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return;
    }
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    initialized_ = false;
    spdlog::debug("SqliteVecStore closed");
}

bool SqliteVecStore::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

Result<void> SqliteVecStore::loadSqliteVecExtension() {
    char* error_msg = nullptr;
    int rc = sqlite3_vec_init(db_, &error_msg, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return Error{ErrorCode::DatabaseError, error};
    }
    spdlog::debug("sqlite-vec extension initialized");
    return Result<void>();
}

Result<void> SqliteVecStore::createTables() {
    std::string vector_sql =
        "CREATE VIRTUAL TABLE IF NOT EXISTS item_embeddings USING vec0(embedding float[" +
        std::to_string(config_.embeddingDim) + "])";
    auto result = executeSQL(vector_sql);
    if (!result) {
        spdlog::error("Vector table creation failed: {}", result.error().message);
        return Error{ErrorCode::DatabaseError,
                     "Failed to create vector table: " + result.error().message};
    }

    result = executeSQL(R"(
        CREATE TABLE IF NOT EXISTS item_metadata (
            rowid INTEGER PRIMARY KEY,
            tenant TEXT NOT NULL,
            item_class INTEGER NOT NULL,
            item_id TEXT NOT NULL,
            metadata TEXT,
            seq INTEGER NOT NULL,
            UNIQUE (tenant, item_class, item_id)
        )
    )");
    if (!result) {
        spdlog::error("Metadata table creation failed: {}", result.error().message);
        return Error{ErrorCode::DatabaseError,
                     "Failed to create metadata table: " + result.error().message};
    }

    auto index_result = executeSQL("CREATE INDEX IF NOT EXISTS idx_item_metadata_partition_seq "
                                   "ON item_metadata(tenant, item_class, seq)");
    if (!index_result) {
        spdlog::warn("Failed to create recency index: {}", index_result.error().message);
    }
    return Result<void>();
}

Result<void> SqliteVecStore::executeSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errmsg(db_);
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return sqliteError(rc, error);
    }
    return Result<void>();
}

Error SqliteVecStore::sqliteError(int rc, const std::string& context) const {
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_CANTOPEN:
        case SQLITE_IOERR:
        case SQLITE_PROTOCOL:
            return Error{ErrorCode::Unavailable, context + " (sqlite rc=" + std::to_string(rc) + ")"};
        default:
            return Error{ErrorCode::DatabaseError,
                         context + " (sqlite rc=" + std::to_string(rc) + ")"};
    }
}

Result<sqlite3_int64> SqliteVecStore::findRowid(const PartitionKey& key, const ItemId& id) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(
        db_, "SELECT rowid FROM item_metadata WHERE tenant = ? AND item_class = ? AND item_id = ?",
        -1, &raw, nullptr);
    StmtPtr stmt(raw);
    if (rc != SQLITE_OK) {
        return sqliteError(rc, std::string("Failed to prepare rowid lookup: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt.get(), 1, key.tenant.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(key.itemClass));
    sqlite3_bind_text(stmt.get(), 3, id.c_str(), -1, SQLITE_TRANSIENT);

    rc = stepWithRetry(stmt.get());
    if (rc == SQLITE_ROW) {
        return static_cast<sqlite3_int64>(sqlite3_column_int64(stmt.get(), 0));
    }
    if (rc == SQLITE_DONE) {
        return static_cast<sqlite3_int64>(-1);
    }
    return sqliteError(rc, std::string("Rowid lookup failed: ") + sqlite3_errmsg(db_));
}

Result<void> SqliteVecStore::upsert(const PartitionKey& key, const ItemId& id,
                                    const Embedding& embedding,
                                    const std::map<std::string, std::string>& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Error{ErrorCode::Unavailable, "Vector store not initialized"};
    }
    if (id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Item id must not be empty"};
    }
    if (!isValidEmbedding(embedding, config_.embeddingDim)) {
        return Error{ErrorCode::InvalidArgument,
                     "Embedding dimension " + std::to_string(embedding.size()) +
                         " does not match store dimension " +
                         std::to_string(config_.embeddingDim)};
    }
    if (isZeroVector(embedding)) {
        return Error{ErrorCode::InvalidArgument, "Embedding for " + id + " has zero magnitude"};
    }

    auto begin = executeSQL("BEGIN IMMEDIATE TRANSACTION");
    if (!begin) {
        return begin.error();
    }
    TransactionGuard guard(db_);

    auto existing = findRowid(key, id);
    if (!existing) {
        return existing.error();
    }

    const std::string vec_json = serializeEmbedding(embedding);
    const std::string meta_json = metadataToJson(metadata);
    sqlite3_int64 rowid = existing.value();

    auto run = [this](const char* sql, auto&& bind) -> Result<void> {
        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr);
        StmtPtr stmt(raw);
        if (rc != SQLITE_OK) {
            return sqliteError(rc, std::string("Failed to prepare statement: ") +
                                       sqlite3_errmsg(db_));
        }
        bind(stmt.get());
        rc = stepWithRetry(stmt.get());
        if (rc != SQLITE_DONE) {
            return sqliteError(rc, std::string("Statement failed: ") + sqlite3_errmsg(db_));
        }
        return Result<void>();
    };

    if (rowid >= 0) {
        spdlog::debug("Replacing {} in {}", id, key.name(config_.partitionPrefix));
        auto r = run("UPDATE item_metadata SET metadata = ?, "
                     "seq = (SELECT COALESCE(MAX(seq), 0) + 1 FROM item_metadata) "
                     "WHERE rowid = ?",
                     [&](sqlite3_stmt* s) {
                         sqlite3_bind_text(s, 1, meta_json.c_str(), -1, SQLITE_TRANSIENT);
                         sqlite3_bind_int64(s, 2, rowid);
                     });
        if (!r) {
            return r;
        }
        r = run("UPDATE item_embeddings SET embedding = ? WHERE rowid = ?",
                [&](sqlite3_stmt* s) {
                    sqlite3_bind_text(s, 1, vec_json.c_str(), -1, SQLITE_TRANSIENT);
                    sqlite3_bind_int64(s, 2, rowid);
                });
        if (!r) {
            return r;
        }
    } else {
        auto r = run("INSERT INTO item_metadata (tenant, item_class, item_id, metadata, seq) "
                     "VALUES (?, ?, ?, ?, (SELECT COALESCE(MAX(seq), 0) + 1 FROM item_metadata))",
                     [&](sqlite3_stmt* s) {
                         sqlite3_bind_text(s, 1, key.tenant.c_str(), -1, SQLITE_TRANSIENT);
                         sqlite3_bind_int(s, 2, static_cast<int>(key.itemClass));
                         sqlite3_bind_text(s, 3, id.c_str(), -1, SQLITE_TRANSIENT);
                         sqlite3_bind_text(s, 4, meta_json.c_str(), -1, SQLITE_TRANSIENT);
                     });
        if (!r) {
            return r;
        }
        rowid = sqlite3_last_insert_rowid(db_);
        r = run("INSERT INTO item_embeddings (rowid, embedding) VALUES (?, ?)",
                [&](sqlite3_stmt* s) {
                    sqlite3_bind_int64(s, 1, rowid);
                    sqlite3_bind_text(s, 2, vec_json.c_str(), -1, SQLITE_TRANSIENT);
                });
        if (!r) {
            return r;
        }
    }

    int rc = guard.commit();
    if (rc != SQLITE_OK) {
        return sqliteError(rc, std::string("Failed to commit upsert: ") + sqlite3_errmsg(db_));
    }
    return Result<void>();
}

Result<std::vector<SimilarityHit>>
SqliteVecStore::search(const PartitionKey& key, const Embedding& query, size_t limit,
                       const std::unordered_set<ItemId>& exclude_ids) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Error{ErrorCode::Unavailable, "Vector store not initialized"};
    }
    if (limit == 0) {
        return std::vector<SimilarityHit>{};
    }
    if (query.size() != config_.embeddingDim) {
        spdlog::warn("Query dimension {} does not match store dimension {} for {}; no matches",
                     query.size(), config_.embeddingDim, key.name(config_.partitionPrefix));
        return std::vector<SimilarityHit>{};
    }
    if (isZeroVector(query)) {
        spdlog::debug("Zero-magnitude query for {}; no matches", key.name(config_.partitionPrefix));
        return std::vector<SimilarityHit>{};
    }

    const std::string sql = R"(
        SELECT item_id, distance FROM (
            SELECT m.item_id, m.seq, vec_distance_cosine(e.embedding, ?) AS distance
            FROM item_embeddings e
            JOIN item_metadata m ON m.rowid = e.rowid
            WHERE m.tenant = ? AND m.item_class = ?
              AND m.item_id NOT IN (SELECT value FROM json_each(?))
        )
        WHERE distance IS NOT NULL
        ORDER BY distance ASC, seq ASC
        LIMIT ?
    )";

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    StmtPtr stmt(raw);
    if (rc != SQLITE_OK) {
        return sqliteError(rc, std::string("Failed to prepare search: ") + sqlite3_errmsg(db_));
    }

    const std::string query_json = serializeEmbedding(query);
    const std::string exclude_json =
        idsToJson(std::vector<ItemId>(exclude_ids.begin(), exclude_ids.end()));
    sqlite3_bind_text(stmt.get(), 1, query_json.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, key.tenant.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 3, static_cast<int>(key.itemClass));
    sqlite3_bind_text(stmt.get(), 4, exclude_json.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(limit));

    std::vector<SimilarityHit> hits;
    while ((rc = stepWithRetry(stmt.get())) == SQLITE_ROW) {
        const char* id = columnText(stmt.get(), 0);
        // vec_distance_cosine yields NULL for zero-magnitude rows
        if (!id || sqlite3_column_type(stmt.get(), 1) == SQLITE_NULL) {
            continue;
        }
        double distance = sqlite3_column_double(stmt.get(), 1);
        double similarity = std::clamp(similarityFromCosineDistance(distance), -1.0, 1.0);
        hits.push_back({id, similarity});
    }
    if (rc != SQLITE_DONE) {
        return sqliteError(rc, std::string("Search failed: ") + sqlite3_errmsg(db_));
    }

    spdlog::debug("Search in {} returned {} hits", key.name(config_.partitionPrefix), hits.size());
    return hits;
}

Result<std::vector<ItemRecord>> SqliteVecStore::readRecords(sqlite3_stmt* stmt) {
    std::vector<ItemRecord> out;
    int rc;
    while ((rc = stepWithRetry(stmt)) == SQLITE_ROW) {
        ItemRecord record;
        const char* id = columnText(stmt, 0);
        record.id = id ? id : "";

        const char* vec_json = columnText(stmt, 1);
        auto parsed = vec_json ? parseEmbedding(vec_json) : std::nullopt;
        if (parsed) {
            record.embedding = std::move(*parsed);
        } else {
            spdlog::warn("Stored embedding for {} could not be parsed; returning it without one",
                         record.id);
        }
        record.metadata = metadataFromJson(columnText(stmt, 2));
        record.sequence = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
        out.push_back(std::move(record));
    }
    if (rc != SQLITE_DONE) {
        return sqliteError(rc, std::string("Record read failed: ") + sqlite3_errmsg(db_));
    }
    return out;
}

Result<std::vector<ItemRecord>> SqliteVecStore::fetch(const PartitionKey& key,
                                                      const std::vector<ItemId>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Error{ErrorCode::Unavailable, "Vector store not initialized"};
    }
    if (ids.empty()) {
        return std::vector<ItemRecord>{};
    }

    const char* sql = R"(
        SELECT m.item_id, vec_to_json(e.embedding), m.metadata, m.seq
        FROM item_metadata m
        JOIN item_embeddings e ON e.rowid = m.rowid
        WHERE m.tenant = ? AND m.item_class = ?
          AND m.item_id IN (SELECT value FROM json_each(?))
    )";
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr);
    StmtPtr stmt(raw);
    if (rc != SQLITE_OK) {
        return sqliteError(rc, std::string("Failed to prepare fetch: ") + sqlite3_errmsg(db_));
    }
    const std::string ids_json = idsToJson(ids);
    sqlite3_bind_text(stmt.get(), 1, key.tenant.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(key.itemClass));
    sqlite3_bind_text(stmt.get(), 3, ids_json.c_str(), -1, SQLITE_TRANSIENT);

    auto rows = readRecords(stmt.get());
    if (!rows) {
        return rows.error();
    }

    // Preserve the caller's id order
    std::unordered_map<ItemId, ItemRecord> by_id;
    for (auto& record : rows.value()) {
        by_id.emplace(record.id, std::move(record));
    }
    std::vector<ItemRecord> out;
    out.reserve(by_id.size());
    for (const auto& id : ids) {
        auto it = by_id.find(id);
        if (it != by_id.end()) {
            out.push_back(std::move(it->second));
            by_id.erase(it);
        }
    }
    return out;
}

Result<std::vector<ItemRecord>> SqliteVecStore::recent(const PartitionKey& key, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Error{ErrorCode::Unavailable, "Vector store not initialized"};
    }
    if (limit == 0) {
        return std::vector<ItemRecord>{};
    }

    const char* sql = R"(
        SELECT m.item_id, vec_to_json(e.embedding), m.metadata, m.seq
        FROM item_metadata m
        JOIN item_embeddings e ON e.rowid = m.rowid
        WHERE m.tenant = ? AND m.item_class = ?
        ORDER BY m.seq DESC
        LIMIT ?
    )";
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr);
    StmtPtr stmt(raw);
    if (rc != SQLITE_OK) {
        return sqliteError(rc, std::string("Failed to prepare recent: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt.get(), 1, key.tenant.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(key.itemClass));
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(limit));

    return readRecords(stmt.get());
}

Result<size_t> SqliteVecStore::count(const PartitionKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Error{ErrorCode::Unavailable, "Vector store not initialized"};
    }

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(
        db_, "SELECT COUNT(*) FROM item_metadata WHERE tenant = ? AND item_class = ?", -1, &raw,
        nullptr);
    StmtPtr stmt(raw);
    if (rc != SQLITE_OK) {
        return sqliteError(rc, std::string("Failed to prepare count: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt.get(), 1, key.tenant.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(key.itemClass));

    rc = stepWithRetry(stmt.get());
    if (rc != SQLITE_ROW) {
        return sqliteError(rc, std::string("Count failed: ") + sqlite3_errmsg(db_));
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

Result<void> SqliteVecStore::remove(const PartitionKey& key, const ItemId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return Error{ErrorCode::Unavailable, "Vector store not initialized"};
    }

    auto begin = executeSQL("BEGIN IMMEDIATE TRANSACTION");
    if (!begin) {
        return begin.error();
    }
    TransactionGuard guard(db_);

    auto rowid = findRowid(key, id);
    if (!rowid) {
        return rowid.error();
    }
    if (rowid.value() < 0) {
        return Error{ErrorCode::NotFound, "No record " + id + " in " +
                                              key.name(config_.partitionPrefix)};
    }

    for (const char* sql : {"DELETE FROM item_embeddings WHERE rowid = ?",
                            "DELETE FROM item_metadata WHERE rowid = ?"}) {
        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr);
        StmtPtr stmt(raw);
        if (rc != SQLITE_OK) {
            return sqliteError(rc, std::string("Failed to prepare delete: ") + sqlite3_errmsg(db_));
        }
        sqlite3_bind_int64(stmt.get(), 1, rowid.value());
        rc = stepWithRetry(stmt.get());
        if (rc != SQLITE_DONE) {
            return sqliteError(rc, std::string("Delete failed: ") + sqlite3_errmsg(db_));
        }
    }

    int rc = guard.commit();
    if (rc != SQLITE_OK) {
        return sqliteError(rc, std::string("Failed to commit delete: ") + sqlite3_errmsg(db_));
    }
    return Result<void>();
}

} // namespace drape::vector
