#pragma once

#include <drape/core/types.h>
#include <drape/search/hybrid_ranker.h>
#include <drape/search/mmr_selector.h>
#include <drape/vector/similarity_store.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace drape::config {

struct RetrievalConfig {
    size_t searchLimit = 40;    // raw hits requested from the store
    double minSimilarity = 0.3; // hits below this floor are dropped
    std::chrono::milliseconds searchTimeout{2000}; // 0 waits without a deadline
    size_t recentRecommendations = 5; // past recommendation embeddings fed to MMR
    size_t workerThreads = 2;
};

struct CooldownConfig {
    size_t lookback = 3; // most recent history records consulted
    size_t maxIds = 15;  // hard cap on cooled-down ids
};

/**
 * @brief Complete engine configuration
 *
 * Built from defaults, then config.toml, then DRAPE_* environment variables.
 */
struct EngineConfig {
    vector::StoreConfig store;
    RetrievalConfig retrieval;
    search::MmrConfig mmr;
    search::HybridRankerConfig ranking;
    CooldownConfig cooldown;
    std::string logLevel = "info";

    /**
     * @brief Reject inconsistent values
     *
     * @return InvalidArgument naming the first offending key
     */
    Result<void> validate() const;
};

/**
 * @brief Apply [store], [retrieval], [mmr], [ranking], [cooldown] and [logging] keys
 *
 * Unparsable numeric values are ignored with a warning.
 */
void applyConfigValues(EngineConfig& config, const std::map<std::string, std::string>& values);

/**
 * @brief Apply DRAPE_VECTOR_STORE, DRAPE_DB_PATH, DRAPE_EMBEDDING_DIM,
 * DRAPE_MIN_SIMILARITY, DRAPE_MMR_LAMBDA and DRAPE_LOG_LEVEL
 */
void applyEnvOverrides(EngineConfig& config);

/**
 * @brief Load and validate the engine configuration
 *
 * @param path Explicit file; when empty DRAPE_CONFIG, then the XDG location, is used.
 * A missing file is not an error, defaults apply.
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path = {});

// Set the spdlog level from a name ("trace".."off"); unknown names leave it unchanged
void applyLogLevel(const std::string& level);

} // namespace drape::config
