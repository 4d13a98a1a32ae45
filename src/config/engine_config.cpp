#include <drape/config/config_helpers.h>
#include <drape/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace drape::config {

namespace {

void setSize(const std::map<std::string, std::string>& values, const std::string& key,
             size_t& target) {
    auto it = values.find(key);
    if (it == values.end()) {
        return;
    }
    if (auto parsed = parse_size(it->second)) {
        target = *parsed;
    } else {
        spdlog::warn("Ignoring invalid value for {}: '{}'", key, it->second);
    }
}

void setDouble(const std::map<std::string, std::string>& values, const std::string& key,
               double& target) {
    auto it = values.find(key);
    if (it == values.end()) {
        return;
    }
    if (auto parsed = parse_double(it->second)) {
        target = *parsed;
    } else {
        spdlog::warn("Ignoring invalid value for {}: '{}'", key, it->second);
    }
}

void setString(const std::map<std::string, std::string>& values, const std::string& key,
               std::string& target) {
    auto it = values.find(key);
    if (it != values.end() && !it->second.empty()) {
        target = it->second;
    }
}

const char* getEnv(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

Result<void> EngineConfig::validate() const {
    if (store.embeddingDim == 0) {
        return Error{ErrorCode::InvalidArgument, "store.embedding_dim must be positive"};
    }
    if (mmr.k == 0) {
        return Error{ErrorCode::InvalidArgument, "mmr.k must be positive"};
    }
    if (retrieval.searchLimit < mmr.k) {
        return Error{ErrorCode::InvalidArgument,
                     "retrieval.search_limit must be at least mmr.k (" +
                         std::to_string(retrieval.searchLimit) + " < " + std::to_string(mmr.k) +
                         ")"};
    }
    if (mmr.lambda < 0.0 || mmr.lambda > 1.0) {
        return Error{ErrorCode::InvalidArgument, "mmr.lambda must be within [0, 1]"};
    }
    if (retrieval.minSimilarity < -1.0 || retrieval.minSimilarity > 1.0) {
        return Error{ErrorCode::InvalidArgument, "retrieval.min_similarity must be within [-1, 1]"};
    }
    if (ranking.relevanceWeight < 0.0 || ranking.confidenceWeight < 0.0) {
        return Error{ErrorCode::InvalidArgument, "ranking weights must be non-negative"};
    }
    if (retrieval.workerThreads == 0) {
        return Error{ErrorCode::InvalidArgument, "retrieval.worker_threads must be positive"};
    }
    return Result<void>();
}

void applyConfigValues(EngineConfig& config, const std::map<std::string, std::string>& values) {
    setString(values, "store.type", config.store.type);
    if (auto it = values.find("store.path"); it != values.end() && !it->second.empty()) {
        config.store.databasePath = expand_tilde(it->second).string();
    }
    setSize(values, "store.embedding_dim", config.store.embeddingDim);
    setString(values, "store.partition_prefix", config.store.partitionPrefix);

    setSize(values, "retrieval.search_limit", config.retrieval.searchLimit);
    setDouble(values, "retrieval.min_similarity", config.retrieval.minSimilarity);
    size_t timeoutMs = static_cast<size_t>(config.retrieval.searchTimeout.count());
    setSize(values, "retrieval.search_timeout_ms", timeoutMs);
    config.retrieval.searchTimeout = std::chrono::milliseconds(timeoutMs);
    setSize(values, "retrieval.recent_recommendations", config.retrieval.recentRecommendations);
    setSize(values, "retrieval.worker_threads", config.retrieval.workerThreads);

    setSize(values, "mmr.k", config.mmr.k);
    setDouble(values, "mmr.lambda", config.mmr.lambda);

    setDouble(values, "ranking.relevance_weight", config.ranking.relevanceWeight);
    setDouble(values, "ranking.confidence_weight", config.ranking.confidenceWeight);
    setDouble(values, "ranking.neutral_relevance", config.ranking.neutralRelevance);
    setDouble(values, "ranking.neutral_confidence", config.ranking.neutralConfidence);

    setSize(values, "cooldown.lookback", config.cooldown.lookback);
    setSize(values, "cooldown.max_ids", config.cooldown.maxIds);

    setString(values, "logging.level", config.logLevel);
}

void applyEnvOverrides(EngineConfig& config) {
    std::map<std::string, std::string> env;
    if (const char* v = getEnv("DRAPE_VECTOR_STORE")) {
        env["store.type"] = v;
    }
    if (const char* v = getEnv("DRAPE_DB_PATH")) {
        env["store.path"] = v;
    }
    if (const char* v = getEnv("DRAPE_EMBEDDING_DIM")) {
        env["store.embedding_dim"] = v;
    }
    if (const char* v = getEnv("DRAPE_MIN_SIMILARITY")) {
        env["retrieval.min_similarity"] = v;
    }
    if (const char* v = getEnv("DRAPE_MMR_LAMBDA")) {
        env["mmr.lambda"] = v;
    }
    if (const char* v = getEnv("DRAPE_LOG_LEVEL")) {
        env["logging.level"] = v;
    }
    if (!env.empty()) {
        spdlog::debug("Applying {} environment override(s)", env.size());
        applyConfigValues(config, env);
    }
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    EngineConfig config;

    std::filesystem::path configPath = path;
    if (configPath.empty()) {
        const char* envPath = getEnv("DRAPE_CONFIG");
        configPath = get_config_path(envPath ? envPath : "");
    }

    if (auto values = parse_config_file(configPath)) {
        spdlog::debug("Loaded {} config keys from {}", values->size(), configPath.string());
        applyConfigValues(config, *values);
    } else if (!path.empty()) {
        spdlog::warn("Config file {} not readable; using defaults", configPath.string());
    } else {
        spdlog::debug("No config file at {}; using defaults", configPath.string());
    }

    applyEnvOverrides(config);

    if (auto valid = config.validate(); !valid) {
        spdlog::error("Invalid engine configuration: {}", valid.error().message);
        return valid.error();
    }
    return config;
}

void applyLogLevel(const std::string& level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::warn("Unknown log level '{}'; keeping current level", level);
    }
}

} // namespace drape::config
