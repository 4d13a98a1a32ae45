#pragma once

#include <drape/core/types.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace drape::search {

/**
 * @brief One finalized recommendation: the item groups it handed out
 */
struct RecentOutputRecord {
    TenantId tenant;
    std::vector<std::vector<ItemId>> groups; // one group per produced choice
    TimePoint createdAt = std::chrono::system_clock::now();
    std::string query;
};

/**
 * @brief Append-only log of finalized recommendations, partitioned by tenant
 */
class IRecommendationHistory {
public:
    virtual ~IRecommendationHistory() = default;

    virtual Result<void> append(RecentOutputRecord record) = 0;

    /**
     * @brief Up to `limit` most recent records for the tenant, newest first
     */
    virtual Result<std::vector<RecentOutputRecord>> recent(const TenantId& tenant,
                                                           size_t limit) const = 0;
};

class InMemoryRecommendationHistory : public IRecommendationHistory {
public:
    Result<void> append(RecentOutputRecord record) override;
    Result<std::vector<RecentOutputRecord>> recent(const TenantId& tenant,
                                                   size_t limit) const override;

    size_t size(const TenantId& tenant) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<TenantId, std::vector<RecentOutputRecord>> records_;
};

/**
 * @brief Union of item ids across records, first-seen order, at most max_ids entries
 */
std::vector<ItemId> collectUsedIds(const std::vector<RecentOutputRecord>& records,
                                   size_t max_ids);

/**
 * @brief Derives the exclusion set from a tenant's latest outputs
 */
class CooldownTracker {
public:
    explicit CooldownTracker(std::shared_ptr<const IRecommendationHistory> history);

    /**
     * @brief Item ids used by the `lookback` most recent records
     *
     * Newest record first, groups and members in stored order, duplicates dropped,
     * truncated to `max_ids`. A history read failure yields an empty list.
     */
    std::vector<ItemId> recentlyUsedIds(const TenantId& tenant, size_t lookback,
                                        size_t max_ids) const;

private:
    std::shared_ptr<const IRecommendationHistory> history_;
};

} // namespace drape::search
