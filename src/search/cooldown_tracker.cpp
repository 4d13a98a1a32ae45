#include <drape/search/cooldown_tracker.h>

#include <spdlog/spdlog.h>

#include <mutex>
#include <unordered_set>

namespace drape::search {

Result<void> InMemoryRecommendationHistory::append(RecentOutputRecord record) {
    if (record.tenant.empty()) {
        return Error{ErrorCode::InvalidArgument, "History record needs a tenant"};
    }
    std::unique_lock lock(mutex_);
    records_[record.tenant].push_back(std::move(record));
    return Result<void>();
}

Result<std::vector<RecentOutputRecord>>
InMemoryRecommendationHistory::recent(const TenantId& tenant, size_t limit) const {
    std::vector<RecentOutputRecord> out;
    std::shared_lock lock(mutex_);
    auto it = records_.find(tenant);
    if (it == records_.end()) {
        return out;
    }
    const auto& log = it->second;
    for (auto r = log.rbegin(); r != log.rend() && out.size() < limit; ++r) {
        out.push_back(*r);
    }
    return out;
}

size_t InMemoryRecommendationHistory::size(const TenantId& tenant) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(tenant);
    return it == records_.end() ? 0 : it->second.size();
}

std::vector<ItemId> collectUsedIds(const std::vector<RecentOutputRecord>& records,
                                   size_t max_ids) {
    std::vector<ItemId> ids;
    if (max_ids == 0) {
        return ids;
    }
    std::unordered_set<ItemId> seen;
    for (const auto& record : records) {
        for (const auto& group : record.groups) {
            for (const auto& id : group) {
                if (!seen.insert(id).second) {
                    continue;
                }
                ids.push_back(id);
                if (ids.size() >= max_ids) {
                    return ids;
                }
            }
        }
    }
    return ids;
}

CooldownTracker::CooldownTracker(std::shared_ptr<const IRecommendationHistory> history)
    : history_(std::move(history)) {}

std::vector<ItemId> CooldownTracker::recentlyUsedIds(const TenantId& tenant, size_t lookback,
                                                     size_t max_ids) const {
    if (!history_ || lookback == 0 || max_ids == 0) {
        return {};
    }

    auto records = history_->recent(tenant, lookback);
    if (!records) {
        spdlog::warn("Cooldown lookup for tenant {} failed: {}; no items excluded", tenant,
                     records.error().message);
        return {};
    }

    auto ids = collectUsedIds(records.value(), max_ids);
    spdlog::debug("Cooldown for tenant {}: {} ids from {} records", tenant, ids.size(),
                  records.value().size());
    return ids;
}

} // namespace drape::search
