#include <drape/search/mmr_selector.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace drape::search {

std::vector<Candidate> selectDiverse(const std::vector<Candidate>& candidates,
                                     const vector::Embedding& query,
                                     const std::vector<vector::Embedding>& recent,
                                     const MmrConfig& config) {
    std::vector<Candidate> selected;
    if (candidates.empty() || config.k == 0) {
        return selected;
    }

    const double lambda = std::clamp(config.lambda, 0.0, 1.0);

    // Indices of usable candidates, in original order
    std::vector<size_t> pool;
    pool.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& emb = candidates[i].embedding;
        if (!emb || emb->empty()) {
            spdlog::debug("MMR skipping {}: no usable embedding", candidates[i].id);
            continue;
        }
        pool.push_back(i);
    }

    std::vector<double> relevance(pool.size());
    std::vector<double> recentPenalty(pool.size(), 0.0);
    std::vector<double> selectedPenalty(pool.size(), 0.0);
    std::vector<bool> used(pool.size(), false);

    for (size_t p = 0; p < pool.size(); ++p) {
        const auto& c = candidates[pool[p]];
        relevance[p] = std::isfinite(c.relevance) ? c.relevance
                                                  : vector::cosineSimilarity(query, *c.embedding);
        for (const auto& r : recent) {
            recentPenalty[p] = std::max(recentPenalty[p], vector::cosineSimilarity(*c.embedding, r));
        }
    }

    const size_t target = std::min(config.k, pool.size());
    selected.reserve(target);

    while (selected.size() < target) {
        double bestScore = -std::numeric_limits<double>::infinity();
        size_t best = pool.size();

        for (size_t p = 0; p < pool.size(); ++p) {
            if (used[p]) {
                continue;
            }
            double penalty = std::max(selectedPenalty[p], recentPenalty[p]);
            double score = lambda * relevance[p] - (1.0 - lambda) * penalty;
            if (best == pool.size() || score > bestScore) {
                bestScore = score;
                best = p;
            }
        }

        if (best == pool.size()) {
            break;
        }

        used[best] = true;
        const auto& chosen = candidates[pool[best]];
        selected.push_back(chosen);

        for (size_t p = 0; p < pool.size(); ++p) {
            if (used[p]) {
                continue;
            }
            double sim = vector::cosineSimilarity(*candidates[pool[p]].embedding, *chosen.embedding);
            selectedPenalty[p] = std::max(selectedPenalty[p], sim);
        }
    }

    spdlog::debug("MMR selected {} of {} candidates (k={}, lambda={:.2f}, recent={})",
                  selected.size(), candidates.size(), config.k, lambda, recent.size());
    return selected;
}

} // namespace drape::search
