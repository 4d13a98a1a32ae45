#pragma once

#include <drape/core/types.h>
#include <drape/vector/embedding_math.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace drape::search {

/**
 * @brief Retrieved item awaiting diversification
 *
 * A missing embedding marks a record whose stored vector could not be parsed.
 */
struct Candidate {
    ItemId id;
    std::optional<vector::Embedding> embedding;
    double relevance = 0.0; // similarity to the query, already floored by the caller
    std::map<std::string, std::string> metadata;
};

struct MmrConfig {
    size_t k = 20;       // target selection size
    double lambda = 0.7; // 1.0 = pure relevance, 0.0 = pure diversity
};

/**
 * @brief Greedy Maximal Marginal Relevance selection
 *
 * Each round picks the candidate maximizing
 *   lambda * relevance - (1 - lambda) * penalty
 * where penalty is the larger of the highest similarity to an already selected item and
 * the highest similarity to any recent embedding. Ties go to the earlier candidate.
 *
 * Candidates without an embedding are skipped. A candidate whose relevance is not finite
 * is scored by its cosine similarity to @p query instead.
 *
 * @return Selected candidates in selection order (first = most preferred)
 */
std::vector<Candidate> selectDiverse(const std::vector<Candidate>& candidates,
                                     const vector::Embedding& query,
                                     const std::vector<vector::Embedding>& recent,
                                     const MmrConfig& config = {});

} // namespace drape::search
