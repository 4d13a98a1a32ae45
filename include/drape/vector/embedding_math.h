#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drape::vector {

using Embedding = std::vector<float>;

/**
 * @brief Cosine similarity between two embeddings
 *
 * Returns 0.0 when either vector is empty, has zero magnitude, or the lengths
 * differ. Otherwise the result lies in [-1, 1].
 */
double cosineSimilarity(const Embedding& a, const Embedding& b) noexcept;

/**
 * @brief Parse the JSON array text form of an embedding
 *
 * Returns std::nullopt for malformed input (not JSON, not an array, empty,
 * non-numeric or non-finite elements) so batch callers can skip the record.
 */
std::optional<Embedding> parseEmbedding(std::string_view raw);

/**
 * @brief Serialize an embedding to its JSON array text form
 */
std::string serializeEmbedding(const Embedding& embedding);

/**
 * @brief Normalize a vector to unit length (zero vectors are returned unchanged)
 */
Embedding normalizeVector(const Embedding& vec);

/**
 * @brief True when the embedding has the expected dimension and only finite values
 */
bool isValidEmbedding(const Embedding& embedding, size_t expected_dim);

// Zero-magnitude vectors have no direction; cosine against them is undefined
bool isZeroVector(const Embedding& embedding);

// Cosine distance (1 - cos) as reported by vec_distance_cosine
inline double similarityFromCosineDistance(double distance) {
    return 1.0 - distance;
}

// L2 distance between unit vectors: d^2 = 2 - 2cos
double similarityFromL2Distance(double distance);

} // namespace drape::vector
