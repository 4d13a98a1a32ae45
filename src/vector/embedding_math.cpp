#include <drape/vector/embedding_math.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>

namespace drape::vector {

double cosineSimilarity(const Embedding& a, const Embedding& b) noexcept {
    if (a.empty() || b.empty() || a.size() != b.size()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    double cos = dot_product / (norm_a * norm_b);
    if (!std::isfinite(cos)) {
        return 0.0;
    }
    return std::clamp(cos, -1.0, 1.0);
}

std::optional<Embedding> parseEmbedding(std::string_view raw) {
    if (raw.empty()) {
        return std::nullopt;
    }

    auto parsed = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array() || parsed.empty()) {
        return std::nullopt;
    }

    Embedding out;
    out.reserve(parsed.size());
    for (const auto& element : parsed) {
        if (!element.is_number()) {
            return std::nullopt;
        }
        auto value = element.get<double>();
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
        out.push_back(static_cast<float>(value));
    }
    return out;
}

std::string serializeEmbedding(const Embedding& embedding) {
    nlohmann::json arr = nlohmann::json::array();
    for (float v : embedding) {
        arr.push_back(v);
    }
    return arr.dump();
}

Embedding normalizeVector(const Embedding& vec) {
    double norm = 0.0;
    for (float val : vec) {
        norm += static_cast<double>(val) * static_cast<double>(val);
    }
    norm = std::sqrt(norm);

    if (norm == 0.0) {
        return vec;
    }

    Embedding normalized;
    normalized.reserve(vec.size());
    for (float val : vec) {
        normalized.push_back(static_cast<float>(static_cast<double>(val) / norm));
    }
    return normalized;
}

bool isValidEmbedding(const Embedding& embedding, size_t expected_dim) {
    if (embedding.size() != expected_dim) {
        return false;
    }
    return std::all_of(embedding.begin(), embedding.end(),
                       [](float v) { return std::isfinite(v); });
}

bool isZeroVector(const Embedding& embedding) {
    return std::all_of(embedding.begin(), embedding.end(), [](float v) { return v == 0.0f; });
}

double similarityFromL2Distance(double distance) {
    return std::max(0.0, 1.0 - (distance * distance) / 4.0);
}

} // namespace drape::vector
