#include <drape/vector/embedding_math.h>

#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "common/test_helpers.h"

using namespace drape::vector;
using drape::tests::axis;
using drape::tests::planar;

TEST(EmbeddingMathTest, CosineOfIdenticalVectorsIsOne) {
    Embedding v{0.3f, -1.2f, 4.0f, 0.5f};
    EXPECT_NEAR(cosineSimilarity(v, v), 1.0, 1e-9);
}

TEST(EmbeddingMathTest, CosineOfOrthogonalAndOppositeVectors) {
    EXPECT_NEAR(cosineSimilarity(axis(0), axis(1)), 0.0, 1e-9);
    Embedding a{1.0f, 2.0f, 3.0f};
    Embedding b{-1.0f, -2.0f, -3.0f};
    EXPECT_NEAR(cosineSimilarity(a, b), -1.0, 1e-9);
}

TEST(EmbeddingMathTest, CosineIsScaleInvariant) {
    Embedding a{1.0f, 2.0f, 2.0f};
    Embedding b{10.0f, 20.0f, 20.0f};
    EXPECT_NEAR(cosineSimilarity(a, b), 1.0, 1e-9);
    EXPECT_NEAR(cosineSimilarity(planar(0), planar(60)), 0.5, 1e-6);
}

TEST(EmbeddingMathTest, DegenerateInputsYieldZero) {
    Embedding empty;
    Embedding zero(4, 0.0f);
    Embedding v{1.0f, 0.0f, 0.0f, 0.0f};
    Embedding shorter{1.0f, 0.0f};

    EXPECT_EQ(cosineSimilarity(empty, v), 0.0);
    EXPECT_EQ(cosineSimilarity(v, empty), 0.0);
    EXPECT_EQ(cosineSimilarity(zero, v), 0.0);
    EXPECT_EQ(cosineSimilarity(v, shorter), 0.0);
    EXPECT_EQ(cosineSimilarity(shorter, v), 0.0);
}

TEST(EmbeddingMathTest, CosineStaysWithinBoundsForRandomVectors) {
    std::mt19937 gen(42);
    std::normal_distribution<float> dist(0.0f, 3.0f);
    for (int i = 0; i < 200; ++i) {
        Embedding a(16), b(16);
        for (size_t j = 0; j < 16; ++j) {
            a[j] = dist(gen);
            b[j] = dist(gen);
        }
        double cos = cosineSimilarity(a, b);
        EXPECT_GE(cos, -1.0);
        EXPECT_LE(cos, 1.0);
        EXPECT_DOUBLE_EQ(cos, cosineSimilarity(b, a));
    }
}

TEST(EmbeddingMathTest, ParseAcceptsJsonArrays) {
    auto parsed = parseEmbedding("[0.5, -1, 2.25, 0]");
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), 4u);
    EXPECT_FLOAT_EQ((*parsed)[0], 0.5f);
    EXPECT_FLOAT_EQ((*parsed)[1], -1.0f);
    EXPECT_FLOAT_EQ((*parsed)[2], 2.25f);
    EXPECT_FLOAT_EQ((*parsed)[3], 0.0f);
}

TEST(EmbeddingMathTest, ParseRejectsMalformedInput) {
    EXPECT_FALSE(parseEmbedding("").has_value());
    EXPECT_FALSE(parseEmbedding("not json").has_value());
    EXPECT_FALSE(parseEmbedding("[1, 2,").has_value());
    EXPECT_FALSE(parseEmbedding("{\"a\": 1}").has_value());
    EXPECT_FALSE(parseEmbedding("[]").has_value());
    EXPECT_FALSE(parseEmbedding("[1, \"two\", 3]").has_value());
    EXPECT_FALSE(parseEmbedding("[1, null]").has_value());
    EXPECT_FALSE(parseEmbedding("[[1, 2]]").has_value());
    EXPECT_FALSE(parseEmbedding("42").has_value());
}

TEST(EmbeddingMathTest, SerializedFormParsesBack) {
    Embedding v{0.125f, -3.5f, 1e-3f};
    auto parsed = parseEmbedding(serializeEmbedding(v));
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->size(), v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        EXPECT_FLOAT_EQ((*parsed)[i], v[i]);
    }
}

TEST(EmbeddingMathTest, NormalizeProducesUnitLength) {
    auto n = normalizeVector({3.0f, 4.0f});
    ASSERT_EQ(n.size(), 2u);
    EXPECT_NEAR(n[0], 0.6f, 1e-6);
    EXPECT_NEAR(n[1], 0.8f, 1e-6);

    Embedding zero(3, 0.0f);
    EXPECT_EQ(normalizeVector(zero), zero);
}

TEST(EmbeddingMathTest, ValidEmbeddingChecksDimensionAndFiniteness) {
    EXPECT_TRUE(isValidEmbedding(axis(2), 4));
    EXPECT_FALSE(isValidEmbedding(axis(2), 8));
    Embedding bad{1.0f, std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f};
    EXPECT_FALSE(isValidEmbedding(bad, 4));
    Embedding inf{1.0f, std::numeric_limits<float>::infinity(), 0.0f, 0.0f};
    EXPECT_FALSE(isValidEmbedding(inf, 4));
}

TEST(EmbeddingMathTest, ZeroVectorDetection) {
    EXPECT_TRUE(isZeroVector(Embedding(4, 0.0f)));
    EXPECT_TRUE(isZeroVector(Embedding{}));
    EXPECT_FALSE(isZeroVector(axis(3)));
    EXPECT_FALSE(isZeroVector(Embedding{0.0f, -1e-6f, 0.0f, 0.0f}));
}

TEST(EmbeddingMathTest, DistanceConversions) {
    EXPECT_DOUBLE_EQ(similarityFromCosineDistance(0.0), 1.0);
    EXPECT_DOUBLE_EQ(similarityFromCosineDistance(0.25), 0.75);
    EXPECT_DOUBLE_EQ(similarityFromCosineDistance(2.0), -1.0);

    EXPECT_DOUBLE_EQ(similarityFromL2Distance(0.0), 1.0);
    // Orthogonal unit vectors are sqrt(2) apart
    EXPECT_NEAR(similarityFromL2Distance(std::sqrt(2.0)), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(similarityFromL2Distance(2.0), 0.0);
    EXPECT_DOUBLE_EQ(similarityFromL2Distance(3.0), 0.0);
}
