#include <cortex/vector/embedding_generator.h>
#include <cortex/vector/vector_utils.h>

#include <chrono>
#include <cmath>
#include <memory>
#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cortex;
using namespace cortex::vector;
using namespace std::chrono_literals;

TEST(HashingEmbeddingBackendTest, DeterministicAndFixedDimension) {
    HashingEmbeddingBackend backend(64);
    auto first = backend.embed("Borrow checker rules in Rust");
    auto second = backend.embed("Borrow checker rules in Rust");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value().size(), 64u);
    // Bit-for-bit identical
    EXPECT_EQ(first.value(), second.value());
    EXPECT_NEAR(utils::magnitude(first.value()), 1.0, 1e-5);
}

TEST(HashingEmbeddingBackendTest, SharedVocabularyIsCloser) {
    HashingEmbeddingBackend backend(256);
    auto query = backend.embed("rust ownership rules").value();
    auto related = backend.embed("ownership and borrowing rules in rust").value();
    auto unrelated = backend.embed("vue router navigation guards").value();

    EXPECT_GT(utils::normalizedCosine(query, related), utils::normalizedCosine(query, unrelated));
}

TEST(HashingEmbeddingBackendTest, EmptyTextIsZeroVector) {
    HashingEmbeddingBackend backend(16);
    auto empty = backend.embed("");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty.value(), std::vector<float>(16, 0.0f));

    HashingEmbeddingBackend broken(0);
    EXPECT_FALSE(broken.embed("text"));
}

TEST(EmbeddingGeneratorTest, ReturnsBackendVectors) {
    auto backend = std::make_shared<tests::StubEmbeddingBackend>(4);
    backend->set("hello", {0.0f, 1.0f, 0.0f, 0.0f});

    EmbeddingConfig config;
    config.embedding_dim = 4;
    EmbeddingGenerator generator(backend, config);

    auto embedding = generator.generateEmbedding("hello");
    ASSERT_TRUE(embedding);
    EXPECT_EQ(embedding.value(), (std::vector<float>{0.0f, 1.0f, 0.0f, 0.0f}));

    auto bounded = generator.generateEmbeddingWithTimeout("hello");
    ASSERT_TRUE(bounded);
    EXPECT_EQ(bounded.value(), embedding.value());
    EXPECT_EQ(generator.getStats().total_texts_processed.load(), 2u);
    EXPECT_EQ(generator.getBackendName(), "stub");
}

TEST(EmbeddingGeneratorTest, RejectsWrongDimensionOrNonFiniteOutput) {
    auto backend = std::make_shared<tests::StubEmbeddingBackend>(4);
    backend->set("short", {1.0f, 0.0f});
    backend->set("nan", {1.0f, 0.0f, 0.0f, std::nanf("")});

    EmbeddingConfig config;
    config.embedding_dim = 4;
    EmbeddingGenerator generator(backend, config);

    auto shortResult = generator.generateEmbedding("short");
    ASSERT_FALSE(shortResult);
    EXPECT_EQ(shortResult.error().code, ErrorCode::EmbeddingUnavailable);

    auto nanResult = generator.generateEmbedding("nan");
    ASSERT_FALSE(nanResult);
    EXPECT_EQ(nanResult.error().code, ErrorCode::EmbeddingUnavailable);
    EXPECT_EQ(generator.getStats().failures.load(), 2u);
}

TEST(EmbeddingGeneratorTest, BackendFailureBecomesEmbeddingUnavailable) {
    EmbeddingConfig config;
    config.embedding_dim = 4;
    EmbeddingGenerator generator(std::make_shared<tests::FailingEmbeddingBackend>(4), config);

    auto result = generator.generateEmbedding("anything");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::EmbeddingUnavailable);

    EmbeddingGenerator none(nullptr, config);
    auto missing = none.generateEmbeddingWithTimeout("anything");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::EmbeddingUnavailable);
}

TEST(EmbeddingGeneratorTest, TimeoutDoesNotWaitForSlowBackend) {
    EmbeddingConfig config;
    config.embedding_dim = 4;
    EmbeddingGenerator generator(std::make_shared<tests::SlowEmbeddingBackend>(300ms, 4), config);

    const auto start = std::chrono::steady_clock::now();
    auto result = generator.generateEmbedding("slow text", 20ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::EmbeddingUnavailable);
    EXPECT_LT(elapsed, 250ms);
    EXPECT_EQ(generator.getStats().timeouts.load(), 1u);
}

TEST(EmbeddingGeneratorTest, FactoryKnowsHashingOnly) {
    auto hashing = createEmbeddingBackend("hashing", 32);
    ASSERT_TRUE(hashing);
    EXPECT_EQ(hashing.value()->getEmbeddingDimension(), 32u);

    auto unknown = createEmbeddingBackend("onnx", 32);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotSupported);
}
