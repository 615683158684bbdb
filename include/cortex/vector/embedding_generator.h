#pragma once

#include <cortex/core/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cortex::vector {

/**
 * Configuration for embedding generation
 */
struct EmbeddingConfig {
    size_t embedding_dim = 384;
    std::string model_name = "all-MiniLM-L6-v2";
    std::chrono::milliseconds timeout{350}; // Bound on generateEmbedding(text, timeout) waits
    size_t num_threads = 2;                 // Pool threads running backend calls
};

/**
 * Statistics for embedding generation
 * Using atomic counters for lock-free access
 */
struct GenerationStats {
    std::atomic<size_t> total_texts_processed{0};
    std::atomic<size_t> failures{0};
    std::atomic<size_t> timeouts{0};
    std::atomic<std::chrono::microseconds::rep> total_inference_time{0};

    GenerationStats() = default;

    GenerationStats(const GenerationStats& other)
        : total_texts_processed(other.total_texts_processed.load()),
          failures(other.failures.load()), timeouts(other.timeouts.load()),
          total_inference_time(other.total_inference_time.load()) {}

    GenerationStats& operator=(const GenerationStats& other) {
        if (this != &other) {
            total_texts_processed.store(other.total_texts_processed.load());
            failures.store(other.failures.load());
            timeouts.store(other.timeouts.load());
            total_inference_time.store(other.total_inference_time.load());
        }
        return *this;
    }
};

/**
 * Abstract interface for embedding backends: embed(text) -> vector[D].
 * Implementations must be deterministic and safe to call from several threads.
 */
class IEmbeddingBackend {
public:
    virtual ~IEmbeddingBackend() = default;

    virtual Result<std::vector<float>> embed(const std::string& text) = 0;
    virtual size_t getEmbeddingDimension() const = 0;
    virtual std::string getBackendName() const = 0;
};

/**
 * Deterministic feature-hashing backend.
 *
 * Lower-cased word tokens and character trigrams are hashed with FNV-1a into D signed buckets
 * and the result is L2-normalized. Identical text always yields bit-identical vectors, texts
 * sharing vocabulary land closer under cosine, and the empty text maps to the zero vector.
 */
class HashingEmbeddingBackend : public IEmbeddingBackend {
public:
    explicit HashingEmbeddingBackend(size_t dimension = 384);

    Result<std::vector<float>> embed(const std::string& text) override;
    size_t getEmbeddingDimension() const override { return dimension_; }
    std::string getBackendName() const override { return "hashing"; }

private:
    size_t dimension_;
};

/**
 * Main embedding generator class.
 *
 * Wraps a backend, validates its output and converts every failure into
 * ErrorCode::EmbeddingUnavailable. Calls with a timeout run on an internal thread pool; a call
 * that misses its deadline is abandoned rather than joined.
 */
class EmbeddingGenerator {
public:
    EmbeddingGenerator(std::shared_ptr<IEmbeddingBackend> backend,
                       const EmbeddingConfig& config = {});
    ~EmbeddingGenerator();

    EmbeddingGenerator(const EmbeddingGenerator&) = delete;
    EmbeddingGenerator& operator=(const EmbeddingGenerator&) = delete;

    // Synchronous, unbounded call into the backend
    Result<std::vector<float>> generateEmbedding(const std::string& text);

    // Bounded call; ErrorCode::EmbeddingUnavailable once timeout elapses
    Result<std::vector<float>> generateEmbedding(const std::string& text,
                                                 std::chrono::milliseconds timeout);

    // Bounded call using config.timeout
    Result<std::vector<float>> generateEmbeddingWithTimeout(const std::string& text);

    size_t getEmbeddingDimension() const;
    const EmbeddingConfig& getConfig() const;
    std::string getBackendName() const;

    GenerationStats getStats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * Factory for the configured backend name ("hashing")
 */
Result<std::shared_ptr<IEmbeddingBackend>> createEmbeddingBackend(const std::string& name,
                                                                  size_t dimension);

namespace embedding_utils {
/**
 * 64-bit FNV-1a, stable across platforms and runs
 */
uint64_t fnv1a64(std::string_view data);
} // namespace embedding_utils

} // namespace cortex::vector
