#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cortex/vector/embedding_generator.h>
#include <cortex/vector/vector_utils.h>

#include <algorithm>
#include <cctype>
#include <future>

namespace cortex::vector {

namespace embedding_utils {

uint64_t fnv1a64(std::string_view data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace embedding_utils

// ============================================================================
// HashingEmbeddingBackend
// ============================================================================

namespace {

std::vector<std::string> wordTokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

void addFeature(std::vector<float>& out, std::string_view feature, float weight) {
    const uint64_t h = embedding_utils::fnv1a64(feature);
    const size_t bucket = static_cast<size_t>(h % out.size());
    // Top bit picks the sign so unrelated features cancel out on average
    const float sign = (h >> 63) ? -1.0f : 1.0f;
    out[bucket] += sign * weight;
}

} // namespace

HashingEmbeddingBackend::HashingEmbeddingBackend(size_t dimension) : dimension_(dimension) {}

Result<std::vector<float>> HashingEmbeddingBackend::embed(const std::string& text) {
    if (dimension_ == 0) {
        return Error{ErrorCode::InvalidState, "Hashing backend configured with dimension 0"};
    }

    std::vector<float> embedding(dimension_, 0.0f);
    for (const auto& token : wordTokens(text)) {
        addFeature(embedding, "w:" + token, 1.0f);
        if (token.size() >= 3) {
            const std::string padded = "^" + token + "$";
            for (size_t i = 0; i + 3 <= padded.size(); ++i) {
                addFeature(embedding, "t:" + padded.substr(i, 3), 0.5f);
            }
        }
    }

    return utils::normalizeVector(embedding);
}

Result<std::shared_ptr<IEmbeddingBackend>> createEmbeddingBackend(const std::string& name,
                                                                  size_t dimension) {
    if (name == "hashing") {
        return std::shared_ptr<IEmbeddingBackend>(
            std::make_shared<HashingEmbeddingBackend>(dimension));
    }
    return Error{ErrorCode::NotSupported, "Unknown embedding backend '" + name + "'"};
}

// ============================================================================
// EmbeddingGenerator
// ============================================================================

namespace {

Result<std::vector<float>> runBackend(IEmbeddingBackend& backend, const std::string& text,
                                      size_t expected_dim, GenerationStats& stats) {
    const auto start = std::chrono::steady_clock::now();
    auto record = [&]() {
        stats.total_inference_time.fetch_add(
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start)
                .count());
    };

    try {
        auto result = backend.embed(text);
        record();
        if (!result) {
            stats.failures.fetch_add(1);
            return Error{ErrorCode::EmbeddingUnavailable,
                         backend.getBackendName() + " backend failed: " + result.error().message};
        }
        if (!utils::isValidEmbedding(result.value(), expected_dim)) {
            stats.failures.fetch_add(1);
            return Error{ErrorCode::EmbeddingUnavailable,
                         "Backend returned " + std::to_string(result.value().size()) +
                             " components, expected " + std::to_string(expected_dim) +
                             " finite values"};
        }
        stats.total_texts_processed.fetch_add(1);
        return std::move(result).value();
    } catch (const std::exception& e) {
        record();
        stats.failures.fetch_add(1);
        return Error{ErrorCode::EmbeddingUnavailable,
                     std::string("Embedding backend threw: ") + e.what()};
    }
}

} // namespace

class EmbeddingGenerator::Impl {
public:
    Impl(std::shared_ptr<IEmbeddingBackend> backend, const EmbeddingConfig& config)
        : backend_(std::move(backend)), config_(config),
          stats_(std::make_shared<GenerationStats>()),
          pool_(std::max<size_t>(config.num_threads, 1)) {
        spdlog::debug("EmbeddingGenerator using {} backend, dimension {}",
                      backend_ ? backend_->getBackendName() : "no", config_.embedding_dim);
    }

    ~Impl() {
        pool_.stop();
        pool_.join();
    }

    Result<std::vector<float>> generate(const std::string& text) {
        if (!backend_) {
            return Error{ErrorCode::EmbeddingUnavailable, "No embedding backend configured"};
        }
        return runBackend(*backend_, text, config_.embedding_dim, *stats_);
    }

    Result<std::vector<float>> generate(const std::string& text,
                                        std::chrono::milliseconds timeout) {
        if (!backend_) {
            return Error{ErrorCode::EmbeddingUnavailable, "No embedding backend configured"};
        }

        // The task owns everything it touches so an abandoned call cannot dangle
        auto task = std::make_shared<std::packaged_task<Result<std::vector<float>>()>>(
            [backend = backend_, stats = stats_, text, dim = config_.embedding_dim]() {
                return runBackend(*backend, text, dim, *stats);
            });
        auto fut = task->get_future();
        boost::asio::post(pool_, [task]() { (*task)(); });

        if (fut.wait_for(timeout) != std::future_status::ready) {
            stats_->timeouts.fetch_add(1);
            return Error{ErrorCode::EmbeddingUnavailable,
                         "Embedding timed out after " + std::to_string(timeout.count()) + " ms"};
        }
        return fut.get();
    }

    std::shared_ptr<IEmbeddingBackend> backend_;
    EmbeddingConfig config_;
    std::shared_ptr<GenerationStats> stats_;
    boost::asio::thread_pool pool_;
};

EmbeddingGenerator::EmbeddingGenerator(std::shared_ptr<IEmbeddingBackend> backend,
                                       const EmbeddingConfig& config)
    : pImpl(std::make_unique<Impl>(std::move(backend), config)) {}

EmbeddingGenerator::~EmbeddingGenerator() = default;

Result<std::vector<float>> EmbeddingGenerator::generateEmbedding(const std::string& text) {
    return pImpl->generate(text);
}

Result<std::vector<float>>
EmbeddingGenerator::generateEmbedding(const std::string& text, std::chrono::milliseconds timeout) {
    return pImpl->generate(text, timeout);
}

Result<std::vector<float>>
EmbeddingGenerator::generateEmbeddingWithTimeout(const std::string& text) {
    return pImpl->generate(text, pImpl->config_.timeout);
}

size_t EmbeddingGenerator::getEmbeddingDimension() const {
    return pImpl->config_.embedding_dim;
}

const EmbeddingConfig& EmbeddingGenerator::getConfig() const {
    return pImpl->config_;
}

std::string EmbeddingGenerator::getBackendName() const {
    return pImpl->backend_ ? pImpl->backend_->getBackendName() : "none";
}

GenerationStats EmbeddingGenerator::getStats() const {
    return *pImpl->stats_;
}

} // namespace cortex::vector
