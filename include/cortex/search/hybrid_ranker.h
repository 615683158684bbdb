#pragma once

#include <cortex/context/context_item.h>
#include <cortex/context/item_store.h>
#include <cortex/core/types.h>
#include <cortex/search/scorer.h>
#include <cortex/search/search_filters.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace cortex::vector {
class EmbeddingGenerator;
}

namespace cortex::search {

enum class SearchMode { Semantic, Keyword, Hybrid };

constexpr std::string_view searchModeToString(SearchMode mode) {
    switch (mode) {
        case SearchMode::Semantic: return "semantic";
        case SearchMode::Keyword: return "keyword";
        case SearchMode::Hybrid: return "hybrid";
    }
    return "unknown";
}

// ErrorCode::InvalidQuery for anything but semantic, keyword or hybrid
Result<SearchMode> parseSearchMode(std::string_view name);

struct SearchRequest {
    std::string query;
    SearchMode mode = SearchMode::Hybrid;
    std::optional<float> semantic_weight; // Hybrid only; engine default when unset
    SearchFilters filters;
    int64_t limit = 50;
    int64_t offset = 0;
};

struct ScoredItem {
    context::ContextItem item;
    float combined_score = 0.0f;
    float semantic_score = 0.0f;
    float keyword_score = 0.0f;
};

struct SearchResponse {
    std::vector<ScoredItem> items;
    size_t total = 0; // Matches before pagination
    double execution_time_ms = 0.0;
    size_t candidates_scanned = 0;

    std::string query;
    int64_t limit = 0;
    int64_t offset = 0;
    SearchMode requested_mode = SearchMode::Hybrid;
    SearchMode effective_mode = SearchMode::Hybrid;
    bool degraded = false; // Semantic scoring was requested but unavailable
    std::vector<std::string> warnings;
};

/**
 * @brief Merges semantic and keyword relevance into one filtered, paginated, totally ordered
 * result list.
 *
 * Ranking order is combined_score desc, then created_at desc, then id desc. With a non-empty
 * query, zero-scored candidates are dropped. An empty query is a filter-only listing for the
 * semantic and hybrid modes (recency order, all scores 0) and matches nothing in keyword mode.
 *
 * If the query embedding fails or exceeds embed_timeout the call is scored by keyword only and
 * the response reports the degradation. The ranker never writes to the store and keeps no
 * per-call state in members, so one instance serves concurrent queries.
 */
class HybridRanker {
public:
    struct Config {
        float default_semantic_weight = 0.7f;
        std::chrono::milliseconds embed_timeout{350};
        size_t scan_batch_size = 64; // Candidates between cancellation checks
        int64_t max_limit = 100;
    };

    // Null scorers select SemanticScorer (at the embedder's dimension) and KeywordScorer.
    // Scorers are fixed for the ranker's lifetime.
    HybridRanker(std::shared_ptr<context::ItemStore> store,
                 std::shared_ptr<vector::EmbeddingGenerator> embedder, const Config& config,
                 std::shared_ptr<Scorer> semantic = nullptr,
                 std::shared_ptr<Scorer> keyword = nullptr);

    Result<SearchResponse> search(const SearchRequest& request,
                                  std::stop_token stop = {}) const;

    const Config& getConfig() const { return config_; }

private:
    Result<void> validate(const SearchRequest& request, float weight) const;

    std::shared_ptr<context::ItemStore> store_;
    std::shared_ptr<vector::EmbeddingGenerator> embedder_;
    std::shared_ptr<Scorer> semantic_;
    std::shared_ptr<Scorer> keyword_;
    Config config_;
};

} // namespace cortex::search
