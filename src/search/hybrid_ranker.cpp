#include <spdlog/spdlog.h>
#include <cortex/search/hybrid_ranker.h>
#include <cortex/vector/embedding_generator.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace cortex::search {

namespace {

bool isBlankQuery(const std::string& query) {
    return std::all_of(query.begin(), query.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

// combined_score desc, created_at desc, id desc
bool rankBefore(const ScoredItem& a, const ScoredItem& b) {
    if (a.combined_score != b.combined_score)
        return a.combined_score > b.combined_score;
    if (a.item.created_at != b.item.created_at)
        return a.item.created_at > b.item.created_at;
    return a.item.id > b.item.id;
}

Error cancelled() {
    return Error{ErrorCode::OperationCancelled, "Search cancelled"};
}

} // namespace

Result<SearchMode> parseSearchMode(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "semantic")
        return SearchMode::Semantic;
    if (lowered == "keyword")
        return SearchMode::Keyword;
    if (lowered == "hybrid")
        return SearchMode::Hybrid;

    return Error{ErrorCode::InvalidQuery,
                 "Unknown search mode '" + std::string(name) +
                     "' (expected semantic, keyword or hybrid)"};
}

HybridRanker::HybridRanker(std::shared_ptr<context::ItemStore> store,
                           std::shared_ptr<vector::EmbeddingGenerator> embedder,
                           const Config& config, std::shared_ptr<Scorer> semantic,
                           std::shared_ptr<Scorer> keyword)
    : store_(std::move(store)), embedder_(std::move(embedder)),
      semantic_(semantic ? std::move(semantic)
                         : std::make_shared<SemanticScorer>(
                               embedder_ ? embedder_->getEmbeddingDimension() : 0)),
      keyword_(keyword ? std::move(keyword) : std::make_shared<KeywordScorer>()),
      config_(config) {
    if (config_.scan_batch_size == 0) {
        config_.scan_batch_size = 1;
    }
}

Result<void> HybridRanker::validate(const SearchRequest& request, float weight) const {
    if (request.limit < 0) {
        return Error{ErrorCode::InvalidQuery, "limit must be >= 0"};
    }
    if (request.limit > config_.max_limit) {
        return Error{ErrorCode::InvalidQuery,
                     "limit must be <= " + std::to_string(config_.max_limit)};
    }
    if (request.offset < 0) {
        return Error{ErrorCode::InvalidQuery, "offset must be >= 0"};
    }
    // Written so that NaN fails too
    if (!(weight >= 0.0f && weight <= 1.0f)) {
        return Error{ErrorCode::InvalidQuery, "semantic_weight must be within [0, 1]"};
    }
    switch (request.mode) {
        case SearchMode::Semantic:
        case SearchMode::Keyword:
        case SearchMode::Hybrid:
            return {};
    }
    return Error{ErrorCode::InvalidQuery, "Unknown search mode"};
}

Result<SearchResponse> HybridRanker::search(const SearchRequest& request,
                                            std::stop_token stop) const {
    const auto start = std::chrono::steady_clock::now();

    const float weight = request.semantic_weight.value_or(config_.default_semantic_weight);
    if (auto valid = validate(request, weight); !valid) {
        return valid.error();
    }
    if (stop.stop_requested()) {
        return cancelled();
    }

    SearchResponse response;
    response.query = request.query;
    response.limit = request.limit;
    response.offset = request.offset;
    response.requested_mode = request.mode;
    response.effective_mode = request.mode;

    auto finish = [&]() {
        response.execution_time_ms =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
                .count();
        spdlog::debug("search mode={} effective={} scanned={} total={} took {:.2f} ms",
                      searchModeToString(response.requested_mode),
                      searchModeToString(response.effective_mode), response.candidates_scanned,
                      response.total, response.execution_time_ms);
    };

    const bool emptyQuery = isBlankQuery(request.query);
    if (emptyQuery && request.mode == SearchMode::Keyword) {
        // An empty keyword query matches nothing rather than everything
        finish();
        return response;
    }
    const bool filterOnly = emptyQuery;

    QueryContext query;
    query.text = request.query;

    if (!filterOnly && request.mode != SearchMode::Keyword) {
        Result<std::vector<float>> embedding =
            embedder_ ? embedder_->generateEmbedding(request.query, config_.embed_timeout)
                      : Result<std::vector<float>>(
                            Error{ErrorCode::EmbeddingUnavailable, "No embedding generator"});
        if (embedding) {
            query.embedding = std::move(embedding).value();
        } else {
            spdlog::warn("Query embedding unavailable for {} search, falling back to keyword: {}",
                         searchModeToString(request.mode), embedding.error().message);
            response.effective_mode = SearchMode::Keyword;
            response.degraded = true;
            response.warnings.push_back("Semantic scoring unavailable (" +
                                        embedding.error().message +
                                        "); results ranked by keyword only");
        }
        if (stop.stop_requested()) {
            return cancelled();
        }
    }

    const SearchMode mode = response.effective_mode;
    const bool useSemantic = !filterOnly && mode != SearchMode::Keyword;
    const bool useKeyword = !filterOnly && mode != SearchMode::Semantic;
    if (useSemantic)
        semantic_->prepare(query);
    if (useKeyword)
        keyword_->prepare(query);

    auto cursorResult = store_->scan(request.filters.toScanSpec());
    if (!cursorResult) {
        return cursorResult.error();
    }
    auto cursor = std::move(cursorResult).value();

    std::vector<ScoredItem> matches;
    size_t scanned = 0;
    while (true) {
        if (scanned % config_.scan_batch_size == 0 && stop.stop_requested()) {
            spdlog::debug("search cancelled after {} candidates", scanned);
            return cancelled();
        }

        auto next = cursor->next();
        if (!next) {
            return next.error();
        }
        if (!next.value()) {
            break;
        }
        ++scanned;

        context::ContextItem& item = *next.value();
        if (mode == SearchMode::Semantic && !semantic_->isEligible(item)) {
            continue;
        }

        ScoredItem scored;
        scored.semantic_score = useSemantic ? semantic_->score(query, item) : 0.0f;
        scored.keyword_score = useKeyword ? keyword_->score(query, item) : 0.0f;
        switch (mode) {
            case SearchMode::Semantic:
                scored.combined_score = scored.semantic_score;
                break;
            case SearchMode::Keyword:
                scored.combined_score = scored.keyword_score;
                break;
            case SearchMode::Hybrid:
                scored.combined_score =
                    weight * scored.semantic_score + (1.0f - weight) * scored.keyword_score;
                break;
        }

        if (!filterOnly && scored.combined_score <= 0.0f) {
            continue;
        }
        scored.item = std::move(item);
        matches.push_back(std::move(scored));
    }

    std::sort(matches.begin(), matches.end(), rankBefore);

    response.candidates_scanned = scanned;
    response.total = matches.size();

    const auto offset = static_cast<size_t>(request.offset);
    const auto limit = static_cast<size_t>(request.limit);
    if (offset < matches.size()) {
        const size_t end = std::min(matches.size(), offset + limit);
        response.items.assign(std::make_move_iterator(matches.begin() + offset),
                              std::make_move_iterator(matches.begin() + end));
    }

    finish();
    return response;
}

} // namespace cortex::search
