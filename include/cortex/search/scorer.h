#pragma once

#include <cortex/context/context_item.h>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cortex::search {

/**
 * @brief Per-query state shared by all scorers for one search call.
 *
 * Built once by the ranker and only read while candidates are scored, so a single instance
 * is never shared between concurrent queries.
 */
struct QueryContext {
    std::string text;
    std::set<std::string> terms;
    std::optional<std::vector<float>> embedding;
};

/**
 * @brief Capability interface for relevance scoring: score(query, item) -> [0, 1]
 */
class Scorer {
public:
    virtual ~Scorer() = default;

    virtual std::string name() const = 0;

    // Hook for per-query preprocessing (term extraction and similar)
    virtual void prepare(QueryContext& /*query*/) const {}

    virtual float score(const QueryContext& query, const context::ContextItem& item) const = 0;

    // Whether the item may appear at all when this scorer is the only one in play
    virtual bool isEligible(const context::ContextItem& /*item*/) const { return true; }
};

/**
 * @brief Transparent lexical scorer.
 *
 * score = (title_weight * title_matches + content_matches)
 *         / (title_weight * query_terms + content_term_count_cap)
 *
 * Matches count distinct query terms found at least once. The result is clamped to [0, 1];
 * an empty query scores 0 for every item.
 */
class KeywordScorer : public Scorer {
public:
    struct Config {
        float title_weight = 2.0f;
        float content_term_count_cap = 1.0f;
    };

    KeywordScorer() = default;
    explicit KeywordScorer(const Config& config) : config_(config) {}

    std::string name() const override { return "keyword"; }
    void prepare(QueryContext& query) const override;
    float score(const QueryContext& query, const context::ContextItem& item) const override;

private:
    Config config_;
};

/**
 * @brief Cosine similarity between the query embedding and the item vector, mapped to [0, 1]
 * via (sim + 1) / 2. Items without a vector score 0 and are not eligible for semantic-only
 * ranking. With a non-zero dimension, vectors of another length are treated as missing.
 */
class SemanticScorer : public Scorer {
public:
    SemanticScorer() = default;
    explicit SemanticScorer(size_t dimension) : dimension_(dimension) {}

    std::string name() const override { return "semantic"; }
    float score(const QueryContext& query, const context::ContextItem& item) const override;
    bool isEligible(const context::ContextItem& item) const override;

private:
    size_t dimension_ = 0;
};

} // namespace cortex::search
