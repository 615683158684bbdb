#include <cortex/search/scorer.h>
#include <cortex/search/tokenizer.h>
#include <cortex/vector/vector_utils.h>

#include <algorithm>

namespace cortex::search {

void KeywordScorer::prepare(QueryContext& query) const {
    if (query.terms.empty()) {
        query.terms = Tokenizer::uniqueTerms(query.text);
    }
}

float KeywordScorer::score(const QueryContext& query, const context::ContextItem& item) const {
    if (query.terms.empty()) {
        return 0.0f;
    }

    const auto titleTerms = Tokenizer::uniqueTerms(item.title);
    const auto contentTerms = Tokenizer::uniqueTerms(item.content);

    size_t titleMatches = 0;
    size_t contentMatches = 0;
    for (const auto& term : query.terms) {
        if (titleTerms.count(term))
            ++titleMatches;
        if (contentTerms.count(term))
            ++contentMatches;
    }

    const float numerator = config_.title_weight * static_cast<float>(titleMatches) +
                            static_cast<float>(contentMatches);
    const float denominator = config_.title_weight * static_cast<float>(query.terms.size()) +
                              config_.content_term_count_cap;
    if (denominator <= 0.0f) {
        return 0.0f;
    }
    return std::clamp(numerator / denominator, 0.0f, 1.0f);
}

float SemanticScorer::score(const QueryContext& query, const context::ContextItem& item) const {
    if (!query.embedding || !isEligible(item)) {
        return 0.0f;
    }
    return vector::utils::normalizedCosine(*query.embedding, *item.vector);
}

bool SemanticScorer::isEligible(const context::ContextItem& item) const {
    return dimension_ == 0 ? item.hasVector() : item.hasVector(dimension_);
}

} // namespace cortex::search
