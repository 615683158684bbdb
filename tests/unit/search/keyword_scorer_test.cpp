#include <cortex/search/scorer.h>
#include <cortex/search/tokenizer.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cortex;
using namespace cortex::search;

namespace {

QueryContext prepared(const std::string& text) {
    QueryContext query;
    query.text = text;
    KeywordScorer().prepare(query);
    return query;
}

} // namespace

TEST(TokenizerTest, LowercasesAndSplitsOnNonAlphanumerics) {
    auto terms = Tokenizer::tokenize("Rust's borrow-checker, v2.0!");
    EXPECT_EQ(terms, (std::vector<std::string>{"rust", "s", "borrow", "checker", "v2", "0"}));

    EXPECT_TRUE(Tokenizer::tokenize("  ...  ").empty());
    EXPECT_EQ(Tokenizer::uniqueTerms("a A a b").size(), 2u);
}

TEST(TokenizerTest, KeepsUtf8Words) {
    auto terms = Tokenizer::tokenize("naïve café");
    ASSERT_EQ(terms.size(), 2u);
    EXPECT_EQ(terms[1], "café");
}

TEST(KeywordScorerTest, TitleMatchesWeighTwice) {
    KeywordScorer scorer;
    auto item = tests::makeItem("Rust ownership", "borrow checker rules");

    // (2 * 1 + 1) / (2 * 2 + 1)
    EXPECT_FLOAT_EQ(scorer.score(prepared("ownership rules"), item), 0.6f);
    // title only: 2 / 3
    EXPECT_FLOAT_EQ(scorer.score(prepared("rust"), item), 2.0f / 3.0f);
    // content only: 1 / 3
    EXPECT_FLOAT_EQ(scorer.score(prepared("checker"), item), 1.0f / 3.0f);
    EXPECT_FLOAT_EQ(scorer.score(prepared("navigation"), item), 0.0f);
}

TEST(KeywordScorerTest, CountsDistinctTermsCaseInsensitively) {
    KeywordScorer scorer;
    auto item = tests::makeItem("Notes", "Router router ROUTER guards");

    // Repeats in the query or the content count once
    EXPECT_FLOAT_EQ(scorer.score(prepared("ROUTER router"), item), 1.0f / 3.0f);
}

TEST(KeywordScorerTest, ScoreIsClampedToOne) {
    KeywordScorer scorer;
    auto item = tests::makeItem("rust ownership", "rust ownership");

    // Raw formula gives (4 + 2) / 5
    EXPECT_FLOAT_EQ(scorer.score(prepared("rust ownership"), item), 1.0f);
}

TEST(KeywordScorerTest, EmptyQueryScoresZero) {
    KeywordScorer scorer;
    auto item = tests::makeItem("anything", "at all");
    EXPECT_FLOAT_EQ(scorer.score(prepared(""), item), 0.0f);
    EXPECT_FLOAT_EQ(scorer.score(prepared("   "), item), 0.0f);
}

TEST(KeywordScorerTest, ConfigurableWeights) {
    KeywordScorer scorer(KeywordScorer::Config{1.0f, 0.0f});
    auto item = tests::makeItem("alpha", "beta");
    // (1 * 1 + 0) / (1 * 2 + 0)
    EXPECT_FLOAT_EQ(scorer.score(prepared("alpha gamma"), item), 0.5f);
}

TEST(SemanticScorerTest, UsesNormalizedCosine) {
    SemanticScorer scorer;
    QueryContext query;
    query.embedding = std::vector<float>{1.0f, 0.0f};

    auto aligned = tests::makeItem("a", "a", std::vector<float>{2.0f, 0.0f});
    auto orthogonal = tests::makeItem("b", "b", std::vector<float>{0.0f, 1.0f});
    auto missing = tests::makeItem("c", "c");

    EXPECT_FLOAT_EQ(scorer.score(query, aligned), 1.0f);
    EXPECT_FLOAT_EQ(scorer.score(query, orthogonal), 0.5f);
    EXPECT_FLOAT_EQ(scorer.score(query, missing), 0.0f);
    EXPECT_TRUE(scorer.isEligible(aligned));
    EXPECT_FALSE(scorer.isEligible(missing));

    QueryContext noEmbedding;
    EXPECT_FLOAT_EQ(scorer.score(noEmbedding, aligned), 0.0f);
}

TEST(SemanticScorerTest, VectorsOfAnotherDimensionAreIneligible) {
    SemanticScorer scorer(2);
    QueryContext query;
    query.embedding = std::vector<float>{1.0f, 0.0f};

    auto current = tests::makeItem("a", "a", std::vector<float>{1.0f, 0.0f});
    auto stale = tests::makeItem("b", "b", std::vector<float>{1.0f, 0.0f, 0.0f});

    EXPECT_TRUE(scorer.isEligible(current));
    EXPECT_FALSE(scorer.isEligible(stale));
    EXPECT_FLOAT_EQ(scorer.score(query, stale), 0.0f);
}
