#include <cortex/search/search_filters.h>

#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cortex;
using namespace cortex::search;
using cortex::context::ContentType;

namespace {

context::ContextItem tagged(ContentType type, std::set<std::string> tags,
                            std::optional<std::string> project = std::nullopt) {
    auto item = tests::makeItem("title", "content");
    item.content_type = type;
    item.tags = std::move(tags);
    item.project_id = std::move(project);
    return item;
}

} // namespace

TEST(SearchFiltersTest, EmptyFiltersMatchActiveItemsOnly) {
    SearchFilters filters;
    auto item = tagged(ContentType::Text, {});
    EXPECT_TRUE(filters.matches(item));

    item.is_active = false;
    EXPECT_FALSE(filters.matches(item));

    filters.include_inactive = true;
    EXPECT_TRUE(filters.matches(item));
}

TEST(SearchFiltersTest, SetsUseAnyOfSemantics) {
    SearchFilters filters;
    filters.tags = {"rust", "cpp"};
    filters.content_types = {ContentType::Code, ContentType::Markdown};

    EXPECT_TRUE(filters.matches(tagged(ContentType::Code, {"cpp", "build"})));
    EXPECT_TRUE(filters.matches(tagged(ContentType::Markdown, {"rust"})));
    EXPECT_FALSE(filters.matches(tagged(ContentType::Code, {"go"})));
    EXPECT_FALSE(filters.matches(tagged(ContentType::Json, {"rust"})));
}

TEST(SearchFiltersTest, DimensionsCombineWithAnd) {
    SearchFilters filters;
    filters.project_id = "alpha";
    filters.tags = {"api"};
    filters.source = "notes";

    auto item = tagged(ContentType::Text, {"api"}, std::string("alpha"));
    item.source = "notes";
    EXPECT_TRUE(filters.matches(item));

    item.source = "web";
    EXPECT_FALSE(filters.matches(item));

    item.source = "notes";
    item.project_id = "beta";
    EXPECT_FALSE(filters.matches(item));

    item.project_id.reset();
    EXPECT_FALSE(filters.matches(item));
}

TEST(SearchFiltersTest, ScanSpecPushesDownActiveAndProject) {
    SearchFilters filters;
    filters.project_id = "alpha";
    auto spec = filters.toScanSpec();
    ASSERT_TRUE(spec.is_active.has_value());
    EXPECT_TRUE(*spec.is_active);
    EXPECT_EQ(spec.project_id, std::optional<std::string>("alpha"));
    EXPECT_FALSE(static_cast<bool>(spec.predicate));

    filters.include_inactive = true;
    filters.tags = {"x"};
    spec = filters.toScanSpec();
    EXPECT_FALSE(spec.is_active.has_value());
    ASSERT_TRUE(static_cast<bool>(spec.predicate));
    EXPECT_TRUE(spec.predicate(tagged(ContentType::Text, {"x"}, std::string("alpha"))));
    EXPECT_FALSE(spec.predicate(tagged(ContentType::Text, {"y"}, std::string("alpha"))));
}
