#include <cortex/context/item_store.h>
#include <cortex/context/sqlite_item_store.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cortex;
using namespace cortex::context;
using namespace std::chrono_literals;

namespace {

std::vector<ItemId> drain(ItemCursor& cursor) {
    std::vector<ItemId> out;
    while (true) {
        auto next = cursor.next();
        EXPECT_TRUE(next);
        if (!next || !next.value())
            break;
        out.push_back(next.value()->id);
    }
    return out;
}

ContextProject project(const std::string& id, TimePoint created) {
    ContextProject p;
    p.id = id;
    p.name = "Project " + id;
    p.settings = {{"embedding", "hashing"}};
    p.created_at = created;
    p.updated_at = created;
    return p;
}

} // namespace

class ItemStoreTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        StoreOptions options;
        options.backend = GetParam();
        options.database_path = ":memory:";
        auto created = createItemStore(options);
        ASSERT_TRUE(created) << created.error().message;
        store_ = std::move(created).value();
    }

    std::unique_ptr<ItemStore> store_;
};

TEST_P(ItemStoreTest, InsertAssignsIdAndRevision) {
    auto first = store_->insert(tests::makeItem("one", "first body"));
    auto second = store_->insert(tests::makeItem("two", "second body", std::vector<float>{1, 0}));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    EXPECT_GT(first.value().id, 0);
    EXPECT_GT(second.value().id, first.value().id);
    EXPECT_EQ(first.value().revision, 1u);
    EXPECT_EQ(store_->backendName(), GetParam());

    auto fetched = store_->get(second.value().id);
    ASSERT_TRUE(fetched);
    ASSERT_TRUE(fetched.value().has_value());
    EXPECT_EQ(fetched.value()->title, "two");
    EXPECT_EQ(fetched.value()->vector, (std::vector<float>{1, 0}));

    auto missing = store_->get(9999);
    ASSERT_TRUE(missing);
    EXPECT_FALSE(missing.value().has_value());
}

TEST_P(ItemStoreTest, CompareAndSwapChecksRevision) {
    auto stored = store_->insert(tests::makeItem("draft", "body")).value();

    auto edit = stored;
    edit.content = "edited";
    auto swapped = store_->compareAndSwap(edit, stored.revision);
    ASSERT_TRUE(swapped);
    ASSERT_TRUE(swapped.value().has_value());
    EXPECT_EQ(swapped.value()->revision, stored.revision + 1);

    // A second writer still holding the old revision loses
    auto stale = stored;
    stale.content = "stale";
    auto conflict = store_->compareAndSwap(stale, stored.revision);
    ASSERT_TRUE(conflict);
    EXPECT_FALSE(conflict.value().has_value());
    EXPECT_EQ(store_->get(stored.id).value()->content, "edited");

    auto ghost = stored;
    ghost.id = 4242;
    auto notFound = store_->compareAndSwap(ghost, 1);
    ASSERT_FALSE(notFound);
    EXPECT_EQ(notFound.error().code, ErrorCode::NotFound);
}

TEST_P(ItemStoreTest, UpsertBumpsRevision) {
    auto stored = store_->insert(tests::makeItem("title", "body")).value();
    stored.tags = {"a", "b"};
    auto written = store_->upsert(stored);
    ASSERT_TRUE(written);
    EXPECT_EQ(written.value().revision, 2u);
    EXPECT_EQ(store_->get(stored.id).value()->tags, (std::set<std::string>{"a", "b"}));
}

TEST_P(ItemStoreTest, ScanPushesDownAndFilters) {
    auto a = tests::makeItem("a", "x");
    a.project_id = "alpha";
    auto b = tests::makeItem("b", "x");
    b.project_id = "alpha";
    b.is_active = false;
    auto c = tests::makeItem("c", "x");
    c.project_id = "beta";
    c.tags = {"keep"};
    auto d = tests::makeItem("d", "x");
    d.tags = {"keep"};

    const auto idA = store_->insert(a).value().id;
    const auto idB = store_->insert(b).value().id;
    const auto idC = store_->insert(c).value().id;
    const auto idD = store_->insert(d).value().id;

    auto all = store_->scan(ScanSpec{}).value();
    EXPECT_EQ(drain(*all), (std::vector<ItemId>{idA, idC, idD}));

    ScanSpec inactiveToo;
    inactiveToo.is_active.reset();
    inactiveToo.project_id = "alpha";
    auto alpha = store_->scan(inactiveToo).value();
    EXPECT_EQ(drain(*alpha), (std::vector<ItemId>{idA, idB}));

    ScanSpec tagged;
    tagged.predicate = [](const ContextItem& item) { return item.tags.count("keep") > 0; };
    auto keep = store_->scan(tagged).value();
    EXPECT_EQ(drain(*keep), (std::vector<ItemId>{idC, idD}));

    keep->reset();
    EXPECT_EQ(drain(*keep), (std::vector<ItemId>{idC, idD}));
}

TEST_P(ItemStoreTest, ScanSpansManyBatches) {
    const int count = SqliteItemStore::kScanBatchSize * 2 + 5;
    for (int i = 0; i < count; ++i) {
        ASSERT_TRUE(store_->insert(tests::makeItem("item " + std::to_string(i), "body")));
    }
    auto cursor = store_->scan(ScanSpec{}).value();
    auto ids = drain(*cursor);
    ASSERT_EQ(ids.size(), static_cast<size_t>(count));
    EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
}

TEST_P(ItemStoreTest, RemoveReportsWhetherItemExisted) {
    auto stored = store_->insert(tests::makeItem("gone", "soon")).value();
    auto removed = store_->remove(stored.id);
    ASSERT_TRUE(removed);
    EXPECT_TRUE(removed.value());
    EXPECT_FALSE(store_->get(stored.id).value().has_value());

    auto again = store_->remove(stored.id);
    ASSERT_TRUE(again);
    EXPECT_FALSE(again.value());
}

TEST_P(ItemStoreTest, ProjectLifecycle) {
    const auto now = currentTimestamp();
    ASSERT_TRUE(store_->insertProject(project("beta", now)));
    ASSERT_TRUE(store_->insertProject(project("alpha", now)));
    ASSERT_TRUE(store_->insertProject(project("early", now - 1h)));

    auto duplicate = store_->insertProject(project("alpha", now));
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, ErrorCode::AlreadyExists);

    auto listed = store_->listProjects();
    ASSERT_TRUE(listed);
    ASSERT_EQ(listed.value().size(), 3u);
    EXPECT_EQ(listed.value()[0].id, "early");
    EXPECT_EQ(listed.value()[1].id, "alpha");
    EXPECT_EQ(listed.value()[2].id, "beta");

    auto alpha = store_->getProject("alpha").value().value();
    EXPECT_EQ(alpha.settings.at("embedding"), "hashing");
    alpha.description = "renamed";
    alpha.is_active = false;
    ASSERT_TRUE(store_->updateProject(alpha));
    auto updated = store_->getProject("alpha").value().value();
    EXPECT_EQ(updated.description, std::optional<std::string>("renamed"));
    EXPECT_FALSE(updated.is_active);

    auto unknown = store_->updateProject(project("nobody", now));
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);

    EXPECT_TRUE(store_->removeProject("beta").value());
    EXPECT_FALSE(store_->removeProject("beta").value());
    EXPECT_FALSE(store_->getProject("beta").value().has_value());
}

INSTANTIATE_TEST_SUITE_P(Backends, ItemStoreTest, ::testing::Values("memory", "sqlite"),
                         [](const ::testing::TestParamInfo<std::string>& info) {
                             return info.param;
                         });

TEST(ItemStoreFactoryTest, UnknownBackendIsNotSupported) {
    StoreOptions options;
    options.backend = "postgres";
    auto store = createItemStore(options);
    ASSERT_FALSE(store);
    EXPECT_EQ(store.error().code, ErrorCode::NotSupported);
}

TEST(SqliteItemStoreTest, PersistsAcrossReopen) {
    auto dir = tests::make_temp_dir("cortex_store_");
    const auto path = (dir / "context.db").string();

    auto item = tests::makeItem("Persisted", "body", std::vector<float>{0.25f, -1.0f, 3.5f});
    item.tags = {"db", "sqlite"};
    item.extra_metadata = {{"lang", "en"}, {"count", "3"}};
    item.source = "notes";
    item.project_id = "alpha";
    item.content_type = ContentType::Markdown;
    item.created_at = currentTimestamp() - 90s;
    item.updated_at = currentTimestamp();

    ItemId id = 0;
    {
        auto store = SqliteItemStore::open(path);
        ASSERT_TRUE(store) << store.error().message;
        id = store.value()->insert(item).value().id;
        ASSERT_TRUE(store.value()->insertProject(project("alpha", item.created_at)));
    }

    auto reopened = SqliteItemStore::open(path);
    ASSERT_TRUE(reopened) << reopened.error().message;
    auto loaded = reopened.value()->get(id).value();
    ASSERT_TRUE(loaded.has_value());

    EXPECT_EQ(loaded->title, "Persisted");
    EXPECT_EQ(loaded->content_type, ContentType::Markdown);
    EXPECT_EQ(loaded->tags, item.tags);
    EXPECT_EQ(loaded->extra_metadata, item.extra_metadata);
    EXPECT_EQ(loaded->source, item.source);
    EXPECT_EQ(loaded->project_id, item.project_id);
    EXPECT_EQ(loaded->vector, item.vector);
    EXPECT_EQ(loaded->created_at, item.created_at);
    EXPECT_EQ(loaded->updated_at, item.updated_at);
    EXPECT_EQ(loaded->revision, 1u);

    auto projects = reopened.value()->listProjects().value();
    ASSERT_EQ(projects.size(), 1u);
    EXPECT_EQ(projects[0].created_at, item.created_at);

    reopened.value().reset();
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(SqliteItemStoreTest, VectorlessItemsRoundTrip) {
    auto store = SqliteItemStore::open(":memory:");
    ASSERT_TRUE(store);
    auto stored = store.value()->insert(tests::makeItem("plain", "no vector")).value();
    auto loaded = store.value()->get(stored.id).value();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->hasVector());
    EXPECT_FALSE(loaded->source.has_value());
}
