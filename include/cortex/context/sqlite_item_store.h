#pragma once

#include <cortex/context/item_store.h>

#include <memory>
#include <string>

namespace cortex::context {

/**
 * @brief Durable ItemStore on a single SQLite connection
 *
 * Tags, extra_metadata and settings are stored as JSON text, timestamps as epoch milliseconds
 * and the vector as a little-endian float32 BLOB. Access to the connection is serialized by a
 * mutex; a compare-and-swap is one conditional UPDATE on (id, revision). Any SQLite failure
 * surfaces as ErrorCode::StoreUnavailable.
 */
class SqliteItemStore : public ItemStore {
public:
    ~SqliteItemStore() override;

    SqliteItemStore(const SqliteItemStore&) = delete;
    SqliteItemStore& operator=(const SqliteItemStore&) = delete;

    // ":memory:" opens a private in-memory database
    static Result<std::unique_ptr<SqliteItemStore>> open(const std::string& path);

    std::string backendName() const override { return "sqlite"; }

    Result<ContextItem> insert(ContextItem item) override;
    Result<std::optional<ContextItem>> get(ItemId id) override;
    Result<ContextItem> upsert(ContextItem item) override;
    Result<std::optional<ContextItem>> compareAndSwap(ContextItem item,
                                                      uint64_t expectedRevision) override;
    Result<std::unique_ptr<ItemCursor>> scan(ScanSpec spec) override;
    Result<bool> remove(ItemId id) override;

    Result<void> insertProject(const ContextProject& project) override;
    Result<std::optional<ContextProject>> getProject(const std::string& id) override;
    Result<void> updateProject(const ContextProject& project) override;
    Result<bool> removeProject(const std::string& id) override;
    Result<std::vector<ContextProject>> listProjects() override;

    // Rows fetched per cursor round trip
    static constexpr int kScanBatchSize = 64;

private:
    struct Impl;
    class Cursor;

    explicit SqliteItemStore(std::shared_ptr<Impl> impl);

    std::shared_ptr<Impl> impl_;
};

} // namespace cortex::context
