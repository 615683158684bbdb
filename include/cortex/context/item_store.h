#pragma once

#include <cortex/context/context_item.h>
#include <cortex/core/types.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cortex::context {

/**
 * @brief Candidate selection for ItemStore::scan
 *
 * is_active and project_id are pushed down to the backend; predicate runs on each surviving
 * item afterwards.
 */
struct ScanSpec {
    std::optional<bool> is_active = true; // nullopt selects active and inactive rows
    std::optional<std::string> project_id;
    std::function<bool(const ContextItem&)> predicate;
};

/**
 * @brief Lazy, finite, restartable sequence of items in ascending id order
 *
 * A cursor never holds store locks between calls to next(); items written concurrently may or
 * may not be observed, but every returned item is an untorn snapshot.
 */
class ItemCursor {
public:
    virtual ~ItemCursor() = default;

    // nullopt once the sequence is exhausted
    virtual Result<std::optional<ContextItem>> next() = 0;

    // Rewind to the first item
    virtual void reset() = 0;
};

/**
 * @brief Record store holding items, their vectors and projects
 *
 * Every item write bumps ContextItem::revision. compareAndSwap succeeds only when the stored
 * revision equals expectedRevision, which lets callers compute embeddings without holding any
 * store lock and still publish (content, vector, updated_at) atomically.
 */
class ItemStore {
public:
    virtual ~ItemStore() = default;

    virtual std::string backendName() const = 0;

    /**
     * @brief Insert a new item; the store assigns id and revision
     */
    virtual Result<ContextItem> insert(ContextItem item) = 0;

    virtual Result<std::optional<ContextItem>> get(ItemId id) = 0;

    /**
     * @brief Unconditional write of an existing id or insert under the given id
     */
    virtual Result<ContextItem> upsert(ContextItem item) = 0;

    /**
     * @brief Conditional write; returns the stored item, or nullopt if the revision moved on
     */
    virtual Result<std::optional<ContextItem>> compareAndSwap(ContextItem item,
                                                              uint64_t expectedRevision) = 0;

    virtual Result<std::unique_ptr<ItemCursor>> scan(ScanSpec spec) = 0;

    // Hard delete; false if the id was unknown
    virtual Result<bool> remove(ItemId id) = 0;

    // Projects
    virtual Result<void> insertProject(const ContextProject& project) = 0;
    virtual Result<std::optional<ContextProject>> getProject(const std::string& id) = 0;
    virtual Result<void> updateProject(const ContextProject& project) = 0;
    virtual Result<bool> removeProject(const std::string& id) = 0;

    // All projects ordered by created_at, then id
    virtual Result<std::vector<ContextProject>> listProjects() = 0;
};

/**
 * @brief Map-backed store for tests and ephemeral engines
 */
class InMemoryItemStore : public ItemStore {
public:
    InMemoryItemStore();
    ~InMemoryItemStore() override;

    std::string backendName() const override { return "memory"; }

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

private:
    struct State;
    class Cursor;
    std::shared_ptr<State> state_;
};

/**
 * @brief Construct the store named by StorageSettings ("memory" or "sqlite")
 */
struct StoreOptions {
    std::string backend = "memory";
    std::string database_path = "cortex.db";
};

Result<std::unique_ptr<ItemStore>> createItemStore(const StoreOptions& options);

/**
 * @brief True when the item passes the pushdown part of a ScanSpec
 */
inline bool matchesPushdown(const ScanSpec& spec, const ContextItem& item) {
    if (spec.is_active && item.is_active != *spec.is_active)
        return false;
    if (spec.project_id && item.project_id != spec.project_id)
        return false;
    return true;
}

} // namespace cortex::context
