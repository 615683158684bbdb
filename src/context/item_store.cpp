#include <spdlog/spdlog.h>
#include <cortex/context/item_store.h>
#include <cortex/context/sqlite_item_store.h>

namespace cortex::context {

Result<std::unique_ptr<ItemStore>> createItemStore(const StoreOptions& options) {
    if (options.backend == "memory") {
        spdlog::debug("Using in-memory item store");
        return std::unique_ptr<ItemStore>(std::make_unique<InMemoryItemStore>());
    }
    if (options.backend == "sqlite") {
        auto store = SqliteItemStore::open(options.database_path);
        if (!store)
            return store.error();
        return std::unique_ptr<ItemStore>(std::move(store).value());
    }
    return Error{ErrorCode::NotSupported, "Unknown storage backend '" + options.backend + "'"};
}

} // namespace cortex::context
