#pragma once

#include <cortex/context/context_item.h>
#include <cortex/context/item_store.h>
#include <cortex/core/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace cortex::vector {
class EmbeddingGenerator;
}

namespace cortex::service {

/**
 * @brief Write path for items: decides when to (re)embed and publishes atomically.
 *
 * Create always embeds. Update re-embeds only when the content actually changes; metadata
 * edits keep the stored vector byte-for-byte. Embedding runs with no store lock held and the
 * result is published together with the content through ItemStore::compareAndSwap, retrying on
 * a lost race. An EmbeddingUnavailable failure never fails the write: the item is stored
 * without a vector, a warning is logged, and reembedMissing() can repair it later.
 */
class MutationPipeline {
public:
    struct Config {
        size_t max_conflict_retries = 3;
    };

    MutationPipeline(std::shared_ptr<context::ItemStore> store,
                     std::shared_ptr<vector::EmbeddingGenerator> embedder, const Config& config);

    Result<context::ContextItem> create(const context::ContextItemDraft& draft);

    // ErrorCode::NotFound if id is absent
    Result<context::ContextItem> update(ItemId id, const context::ContextItemPatch& patch);

    Result<void> softDelete(ItemId id);
    Result<context::ContextItem> restore(ItemId id);
    Result<void> hardDelete(ItemId id);

    // Recompute one vector; unlike create/update an embedding failure is returned
    Result<context::ContextItem> reembed(ItemId id);

    // Repair active items stored without a vector; returns how many were repaired
    Result<size_t> reembedMissing(std::stop_token stop = {});

private:
    Result<std::vector<float>> embed(const std::string& content);

    std::shared_ptr<context::ItemStore> store_;
    std::shared_ptr<vector::EmbeddingGenerator> embedder_;
    Config config_;
};

} // namespace cortex::service
