#pragma once

#include <cortex/config/engine_config.h>
#include <cortex/context/context_item.h>
#include <cortex/context/item_store.h>
#include <cortex/core/types.h>
#include <cortex/search/hybrid_ranker.h>
#include <cortex/service/mutation_pipeline.h>

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace cortex::vector {
class IEmbeddingBackend;
class EmbeddingGenerator;
} // namespace cortex::vector

namespace cortex::service {

/**
 * @brief Entry points consumed by routing adapters (HTTP, RPC, CLI)
 *
 * Owns the embedding generator, the hybrid ranker and the mutation pipeline over one shared
 * item store. All methods are safe to call concurrently.
 */
class ContextService {
public:
    ContextService(const config::EngineConfig& config, std::shared_ptr<context::ItemStore> store,
                   std::shared_ptr<vector::IEmbeddingBackend> backend);
    ~ContextService();

    ContextService(const ContextService&) = delete;
    ContextService& operator=(const ContextService&) = delete;

    // Items
    Result<context::ContextItem> createItem(const context::ContextItemDraft& draft);
    // NotFound when the item is absent or soft-deleted
    Result<context::ContextItem> getItem(ItemId id);
    Result<context::ContextItem> updateItem(ItemId id, const context::ContextItemPatch& patch);
    Result<void> softDeleteItem(ItemId id);
    Result<context::ContextItem> restoreItem(ItemId id);
    Result<void> hardDeleteItem(ItemId id);

    /**
     * @brief Filter-only listing, newest first (created_at desc, then id desc)
     */
    Result<search::SearchResponse> listItems(const search::SearchFilters& filters, int64_t limit,
                                             int64_t offset);

    // Search
    Result<search::SearchResponse> search(const search::SearchRequest& request,
                                          std::stop_token stop = {});
    Result<search::SearchResponse> search(const std::string& query, search::SearchMode mode,
                                          const search::SearchFilters& filters,
                                          float semantic_weight, int64_t limit, int64_t offset);

    // Projects
    Result<context::ContextProject> createProject(const context::ContextProjectDraft& draft);
    Result<context::ContextProject> getProject(const std::string& id);
    // Active projects ordered by created_at, then id
    Result<std::vector<context::ContextProject>> listProjects(int64_t limit, int64_t offset);
    Result<context::ContextProject> updateProject(const std::string& id,
                                                  const context::ContextProjectPatch& patch);
    // Hard delete; items keep their project_id
    Result<void> deleteProject(const std::string& id);

    // Maintenance
    Result<context::ContextStats> stats(const std::optional<std::string>& project_id = {});
    Result<context::ContextItem> reembed(ItemId id);
    Result<size_t> reembedMissing(std::stop_token stop = {});

    const config::EngineConfig& getConfig() const { return config_; }
    context::ItemStore& store() { return *store_; }

private:
    config::EngineConfig config_;
    std::shared_ptr<context::ItemStore> store_;
    std::shared_ptr<vector::EmbeddingGenerator> embedder_;
    std::unique_ptr<search::HybridRanker> ranker_;
    std::unique_ptr<MutationPipeline> pipeline_;
};

/**
 * @brief Build a service from configuration: validates it, creates the configured embedding
 * backend and opens the configured item store.
 */
Result<std::unique_ptr<ContextService>> createContextService(const config::EngineConfig& config);

} // namespace cortex::service
