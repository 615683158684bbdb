#include <spdlog/spdlog.h>
#include <cortex/service/context_service.h>
#include <cortex/vector/embedding_generator.h>

#include <algorithm>

namespace cortex::service {

using context::ContextItem;
using context::ContextProject;

namespace {

vector::EmbeddingConfig toEmbeddingConfig(const config::EngineConfig& config) {
    vector::EmbeddingConfig embedding;
    embedding.embedding_dim = config.embeddings.dimension;
    embedding.model_name = config.embeddings.model_name;
    embedding.timeout = config.embeddings.timeout;
    embedding.num_threads = config.embeddings.threads;
    return embedding;
}

search::HybridRanker::Config toRankerConfig(const config::EngineConfig& config) {
    search::HybridRanker::Config ranker;
    ranker.default_semantic_weight = config.search.default_semantic_weight;
    ranker.embed_timeout = config.embeddings.timeout;
    ranker.scan_batch_size = config.search.scan_batch_size;
    ranker.max_limit = config.search.max_limit;
    return ranker;
}

Error projectNotFound(const std::string& id) {
    return Error{ErrorCode::NotFound, "Project '" + id + "' not found"};
}

} // namespace

ContextService::ContextService(const config::EngineConfig& config,
                               std::shared_ptr<context::ItemStore> store,
                               std::shared_ptr<vector::IEmbeddingBackend> backend)
    : config_(config), store_(std::move(store)),
      embedder_(std::make_shared<vector::EmbeddingGenerator>(std::move(backend),
                                                             toEmbeddingConfig(config))) {
    ranker_ = std::make_unique<search::HybridRanker>(store_, embedder_, toRankerConfig(config_));
    pipeline_ = std::make_unique<MutationPipeline>(
        store_, embedder_, MutationPipeline::Config{config_.mutation.max_conflict_retries});
}

ContextService::~ContextService() = default;

Result<ContextItem> ContextService::createItem(const context::ContextItemDraft& draft) {
    return pipeline_->create(draft);
}

Result<ContextItem> ContextService::getItem(ItemId id) {
    auto item = store_->get(id);
    if (!item)
        return item.error();
    if (!item.value() || !item.value()->is_active) {
        return Error{ErrorCode::NotFound, "Item " + std::to_string(id) + " not found"};
    }
    return *std::move(item).value();
}

Result<ContextItem> ContextService::updateItem(ItemId id, const context::ContextItemPatch& patch) {
    return pipeline_->update(id, patch);
}

Result<void> ContextService::softDeleteItem(ItemId id) {
    return pipeline_->softDelete(id);
}

Result<ContextItem> ContextService::restoreItem(ItemId id) {
    return pipeline_->restore(id);
}

Result<void> ContextService::hardDeleteItem(ItemId id) {
    return pipeline_->hardDelete(id);
}

Result<search::SearchResponse> ContextService::listItems(const search::SearchFilters& filters,
                                                         int64_t limit, int64_t offset) {
    search::SearchRequest request;
    request.mode = search::SearchMode::Hybrid;
    request.filters = filters;
    request.limit = limit;
    request.offset = offset;
    return ranker_->search(request);
}

Result<search::SearchResponse> ContextService::search(const search::SearchRequest& request,
                                                      std::stop_token stop) {
    return ranker_->search(request, std::move(stop));
}

Result<search::SearchResponse>
ContextService::search(const std::string& query, search::SearchMode mode,
                       const search::SearchFilters& filters, float semantic_weight, int64_t limit,
                       int64_t offset) {
    search::SearchRequest request;
    request.query = query;
    request.mode = mode;
    request.filters = filters;
    request.semantic_weight = semantic_weight;
    request.limit = limit;
    request.offset = offset;
    return ranker_->search(request);
}

Result<ContextProject> ContextService::createProject(const context::ContextProjectDraft& draft) {
    if (auto valid = context::validateProjectDraft(draft); !valid) {
        return valid.error();
    }

    ContextProject project;
    project.id = draft.id;
    project.name = draft.name;
    project.description = draft.description;
    project.settings = draft.settings;
    project.is_active = true;
    project.created_at = context::currentTimestamp();
    project.updated_at = project.created_at;

    if (auto inserted = store_->insertProject(project); !inserted) {
        return inserted.error();
    }
    spdlog::debug("Created project '{}'", project.id);
    return project;
}

Result<ContextProject> ContextService::getProject(const std::string& id) {
    auto project = store_->getProject(id);
    if (!project)
        return project.error();
    if (!project.value())
        return projectNotFound(id);
    return *std::move(project).value();
}

Result<std::vector<ContextProject>> ContextService::listProjects(int64_t limit, int64_t offset) {
    if (limit < 0 || offset < 0) {
        return Error{ErrorCode::InvalidQuery, "limit and offset must be >= 0"};
    }

    auto all = store_->listProjects();
    if (!all)
        return all.error();

    std::vector<ContextProject> page;
    int64_t index = 0;
    for (auto& project : all.value()) {
        if (!project.is_active)
            continue;
        if (index++ < offset)
            continue;
        if (static_cast<int64_t>(page.size()) >= limit)
            break;
        page.push_back(std::move(project));
    }
    return page;
}

Result<ContextProject> ContextService::updateProject(const std::string& id,
                                                     const context::ContextProjectPatch& patch) {
    auto current = getProject(id);
    if (!current)
        return current.error();

    ContextProject project = std::move(current).value();
    if (patch.name) {
        if (patch.name->find_first_not_of(" \t\r\n") == std::string::npos) {
            return Error{ErrorCode::ValidationError, "Project name must not be empty"};
        }
        project.name = *patch.name;
    }
    if (patch.description)
        project.description = *patch.description;
    if (patch.settings)
        project.settings = *patch.settings;
    if (patch.is_active)
        project.is_active = *patch.is_active;
    project.updated_at = context::currentTimestamp();

    if (auto updated = store_->updateProject(project); !updated) {
        return updated.error();
    }
    return project;
}

Result<void> ContextService::deleteProject(const std::string& id) {
    auto removed = store_->removeProject(id);
    if (!removed)
        return removed.error();
    if (!removed.value())
        return projectNotFound(id);
    spdlog::info("Deleted project '{}'", id);
    return {};
}

Result<context::ContextStats> ContextService::stats(const std::optional<std::string>& project_id) {
    context::ContextStats stats;
    stats.embedding_dimension = config_.embeddings.dimension;
    stats.generated_at = context::currentTimestamp();

    context::ScanSpec spec;
    spec.is_active = std::nullopt;
    spec.project_id = project_id;
    auto cursorResult = store_->scan(std::move(spec));
    if (!cursorResult)
        return cursorResult.error();
    auto cursor = std::move(cursorResult).value();

    while (true) {
        auto next = cursor->next();
        if (!next)
            return next.error();
        if (!next.value())
            break;

        const ContextItem& item = *next.value();
        ++stats.total_items;
        if (!item.is_active)
            continue;
        ++stats.active_items;
        ++stats.content_types[std::string(context::contentTypeToString(item.content_type))];
        if (!item.hasVector(stats.embedding_dimension))
            ++stats.items_without_vector;
    }

    auto projects = store_->listProjects();
    if (!projects)
        return projects.error();
    stats.projects_count = static_cast<size_t>(
        std::count_if(projects.value().begin(), projects.value().end(),
                      [](const ContextProject& p) { return p.is_active; }));
    return stats;
}

Result<ContextItem> ContextService::reembed(ItemId id) {
    return pipeline_->reembed(id);
}

Result<size_t> ContextService::reembedMissing(std::stop_token stop) {
    return pipeline_->reembedMissing(std::move(stop));
}

Result<std::unique_ptr<ContextService>> createContextService(const config::EngineConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    config::applyLogging(config);

    auto backend =
        vector::createEmbeddingBackend(config.embeddings.backend, config.embeddings.dimension);
    if (!backend)
        return backend.error();

    context::StoreOptions options;
    options.backend =
        config.storage.backend == config::StorageSettings::Backend::Sqlite ? "sqlite" : "memory";
    options.database_path = config.storage.database_path;
    auto store = context::createItemStore(options);
    if (!store)
        return store.error();

    spdlog::info("Context service ready: {} store, {} embeddings (dim {})", options.backend,
                 config.embeddings.backend, config.embeddings.dimension);
    return std::make_unique<ContextService>(
        config, std::shared_ptr<context::ItemStore>(std::move(store).value()),
        std::move(backend).value());
}

} // namespace cortex::service
