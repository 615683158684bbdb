#include <spdlog/spdlog.h>
#include <cortex/service/mutation_pipeline.h>
#include <cortex/vector/embedding_generator.h>

namespace cortex::service {

using context::ContextItem;

namespace {

Error notFound(ItemId id) {
    return Error{ErrorCode::NotFound, "Item " + std::to_string(id) + " not found"};
}

/**
 * Read-modify-CAS loop. build() derives the new item from the latest snapshot and may be
 * invoked once per attempt.
 */
template <typename Fn>
Result<ContextItem> casLoop(context::ItemStore& store, ItemId id, size_t retries, Fn&& build) {
    for (size_t attempt = 0; attempt <= retries; ++attempt) {
        auto snapshot = store.get(id);
        if (!snapshot)
            return snapshot.error();
        if (!snapshot.value())
            return notFound(id);

        const ContextItem& current = *snapshot.value();
        auto next = build(current);
        if (!next)
            return next.error();

        auto swapped = store.compareAndSwap(std::move(next).value(), current.revision);
        if (!swapped)
            return swapped.error();
        if (swapped.value())
            return *std::move(swapped).value();

        spdlog::debug("Item {} changed concurrently, retrying ({}/{})", id, attempt + 1,
                      retries);
    }
    return Error{ErrorCode::Conflict, "Item " + std::to_string(id) + " kept changing after " +
                                          std::to_string(retries) + " retries"};
}

} // namespace

MutationPipeline::MutationPipeline(std::shared_ptr<context::ItemStore> store,
                                   std::shared_ptr<vector::EmbeddingGenerator> embedder,
                                   const Config& config)
    : store_(std::move(store)), embedder_(std::move(embedder)), config_(config) {}

Result<std::vector<float>> MutationPipeline::embed(const std::string& content) {
    if (!embedder_) {
        return Error{ErrorCode::EmbeddingUnavailable, "No embedding generator configured"};
    }
    return embedder_->generateEmbeddingWithTimeout(content);
}

Result<ContextItem> MutationPipeline::create(const context::ContextItemDraft& draft) {
    if (auto valid = context::validateDraft(draft); !valid) {
        return valid.error();
    }

    ContextItem item;
    item.title = draft.title;
    item.content = draft.content;
    item.content_type = draft.content_type;
    item.tags = draft.tags;
    item.extra_metadata = draft.extra_metadata;
    item.source = draft.source;
    item.project_id = draft.project_id;
    item.is_active = true;
    item.created_at = context::currentTimestamp();
    item.updated_at = item.created_at;

    auto embedding = embed(item.content);
    if (embedding) {
        item.vector = std::move(embedding).value();
    }

    auto stored = store_->insert(std::move(item));
    if (!stored) {
        return stored.error();
    }
    if (!embedding) {
        spdlog::warn("Item {} stored without vector: {}", stored.value().id,
                     embedding.error().message);
    }
    spdlog::debug("Created item {} ('{}')", stored.value().id, stored.value().title);
    return stored;
}

Result<ContextItem> MutationPipeline::update(ItemId id, const context::ContextItemPatch& patch) {
    if (auto valid = context::validatePatch(patch); !valid) {
        return valid.error();
    }

    // Carried across CAS attempts so a retry with the same new content does not embed twice
    std::optional<std::string> embeddedContent;
    std::optional<std::vector<float>> embeddedVector;

    auto result = casLoop(*store_, id, config_.max_conflict_retries,
                          [&](const ContextItem& current) -> Result<ContextItem> {
                              ContextItem next = current;
                              context::applyMetadataPatch(next, patch);

                              if (patch.content && *patch.content != current.content) {
                                  next.content = *patch.content;
                                  if (embeddedContent != next.content) {
                                      auto embedding = embed(next.content);
                                      if (embedding) {
                                          embeddedVector = std::move(embedding).value();
                                      } else {
                                          spdlog::warn("Re-embedding item {} failed, vector "
                                                       "cleared: {}",
                                                       id, embedding.error().message);
                                          embeddedVector.reset();
                                      }
                                      embeddedContent = next.content;
                                  }
                                  next.vector = embeddedVector;
                              }

                              next.updated_at = context::currentTimestamp();
                              return next;
                          });
    if (result) {
        spdlog::debug("Updated item {} (revision {})", id, result.value().revision);
    }
    return result;
}

Result<void> MutationPipeline::softDelete(ItemId id) {
    auto result = casLoop(*store_, id, config_.max_conflict_retries,
                          [](const ContextItem& current) -> Result<ContextItem> {
                              ContextItem next = current;
                              next.is_active = false;
                              next.updated_at = context::currentTimestamp();
                              return next;
                          });
    if (!result) {
        return result.error();
    }
    spdlog::debug("Soft-deleted item {}", id);
    return {};
}

Result<ContextItem> MutationPipeline::restore(ItemId id) {
    return casLoop(*store_, id, config_.max_conflict_retries,
                   [](const ContextItem& current) -> Result<ContextItem> {
                       ContextItem next = current;
                       next.is_active = true;
                       next.updated_at = context::currentTimestamp();
                       return next;
                   });
}

Result<void> MutationPipeline::hardDelete(ItemId id) {
    auto removed = store_->remove(id);
    if (!removed) {
        return removed.error();
    }
    if (!removed.value()) {
        return notFound(id);
    }
    spdlog::info("Hard-deleted item {}", id);
    return {};
}

Result<ContextItem> MutationPipeline::reembed(ItemId id) {
    return casLoop(*store_, id, config_.max_conflict_retries,
                   [&](const ContextItem& current) -> Result<ContextItem> {
                       auto embedding = embed(current.content);
                       if (!embedding) {
                           return embedding.error();
                       }
                       ContextItem next = current;
                       next.vector = std::move(embedding).value();
                       next.updated_at = context::currentTimestamp();
                       return next;
                   });
}

Result<size_t> MutationPipeline::reembedMissing(std::stop_token stop) {
    context::ScanSpec spec;
    spec.is_active = true;
    // Vectors left over from another embedding dimension are repaired as well
    const size_t dimension = embedder_ ? embedder_->getEmbeddingDimension() : 0;
    spec.predicate = [dimension](const ContextItem& item) { return !item.hasVector(dimension); };

    auto cursorResult = store_->scan(std::move(spec));
    if (!cursorResult) {
        return cursorResult.error();
    }
    auto cursor = std::move(cursorResult).value();

    size_t repaired = 0;
    size_t failed = 0;
    while (!stop.stop_requested()) {
        auto next = cursor->next();
        if (!next) {
            return next.error();
        }
        if (!next.value()) {
            break;
        }

        ContextItem item = std::move(*next.value());
        auto embedding = embed(item.content);
        if (!embedding) {
            ++failed;
            spdlog::warn("Item {} still has no vector: {}", item.id, embedding.error().message);
            continue;
        }

        const uint64_t expected = item.revision;
        item.vector = std::move(embedding).value();
        item.updated_at = context::currentTimestamp();
        auto swapped = store_->compareAndSwap(std::move(item), expected);
        if (!swapped) {
            if (swapped.error().code == ErrorCode::NotFound) {
                continue; // Hard-deleted while we were embedding
            }
            return swapped.error();
        }
        // A lost race means a concurrent writer already published a newer state
        if (swapped.value()) {
            ++repaired;
        }
    }

    if (stop.stop_requested()) {
        spdlog::info("Re-embedding stopped early: {} repaired, {} failed", repaired, failed);
    } else {
        spdlog::info("Re-embedding finished: {} repaired, {} failed", repaired, failed);
    }
    return repaired;
}

} // namespace cortex::service
