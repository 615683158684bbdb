#pragma once

#include <cortex/core/types.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cortex::context {

/**
 * @brief Kind of content stored in an item; a filter dimension only
 */
enum class ContentType { Text, Code, Markdown, Json };

constexpr std::string_view contentTypeToString(ContentType type) {
    switch (type) {
        case ContentType::Text: return "text";
        case ContentType::Code: return "code";
        case ContentType::Markdown: return "markdown";
        case ContentType::Json: return "json";
    }
    return "text";
}

Result<ContentType> parseContentType(std::string_view name);

/**
 * @brief Opaque string-keyed map passed through unmodified (extra_metadata, settings)
 */
using MetadataMap = std::map<std::string, std::string>;

/**
 * @brief A stored context snippet
 *
 * vector is either absent or exactly D components computed from the current content.
 * revision increases on every write and backs compare-and-swap in the item stores.
 */
struct ContextItem {
    ItemId id = 0;
    std::string title;
    std::string content;
    ContentType content_type = ContentType::Text;
    std::set<std::string> tags;
    MetadataMap extra_metadata;
    std::optional<std::string> source;
    std::optional<std::string> project_id; // Weak reference to ContextProject::id
    bool is_active = true;
    TimePoint created_at{};
    TimePoint updated_at{};
    std::optional<std::vector<float>> vector;
    uint64_t revision = 0;

    bool hasVector() const { return vector.has_value(); }
    // A vector of any other length was written under a different dimension and counts as absent
    bool hasVector(size_t dimension) const { return vector && vector->size() == dimension; }
};

/**
 * @brief Fields supplied when creating an item
 */
struct ContextItemDraft {
    std::string title;
    std::string content;
    ContentType content_type = ContentType::Text;
    std::set<std::string> tags;
    MetadataMap extra_metadata;
    std::optional<std::string> source;
    std::optional<std::string> project_id;
};

/**
 * @brief Partial update; unset fields are left untouched.
 * For source and project_id an engaged outer optional holding nullopt clears the field.
 */
struct ContextItemPatch {
    std::optional<std::string> title;
    std::optional<std::string> content;
    std::optional<ContentType> content_type;
    std::optional<std::set<std::string>> tags;
    std::optional<MetadataMap> extra_metadata;
    std::optional<std::optional<std::string>> source;
    std::optional<std::optional<std::string>> project_id;
    std::optional<bool> is_active;

    bool empty() const {
        return !title && !content && !content_type && !tags && !extra_metadata && !source &&
               !project_id && !is_active;
    }
};

/**
 * @brief A named grouping of items with a user-chosen, immutable id
 */
struct ContextProject {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    MetadataMap settings;
    bool is_active = true;
    TimePoint created_at{};
    TimePoint updated_at{};
};

struct ContextProjectDraft {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    MetadataMap settings;
};

struct ContextProjectPatch {
    std::optional<std::string> name;
    std::optional<std::optional<std::string>> description;
    std::optional<MetadataMap> settings;
    std::optional<bool> is_active;
};

/**
 * @brief Aggregate counts reported by ContextService::stats
 */
struct ContextStats {
    size_t total_items = 0;  // Rows held by the store, active or not
    size_t active_items = 0;
    size_t items_without_vector = 0; // Active items awaiting an embedding
    std::map<std::string, size_t> content_types;
    size_t projects_count = 0;
    size_t embedding_dimension = 0;
    TimePoint generated_at{};
};

/**
 * @brief Basic field validation shared by the mutation paths
 */
Result<void> validateDraft(const ContextItemDraft& draft);
Result<void> validatePatch(const ContextItemPatch& patch);
Result<void> validateProjectDraft(const ContextProjectDraft& draft);

/**
 * @brief Wall clock truncated to milliseconds, the precision items are stored and serialized at
 */
TimePoint currentTimestamp();

/**
 * @brief Apply the metadata portion of a patch (everything except content)
 */
void applyMetadataPatch(ContextItem& item, const ContextItemPatch& patch);

} // namespace cortex::context
