#pragma once

#include <cortex/context/context_item.h>
#include <cortex/context/item_store.h>

#include <optional>
#include <set>
#include <string>

namespace cortex::search {

/**
 * @brief Candidate filters for search and listing
 *
 * Dimensions combine with AND. Within content_types and tags an item matches if it has any of
 * the listed values; an empty set leaves that dimension unconstrained.
 */
struct SearchFilters {
    std::optional<std::string> project_id;
    std::optional<std::string> source;
    std::set<context::ContentType> content_types;
    std::set<std::string> tags;
    bool include_inactive = false;

    bool matches(const context::ContextItem& item) const;

    // is_active and project_id go to the store; the rest becomes the scan predicate
    context::ScanSpec toScanSpec() const;
};

} // namespace cortex::search
