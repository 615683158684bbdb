#include <cortex/search/search_filters.h>

#include <algorithm>

namespace cortex::search {

bool SearchFilters::matches(const context::ContextItem& item) const {
    if (!include_inactive && !item.is_active) {
        return false;
    }
    if (project_id && item.project_id != project_id) {
        return false;
    }
    if (source && item.source != source) {
        return false;
    }
    if (!content_types.empty() && !content_types.count(item.content_type)) {
        return false;
    }
    if (!tags.empty()) {
        const bool anyTag = std::any_of(tags.begin(), tags.end(), [&](const std::string& tag) {
            return item.tags.count(tag) > 0;
        });
        if (!anyTag) {
            return false;
        }
    }
    return true;
}

context::ScanSpec SearchFilters::toScanSpec() const {
    context::ScanSpec spec;
    spec.is_active = include_inactive ? std::nullopt : std::optional<bool>(true);
    spec.project_id = project_id;
    if (source || !content_types.empty() || !tags.empty()) {
        spec.predicate = [filters = *this](const context::ContextItem& item) {
            return filters.matches(item);
        };
    }
    return spec;
}

} // namespace cortex::search
