#include <cortex/context/context_item.h>

#include <algorithm>
#include <cctype>

namespace cortex::context {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

Result<ContentType> parseContentType(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "text")
        return ContentType::Text;
    if (lowered == "code")
        return ContentType::Code;
    if (lowered == "markdown")
        return ContentType::Markdown;
    if (lowered == "json")
        return ContentType::Json;

    return Error{ErrorCode::ValidationError, "Unknown content type '" + std::string(name) +
                                                 "' (expected text, code, markdown or json)"};
}

Result<void> validateDraft(const ContextItemDraft& draft) {
    if (isBlank(draft.title)) {
        return Error{ErrorCode::ValidationError, "Item title must not be empty"};
    }
    if (draft.project_id && draft.project_id->empty()) {
        return Error{ErrorCode::ValidationError, "project_id must not be an empty string"};
    }
    for (const auto& tag : draft.tags) {
        if (tag.empty()) {
            return Error{ErrorCode::ValidationError, "Tags must not be empty strings"};
        }
    }
    return {};
}

Result<void> validatePatch(const ContextItemPatch& patch) {
    if (patch.title && isBlank(*patch.title)) {
        return Error{ErrorCode::ValidationError, "Item title must not be empty"};
    }
    if (patch.project_id && *patch.project_id && (*patch.project_id)->empty()) {
        return Error{ErrorCode::ValidationError, "project_id must not be an empty string"};
    }
    if (patch.tags) {
        for (const auto& tag : *patch.tags) {
            if (tag.empty()) {
                return Error{ErrorCode::ValidationError, "Tags must not be empty strings"};
            }
        }
    }
    return {};
}

Result<void> validateProjectDraft(const ContextProjectDraft& draft) {
    if (isBlank(draft.id)) {
        return Error{ErrorCode::ValidationError, "Project id must not be empty"};
    }
    if (isBlank(draft.name)) {
        return Error{ErrorCode::ValidationError, "Project name must not be empty"};
    }
    return {};
}

TimePoint currentTimestamp() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

void applyMetadataPatch(ContextItem& item, const ContextItemPatch& patch) {
    if (patch.title)
        item.title = *patch.title;
    if (patch.content_type)
        item.content_type = *patch.content_type;
    if (patch.tags)
        item.tags = *patch.tags;
    if (patch.extra_metadata)
        item.extra_metadata = *patch.extra_metadata;
    if (patch.source)
        item.source = *patch.source;
    if (patch.project_id)
        item.project_id = *patch.project_id;
    if (patch.is_active)
        item.is_active = *patch.is_active;
}

} // namespace cortex::context
