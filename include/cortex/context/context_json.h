#pragma once

#include <cortex/context/context_item.h>
#include <cortex/core/types.h>

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace cortex::context {

// ISO-8601 UTC with millisecond precision, e.g. 2024-03-01T12:30:00.250Z
std::string formatTimestamp(TimePoint tp);
Result<TimePoint> parseTimestamp(std::string_view text);

void to_json(nlohmann::json& j, const ContentType& type);
void from_json(const nlohmann::json& j, ContentType& type);

// Omits the vector; use toJson(item, true) to include it
void to_json(nlohmann::json& j, const ContextItem& item);
void from_json(const nlohmann::json& j, ContextItem& item);

void to_json(nlohmann::json& j, const ContextProject& project);
void from_json(const nlohmann::json& j, ContextProject& project);

void to_json(nlohmann::json& j, const ContextStats& stats);

nlohmann::json toJson(const ContextItem& item, bool includeVector);

/**
 * @brief Adapter-facing parsers returning ValidationError instead of throwing.
 *
 * In a patch an explicit null for source or project_id clears the field, while an absent key
 * leaves it untouched.
 */
Result<ContextItemDraft> parseItemDraft(const nlohmann::json& j);
Result<ContextItemPatch> parseItemPatch(const nlohmann::json& j);
Result<ContextProjectDraft> parseProjectDraft(const nlohmann::json& j);

} // namespace cortex::context
