#pragma once

#include <cortex/core/types.h>
#include <cortex/search/hybrid_ranker.h>

#include <nlohmann/json.hpp>

namespace cortex::search {

void to_json(nlohmann::json& j, const SearchMode& mode);
void from_json(const nlohmann::json& j, SearchMode& mode);

void to_json(nlohmann::json& j, const ScoredItem& scored);
void to_json(nlohmann::json& j, const SearchResponse& response);

/**
 * @brief Map a request body onto SearchRequest
 *
 * Recognised keys: query, mode, semantic_weight, project_id, source, content_types, tags,
 * include_inactive, limit, offset. A bad mode or a non-numeric limit, offset or weight yields
 * ErrorCode::InvalidQuery; range checks are left to HybridRanker.
 */
Result<SearchRequest> parseSearchRequest(const nlohmann::json& j, int64_t defaultLimit = 50);

} // namespace cortex::search
