#include <cortex/context/context_json.h>
#include <cortex/search/search_json.h>

#include <stdexcept>

namespace cortex::search {

using nlohmann::json;

void to_json(json& j, const SearchMode& mode) {
    j = std::string(searchModeToString(mode));
}

void from_json(const json& j, SearchMode& mode) {
    auto parsed = parseSearchMode(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(parsed.error().message);
    }
    mode = parsed.value();
}

void to_json(json& j, const ScoredItem& scored) {
    j = context::toJson(scored.item, false);
    j["combined_score"] = scored.combined_score;
    j["semantic_score"] = scored.semantic_score;
    j["keyword_score"] = scored.keyword_score;
}

void to_json(json& j, const SearchResponse& response) {
    j = json{{"items", response.items},
             {"total", response.total},
             {"execution_time_ms", response.execution_time_ms},
             {"query", response.query},
             {"limit", response.limit},
             {"offset", response.offset},
             {"mode", response.requested_mode},
             {"effective_mode", response.effective_mode},
             {"degraded", response.degraded},
             {"warnings", response.warnings}};
}

Result<SearchRequest> parseSearchRequest(const json& j, int64_t defaultLimit) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidQuery, "Search request must be a JSON object"};
    }

    SearchRequest request;
    request.limit = defaultLimit;
    try {
        request.query = j.value("query", std::string{});
        if (auto it = j.find("mode"); it != j.end()) {
            auto mode = parseSearchMode(it->get<std::string>());
            if (!mode)
                return mode.error();
            request.mode = mode.value();
        }
        if (auto it = j.find("semantic_weight"); it != j.end() && !it->is_null()) {
            request.semantic_weight = it->get<float>();
        }
        if (auto it = j.find("limit"); it != j.end() && !it->is_null()) {
            request.limit = it->get<int64_t>();
        }
        if (auto it = j.find("offset"); it != j.end() && !it->is_null()) {
            request.offset = it->get<int64_t>();
        }

        auto& filters = request.filters;
        if (auto it = j.find("project_id"); it != j.end() && !it->is_null()) {
            filters.project_id = it->get<std::string>();
        }
        if (auto it = j.find("source"); it != j.end() && !it->is_null()) {
            filters.source = it->get<std::string>();
        }
        if (auto it = j.find("content_types"); it != j.end() && !it->is_null()) {
            for (const auto& type : *it) {
                filters.content_types.insert(type.get<context::ContentType>());
            }
        }
        if (auto it = j.find("tags"); it != j.end() && !it->is_null()) {
            filters.tags = it->get<std::set<std::string>>();
        }
        filters.include_inactive = j.value("include_inactive", false);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidQuery, std::string("Malformed search request: ") + e.what()};
    }
    return request;
}

} // namespace cortex::search
