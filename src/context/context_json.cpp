#include <cortex/context/context_json.h>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace cortex::context {

using nlohmann::json;

namespace {

json metadataToJson(const MetadataMap& map) {
    json j = json::object();
    for (const auto& [key, value] : map) {
        j[key] = value;
    }
    return j;
}

MetadataMap metadataFromJson(const json& j) {
    MetadataMap map;
    if (j.is_null()) {
        return map;
    }
    if (!j.is_object()) {
        throw std::invalid_argument("metadata must be a JSON object");
    }
    for (const auto& [key, value] : j.items()) {
        // Non-string values are kept verbatim as their JSON text
        map[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return map;
}

std::optional<std::string> optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

TimePoint timestampField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return TimePoint{};
    }
    auto parsed = parseTimestamp(it->get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(parsed.error().message);
    }
    return parsed.value();
}

template <typename T, typename Fn> Result<T> guarded(Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return Error{ErrorCode::ValidationError, e.what()};
    }
}

} // namespace

std::string formatTimestamp(TimePoint tp) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    long millis = static_cast<long>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03ldZ", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

Result<TimePoint> parseTimestamp(std::string_view text) {
    std::tm tm{};
    int millis = 0;
    const std::string s(text);
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return Error{ErrorCode::InvalidArgument, "Invalid timestamp '" + s + "'"};
    }

    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (s[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }
    if (pos < s.size() && s[pos] != 'Z' && s[pos] != 'z') {
        return Error{ErrorCode::InvalidArgument, "Timestamp '" + s + "' must be UTC"};
    }

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    const std::time_t secs = timegm(&tm);
    return TimePoint{std::chrono::seconds(secs) + std::chrono::milliseconds(millis)};
}

void to_json(json& j, const ContentType& type) {
    j = std::string(contentTypeToString(type));
}

void from_json(const json& j, ContentType& type) {
    auto parsed = parseContentType(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(parsed.error().message);
    }
    type = parsed.value();
}

void to_json(json& j, const ContextItem& item) {
    j = json{{"id", item.id},
             {"title", item.title},
             {"content", item.content},
             {"content_type", item.content_type},
             {"tags", item.tags},
             {"extra_metadata", metadataToJson(item.extra_metadata)},
             {"source", item.source ? json(*item.source) : json(nullptr)},
             {"project_id", item.project_id ? json(*item.project_id) : json(nullptr)},
             {"is_active", item.is_active},
             {"created_at", formatTimestamp(item.created_at)},
             {"updated_at", formatTimestamp(item.updated_at)},
             {"has_vector", item.hasVector()}};
}

void from_json(const json& j, ContextItem& item) {
    item.id = j.value("id", ItemId{0});
    item.title = j.at("title").get<std::string>();
    item.content = j.value("content", std::string{});
    item.content_type = j.value("content_type", ContentType::Text);
    item.tags = j.value("tags", std::set<std::string>{});
    item.extra_metadata = metadataFromJson(j.value("extra_metadata", json(nullptr)));
    item.source = optionalString(j, "source");
    item.project_id = optionalString(j, "project_id");
    item.is_active = j.value("is_active", true);
    item.created_at = timestampField(j, "created_at");
    item.updated_at = timestampField(j, "updated_at");
    item.vector.reset();
    if (auto it = j.find("vector"); it != j.end() && !it->is_null()) {
        item.vector = it->get<std::vector<float>>();
    }
}

nlohmann::json toJson(const ContextItem& item, bool includeVector) {
    json j = item;
    if (includeVector && item.vector) {
        j["vector"] = *item.vector;
    }
    return j;
}

void to_json(json& j, const ContextProject& project) {
    j = json{{"id", project.id},
             {"name", project.name},
             {"description", project.description ? json(*project.description) : json(nullptr)},
             {"settings", metadataToJson(project.settings)},
             {"is_active", project.is_active},
             {"created_at", formatTimestamp(project.created_at)},
             {"updated_at", formatTimestamp(project.updated_at)}};
}

void from_json(const json& j, ContextProject& project) {
    project.id = j.at("id").get<std::string>();
    project.name = j.at("name").get<std::string>();
    project.description = optionalString(j, "description");
    project.settings = metadataFromJson(j.value("settings", json(nullptr)));
    project.is_active = j.value("is_active", true);
    project.created_at = timestampField(j, "created_at");
    project.updated_at = timestampField(j, "updated_at");
}

void to_json(json& j, const ContextStats& stats) {
    j = json{{"total_items", stats.total_items},
             {"active_items", stats.active_items},
             {"items_without_vector", stats.items_without_vector},
             {"content_types", stats.content_types},
             {"projects_count", stats.projects_count},
             {"embedding_dimension", stats.embedding_dimension},
             {"generated_at", formatTimestamp(stats.generated_at)}};
}

Result<ContextItemDraft> parseItemDraft(const json& j) {
    return guarded<ContextItemDraft>([&]() {
        if (!j.is_object()) {
            throw std::invalid_argument("item draft must be a JSON object");
        }
        ContextItemDraft draft;
        draft.title = j.at("title").get<std::string>();
        draft.content = j.value("content", std::string{});
        draft.content_type = j.value("content_type", ContentType::Text);
        draft.tags = j.value("tags", std::set<std::string>{});
        draft.extra_metadata = metadataFromJson(j.value("extra_metadata", json(nullptr)));
        draft.source = optionalString(j, "source");
        draft.project_id = optionalString(j, "project_id");
        return draft;
    });
}

Result<ContextItemPatch> parseItemPatch(const json& j) {
    return guarded<ContextItemPatch>([&]() {
        if (!j.is_object()) {
            throw std::invalid_argument("item patch must be a JSON object");
        }
        ContextItemPatch patch;
        if (j.contains("title"))
            patch.title = j["title"].get<std::string>();
        if (j.contains("content"))
            patch.content = j["content"].get<std::string>();
        if (j.contains("content_type"))
            patch.content_type = j["content_type"].get<ContentType>();
        if (j.contains("tags"))
            patch.tags = j["tags"].get<std::set<std::string>>();
        if (j.contains("extra_metadata"))
            patch.extra_metadata = metadataFromJson(j["extra_metadata"]);
        if (j.contains("source"))
            patch.source.emplace(optionalString(j, "source"));
        if (j.contains("project_id"))
            patch.project_id.emplace(optionalString(j, "project_id"));
        if (j.contains("is_active"))
            patch.is_active = j["is_active"].get<bool>();
        return patch;
    });
}

Result<ContextProjectDraft> parseProjectDraft(const json& j) {
    return guarded<ContextProjectDraft>([&]() {
        if (!j.is_object()) {
            throw std::invalid_argument("project draft must be a JSON object");
        }
        ContextProjectDraft draft;
        draft.id = j.at("id").get<std::string>();
        draft.name = j.at("name").get<std::string>();
        draft.description = optionalString(j, "description");
        draft.settings = metadataFromJson(j.value("settings", json(nullptr)));
        return draft;
    });
}

} // namespace cortex::context
