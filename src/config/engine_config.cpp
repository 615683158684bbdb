#include <spdlog/spdlog.h>
#include <cortex/config/config_helpers.h>
#include <cortex/config/engine_config.h>

#include <cstdlib>
#include <stdexcept>

namespace cortex::config {

namespace {

Result<int64_t> parseInteger(const std::string& section, const std::string& key,
                             const std::string& raw) {
    try {
        size_t consumed = 0;
        auto value = std::stoll(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument(raw);
        }
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid integer for [" + section + "] " + key + ": '" + raw + "'"};
    }
}

Result<float> parseFloat(const std::string& section, const std::string& key,
                         const std::string& raw) {
    try {
        size_t consumed = 0;
        auto value = std::stof(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument(raw);
        }
        return value;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid number for [" + section + "] " + key + ": '" + raw + "'"};
    }
}

// Reads an integer key if present; leaves target untouched otherwise
template <typename T>
Result<void> readInteger(const std::filesystem::path& path, const std::string& section,
                         const std::string& key, T& target) {
    auto raw = parse_config_value(path, section, key);
    if (raw.empty()) {
        return {};
    }
    auto parsed = parseInteger(section, key, raw);
    if (!parsed) {
        return parsed.error();
    }
    if (parsed.value() < 0) {
        return Error{ErrorCode::InvalidArgument,
                     "Negative value for [" + section + "] " + key + ": '" + raw + "'"};
    }
    target = static_cast<T>(parsed.value());
    return {};
}

} // namespace

Result<void> EngineConfig::validate() const {
    if (embeddings.dimension == 0) {
        return Error{ErrorCode::InvalidArgument, "embeddings.dimension must be positive"};
    }
    if (embeddings.timeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "embeddings.timeout_ms must be positive"};
    }
    if (embeddings.threads == 0) {
        return Error{ErrorCode::InvalidArgument, "embeddings.threads must be positive"};
    }
    if (embeddings.backend != "hashing") {
        return Error{ErrorCode::InvalidArgument,
                     "Unknown embeddings.backend '" + embeddings.backend + "'"};
    }
    if (!(search.default_semantic_weight >= 0.0f && search.default_semantic_weight <= 1.0f)) {
        return Error{ErrorCode::InvalidArgument,
                     "search.default_semantic_weight must be within [0, 1]"};
    }
    if (search.max_limit <= 0) {
        return Error{ErrorCode::InvalidArgument, "search.max_limit must be positive"};
    }
    if (search.default_limit < 0 || search.default_limit > search.max_limit) {
        return Error{ErrorCode::InvalidArgument,
                     "search.default_limit must be within [0, search.max_limit]"};
    }
    if (search.scan_batch_size == 0) {
        return Error{ErrorCode::InvalidArgument, "search.scan_batch_size must be positive"};
    }
    if (storage.backend == StorageSettings::Backend::Sqlite && storage.database_path.empty()) {
        return Error{ErrorCode::InvalidArgument, "storage.database_path is required for sqlite"};
    }
    return {};
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& config_path) {
    EngineConfig config;

    if (!config_path.empty() && std::filesystem::exists(config_path)) {
        spdlog::debug("Loading engine config from {}", config_path.string());

        if (auto r = readInteger(config_path, "embeddings", "dimension",
                                 config.embeddings.dimension);
            !r) {
            return r.error();
        }
        if (auto r = readInteger(config_path, "embeddings", "threads", config.embeddings.threads);
            !r) {
            return r.error();
        }
        int64_t timeoutMs = config.embeddings.timeout.count();
        if (auto r = readInteger(config_path, "embeddings", "timeout_ms", timeoutMs); !r) {
            return r.error();
        }
        config.embeddings.timeout = std::chrono::milliseconds(timeoutMs);

        if (auto backend = parse_config_value(config_path, "embeddings", "backend");
            !backend.empty()) {
            config.embeddings.backend = backend;
        }
        if (auto model = parse_config_value(config_path, "embeddings", "model_name");
            !model.empty()) {
            config.embeddings.model_name = model;
        }

        if (auto raw = parse_config_value(config_path, "search", "default_semantic_weight");
            !raw.empty()) {
            auto weight = parseFloat("search", "default_semantic_weight", raw);
            if (!weight) {
                return weight.error();
            }
            config.search.default_semantic_weight = weight.value();
        }
        if (auto r = readInteger(config_path, "search", "default_limit",
                                 config.search.default_limit);
            !r) {
            return r.error();
        }
        if (auto r = readInteger(config_path, "search", "max_limit", config.search.max_limit);
            !r) {
            return r.error();
        }
        if (auto r = readInteger(config_path, "search", "scan_batch_size",
                                 config.search.scan_batch_size);
            !r) {
            return r.error();
        }

        if (auto backend = parse_config_value(config_path, "storage", "backend");
            !backend.empty()) {
            if (backend == "memory") {
                config.storage.backend = StorageSettings::Backend::Memory;
            } else if (backend == "sqlite") {
                config.storage.backend = StorageSettings::Backend::Sqlite;
            } else {
                return Error{ErrorCode::InvalidArgument,
                             "Unknown storage.backend '" + backend + "'"};
            }
        }
        if (auto path = parse_config_value(config_path, "storage", "database_path");
            !path.empty()) {
            config.storage.database_path = expand_tilde(path).string();
        }

        if (auto r = readInteger(config_path, "mutation", "max_conflict_retries",
                                 config.mutation.max_conflict_retries);
            !r) {
            return r.error();
        }

        if (auto level = parse_config_value(config_path, "logging", "level"); !level.empty()) {
            config.logging.level = level;
        }
    }

    if (const char* dbPath = std::getenv("CORTEX_DB_PATH"); dbPath && *dbPath) {
        config.storage.database_path = expand_tilde(dbPath).string();
    }
    if (const char* level = std::getenv("CORTEX_LOG_LEVEL"); level && *level) {
        config.logging.level = level;
    }
    if (const char* timeout = std::getenv("CORTEX_EMBED_TIMEOUT_MS"); timeout && *timeout) {
        auto ms = parse_ms(timeout);
        if (ms.count() > 0) {
            config.embeddings.timeout = ms;
        }
    }

    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    return config;
}

void applyLogging(const EngineConfig& config) {
    auto level = spdlog::level::from_str(config.logging.level);
    // from_str maps unknown names to off; keep info in that case unless "off" was asked for
    if (level == spdlog::level::off && config.logging.level != "off") {
        spdlog::warn("Unknown log level '{}', using info", config.logging.level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

} // namespace cortex::config
