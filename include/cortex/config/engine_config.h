#pragma once

#include <cortex/core/types.h>

#include <chrono>
#include <filesystem>
#include <string>

namespace cortex::config {

/**
 * Embedding generation settings
 */
struct EmbeddingSettings {
    size_t dimension = 384;                   // all-MiniLM-L6-v2 dimensions
    std::string backend = "hashing";          // Built-in deterministic backend
    std::string model_name = "all-MiniLM-L6-v2";
    std::chrono::milliseconds timeout{350};   // Upper bound on a single embed() call
    size_t threads = 2;                       // Worker threads for embedding calls
};

/**
 * Hybrid search defaults and limits
 */
struct SearchSettings {
    float default_semantic_weight = 0.7f;
    int64_t default_limit = 50;
    int64_t max_limit = 100;
    size_t scan_batch_size = 64; // Candidates between cancellation checks
};

/**
 * Item store selection
 */
struct StorageSettings {
    enum class Backend { Memory, Sqlite };
    Backend backend = Backend::Memory;
    std::string database_path = "cortex.db";
};

struct MutationSettings {
    size_t max_conflict_retries = 3;
};

struct LoggingSettings {
    std::string level = "info";
};

/**
 * Engine-wide configuration, passed explicitly to every component constructor
 */
struct EngineConfig {
    EmbeddingSettings embeddings;
    SearchSettings search;
    StorageSettings storage;
    MutationSettings mutation;
    LoggingSettings logging;

    Result<void> validate() const;
};

/**
 * Load configuration from a TOML-style file. Missing keys keep their defaults and
 * CORTEX_DB_PATH, CORTEX_LOG_LEVEL and CORTEX_EMBED_TIMEOUT_MS override the file.
 * A missing file is not an error.
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& config_path);

/**
 * Apply the configured log level to the default spdlog logger
 */
void applyLogging(const EngineConfig& config);

} // namespace cortex::config
