#pragma once

#include <cortex/core/types.h>

#include <sqlite3.h>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cortex::storage {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    Memory, ///< In-memory database
    Create  ///< Create if not exists
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement (1-based index)
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     *
     * Lock contention is retried only until the first row; after that the error is returned
     * so a restarted query cannot hand out rows twice.
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

private:
    sqlite3_stmt* stmt_ = nullptr;
    bool midResult_ = false; // A row was returned and the statement is not yet done
};

/**
 * @brief Database connection wrapper
 *
 * The connection is opened in serialized threading mode so statements may be stepped from
 * several threads; callers still serialize multi-statement writes themselves.
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::Create);
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Execute within transaction; rolls back when func fails
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            auto result = func();
            if (!result) {
                (void)rollback();
                return result;
            }
            return commit();
        } catch (...) {
            (void)rollback();
            throw;
        }
    }

    int64_t lastInsertRowId() const;
    int changes() const;

    Result<void> enableWAL();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace cortex::storage
