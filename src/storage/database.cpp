#include <spdlog/spdlog.h>
#include <cortex/storage/database.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <thread>

namespace cortex::storage {

namespace {
// Transient lock errors are retried with exponential backoff before giving up
constexpr int kMaxRetries = 5;
constexpr auto kInitialBackoff = std::chrono::milliseconds(10);
} // namespace

// Statement implementation
Statement::Statement(sqlite3* db, const std::string& sql) {
    const char* tail;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, &tail);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : stmt_(other.stmt_), midResult_(other.midResult_) {
    other.stmt_ = nullptr;
    other.midResult_ = false;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        midResult_ = other.midResult_;
        other.stmt_ = nullptr;
        other.midResult_ = false;
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind null"};
    }
    return {};
}

Result<void> Statement::bind(int index, int value) {
    if (sqlite3_bind_int(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int"};
    }
    return {};
}

Result<void> Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int64"};
    }
    return {};
}

Result<void> Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string_view"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    int rc = sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind blob"};
    }
    return {};
}

Result<void> Statement::execute() {
    auto backoff = kInitialBackoff;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_DONE) {
            return {};
        }
        if ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        std::string errMsg = "Failed to execute statement: " + std::string(sqlite3_errstr(rc));
        if (rc == SQLITE_CONSTRAINT && stmt_) {
            const char* sql = sqlite3_sql(stmt_);
            if (sql) {
                std::string sqlSnippet(sql, std::min(strlen(sql), size_t{100}));
                errMsg += " [SQL: " + sqlSnippet + (strlen(sql) > 100 ? "..." : "") + "]";
            }
        }
        return Error{ErrorCode::DatabaseError, errMsg};
    }
    return Error{ErrorCode::DatabaseError, "Failed to execute statement: max retries exceeded"};
}

Result<bool> Statement::step() {
    auto backoff = kInitialBackoff;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            midResult_ = true;
            return true;
        } else if (rc == SQLITE_DONE) {
            midResult_ = false;
            return false;
        }
        // Resetting after a row would restart the query from its first row
        if ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && !midResult_ &&
            attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        midResult_ = false;
        return Error{ErrorCode::DatabaseError,
                     "Failed to step statement: " + std::string(sqlite3_errstr(rc))};
    }
    return Error{ErrorCode::DatabaseError, "Failed to step statement: max retries exceeded"};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* blob = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!blob || size <= 0)
        return {};

    std::vector<std::byte> result(static_cast<size_t>(size));
    std::memcpy(result.data(), blob, static_cast<size_t>(size));
    return result;
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

// Database implementation
Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), inTransaction_(other.inTransaction_) {
    other.db_ = nullptr;
    other.inTransaction_ = false;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        inTransaction_ = other.inTransaction_;
        other.db_ = nullptr;
        other.inTransaction_ = false;
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;
    switch (mode) {
        case ConnectionMode::Create:
            flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
        case ConnectionMode::Memory:
            flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
            break;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Error{ErrorCode::DatabaseError, "Failed to open database: " + error};
    }

    // Set busy timeout to avoid indefinite blocking
    sqlite3_busy_timeout(db_, 5000);

    path_ = path;
    spdlog::debug("Opened SQLite database {}", path);
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    try {
        return Statement(db_, sql);
    } catch (const std::exception& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Transaction already in progress"};
    }
    auto result = execute("BEGIN IMMEDIATE");
    if (result) {
        inTransaction_ = true;
    }
    return result;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "No transaction in progress"};
    }
    auto result = execute("COMMIT");
    if (result) {
        inTransaction_ = false;
    }
    return result;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "No transaction in progress"};
    }
    auto result = execute("ROLLBACK");
    inTransaction_ = false;
    return result;
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

} // namespace cortex::storage
