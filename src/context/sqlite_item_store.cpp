#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cortex/context/sqlite_item_store.h>
#include <cortex/storage/database.h>
#include <cortex/vector/vector_utils.h>

#include <deque>
#include <mutex>
#include <string_view>

namespace cortex::context {

using nlohmann::json;
using storage::Database;
using storage::Statement;

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS context_items (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    title TEXT NOT NULL,
    content TEXT NOT NULL,
    content_type TEXT NOT NULL,
    tags TEXT NOT NULL DEFAULT '[]',
    extra_metadata TEXT NOT NULL DEFAULT '{}',
    source TEXT,
    project_id TEXT,
    is_active INTEGER NOT NULL DEFAULT 1,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    vector BLOB,
    revision INTEGER NOT NULL DEFAULT 1
);
CREATE INDEX IF NOT EXISTS idx_context_items_active ON context_items(is_active);
CREATE INDEX IF NOT EXISTS idx_context_items_project ON context_items(project_id);
CREATE TABLE IF NOT EXISTS context_projects (
    id TEXT PRIMARY KEY,
    name TEXT NOT NULL,
    description TEXT,
    settings TEXT NOT NULL DEFAULT '{}',
    is_active INTEGER NOT NULL DEFAULT 1,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);
)SQL";

constexpr const char* kItemColumns =
    "id, title, content, content_type, tags, extra_metadata, source, project_id, is_active, "
    "created_at, updated_at, vector, revision";

constexpr const char* kProjectColumns =
    "id, name, description, settings, is_active, created_at, updated_at";

Error storeError(const Error& cause, std::string_view operation) {
    spdlog::error("SQLite item store: {} failed: {}", operation, cause.message);
    return Error{ErrorCode::StoreUnavailable, std::string(operation) + ": " + cause.message};
}

int64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromMillis(int64_t ms) {
    return TimePoint{std::chrono::milliseconds(ms)};
}

std::string mapToJsonText(const MetadataMap& map) {
    return json(map).dump();
}

Result<void> bindOptional(Statement& stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        return stmt.bind(index, *value);
    }
    return stmt.bind(index, nullptr);
}

std::optional<std::string> optionalColumn(const Statement& stmt, int column) {
    if (stmt.isNull(column)) {
        return std::nullopt;
    }
    return stmt.getString(column);
}

template <typename T> Result<T> parseJsonColumn(const std::string& text, const char* column) {
    auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::StoreUnavailable, std::string("Corrupt JSON in column ") + column};
    }
    try {
        return parsed.get<T>();
    } catch (const json::exception& e) {
        return Error{ErrorCode::StoreUnavailable,
                     std::string("Unexpected JSON in column ") + column + ": " + e.what()};
    }
}

Result<ContextItem> readItem(const Statement& stmt) {
    ContextItem item;
    item.id = stmt.getInt64(0);
    item.title = stmt.getString(1);
    item.content = stmt.getString(2);

    auto type = parseContentType(stmt.getString(3));
    if (!type) {
        return Error{ErrorCode::StoreUnavailable, type.error().message};
    }
    item.content_type = type.value();

    auto tags = parseJsonColumn<std::set<std::string>>(stmt.getString(4), "tags");
    if (!tags)
        return tags.error();
    item.tags = std::move(tags).value();

    auto metadata = parseJsonColumn<MetadataMap>(stmt.getString(5), "extra_metadata");
    if (!metadata)
        return metadata.error();
    item.extra_metadata = std::move(metadata).value();

    item.source = optionalColumn(stmt, 6);
    item.project_id = optionalColumn(stmt, 7);
    item.is_active = stmt.getInt(8) != 0;
    item.created_at = fromMillis(stmt.getInt64(9));
    item.updated_at = fromMillis(stmt.getInt64(10));

    if (!stmt.isNull(11)) {
        const auto blob = stmt.getBlob(11);
        auto decoded = vector::utils::fromBlob(blob);
        if (!decoded) {
            return Error{ErrorCode::StoreUnavailable, decoded.error().message};
        }
        item.vector = std::move(decoded).value();
    }
    item.revision = static_cast<uint64_t>(stmt.getInt64(12));
    return item;
}

Result<ContextProject> readProject(const Statement& stmt) {
    ContextProject project;
    project.id = stmt.getString(0);
    project.name = stmt.getString(1);
    project.description = optionalColumn(stmt, 2);

    auto settings = parseJsonColumn<MetadataMap>(stmt.getString(3), "settings");
    if (!settings)
        return settings.error();
    project.settings = std::move(settings).value();

    project.is_active = stmt.getInt(4) != 0;
    project.created_at = fromMillis(stmt.getInt64(5));
    project.updated_at = fromMillis(stmt.getInt64(6));
    return project;
}

} // namespace

struct SqliteItemStore::Impl {
    Database db;
    std::mutex mutex; // Serializes all access to the connection

    // Read-then-write sequences run in one IMMEDIATE transaction; caller holds mutex
    template <typename Func> Result<void> atomically(std::string_view operation, Func&& body) {
        auto r = db.transaction(std::forward<Func>(body));
        if (!r && (r.error().code == ErrorCode::DatabaseError ||
                   r.error().code == ErrorCode::InvalidState)) {
            return storeError(r.error(), operation);
        }
        return r;
    }

    Result<std::optional<ContextItem>> fetchItem(ItemId id) {
        auto stmtResult =
            db.prepare(std::string("SELECT ") + kItemColumns + " FROM context_items WHERE id = ?");
        if (!stmtResult)
            return storeError(stmtResult.error(), "prepare get");
        auto stmt = std::move(stmtResult).value();
        if (auto r = stmt.bind(1, id); !r)
            return storeError(r.error(), "bind get");

        auto row = stmt.step();
        if (!row)
            return storeError(row.error(), "get");
        if (!row.value())
            return std::optional<ContextItem>{};

        auto item = readItem(stmt);
        if (!item)
            return item.error();
        return std::optional<ContextItem>(std::move(item).value());
    }

    Result<void> writeItem(const std::string& sql, const ContextItem& item,
                           std::optional<ItemId> trailingId,
                           std::optional<uint64_t> trailingRevision) {
        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return storeError(stmtResult.error(), "prepare write");
        auto stmt = std::move(stmtResult).value();

        const auto vectorBlob =
            item.vector ? vector::utils::toBlob(*item.vector) : std::vector<std::byte>{};

        int i = 1;
        Result<void> r;
        auto bindNext = [&](auto&& value) {
            if (r)
                r = stmt.bind(i++, std::forward<decltype(value)>(value));
        };
        bindNext(std::string_view(item.title));
        bindNext(std::string_view(item.content));
        bindNext(contentTypeToString(item.content_type));
        bindNext(json(item.tags).dump());
        bindNext(mapToJsonText(item.extra_metadata));
        if (r)
            r = bindOptional(stmt, i++, item.source);
        if (r)
            r = bindOptional(stmt, i++, item.project_id);
        bindNext(item.is_active ? 1 : 0);
        bindNext(toMillis(item.created_at));
        bindNext(toMillis(item.updated_at));
        if (item.vector) {
            bindNext(std::span<const std::byte>(vectorBlob));
        } else {
            bindNext(nullptr);
        }
        bindNext(static_cast<int64_t>(item.revision));
        if (trailingId)
            bindNext(*trailingId);
        if (trailingRevision)
            bindNext(static_cast<int64_t>(*trailingRevision));
        if (!r)
            return storeError(r.error(), "bind write");

        if (auto exec = stmt.execute(); !exec)
            return storeError(exec.error(), "write");
        return {};
    }
};

class SqliteItemStore::Cursor : public ItemCursor {
public:
    Cursor(std::shared_ptr<Impl> impl, ScanSpec spec)
        : impl_(std::move(impl)), spec_(std::move(spec)) {}

    Result<std::optional<ContextItem>> next() override {
        while (true) {
            if (buffer_.empty()) {
                if (exhausted_) {
                    return std::optional<ContextItem>{};
                }
                if (auto r = fetchBatch(); !r) {
                    return r.error();
                }
                continue;
            }

            ContextItem item = std::move(buffer_.front());
            buffer_.pop_front();
            if (!spec_.predicate || spec_.predicate(item)) {
                return std::optional<ContextItem>(std::move(item));
            }
        }
    }

    void reset() override {
        buffer_.clear();
        lastId_ = 0;
        exhausted_ = false;
    }

private:
    // Keyset pagination so no statement stays open between next() calls
    Result<void> fetchBatch() {
        std::string sql =
            std::string("SELECT ") + kItemColumns + " FROM context_items WHERE id > ?";
        if (spec_.is_active)
            sql += " AND is_active = ?";
        if (spec_.project_id)
            sql += " AND project_id = ?";
        sql += " ORDER BY id LIMIT ?";

        std::lock_guard lock(impl_->mutex);
        auto stmtResult = impl_->db.prepare(sql);
        if (!stmtResult)
            return storeError(stmtResult.error(), "prepare scan");
        auto stmt = std::move(stmtResult).value();

        int index = 1;
        auto bound = stmt.bind(index++, lastId_);
        if (bound && spec_.is_active)
            bound = stmt.bind(index++, *spec_.is_active ? 1 : 0);
        if (bound && spec_.project_id)
            bound = stmt.bind(index++, *spec_.project_id);
        if (bound)
            bound = stmt.bind(index++, kScanBatchSize);
        if (!bound)
            return storeError(bound.error(), "bind scan");

        int rows = 0;
        while (true) {
            auto row = stmt.step();
            if (!row)
                return storeError(row.error(), "scan");
            if (!row.value())
                break;
            auto item = readItem(stmt);
            if (!item)
                return item.error();
            lastId_ = item.value().id;
            buffer_.push_back(std::move(item).value());
            ++rows;
        }
        if (rows < kScanBatchSize) {
            exhausted_ = true;
        }
        return {};
    }

    std::shared_ptr<Impl> impl_;
    ScanSpec spec_;
    std::deque<ContextItem> buffer_;
    ItemId lastId_ = 0;
    bool exhausted_ = false;
};

SqliteItemStore::SqliteItemStore(std::shared_ptr<Impl> impl) : impl_(std::move(impl)) {}

SqliteItemStore::~SqliteItemStore() = default;

Result<std::unique_ptr<SqliteItemStore>> SqliteItemStore::open(const std::string& path) {
    auto impl = std::make_shared<Impl>();
    const bool inMemory = path == ":memory:";
    auto opened =
        impl->db.open(path, inMemory ? storage::ConnectionMode::Memory
                                     : storage::ConnectionMode::Create);
    if (!opened)
        return storeError(opened.error(), "open " + path);

    if (!inMemory) {
        if (auto wal = impl->db.enableWAL(); !wal) {
            spdlog::warn("Could not enable WAL on {}: {}", path, wal.error().message);
        }
    }
    if (auto schema = impl->db.execute(kSchema); !schema)
        return storeError(schema.error(), "create schema");

    spdlog::info("Opened SQLite item store at {}", path);
    return std::unique_ptr<SqliteItemStore>(new SqliteItemStore(std::move(impl)));
}

Result<ContextItem> SqliteItemStore::insert(ContextItem item) {
    std::lock_guard lock(impl_->mutex);
    item.revision = 1;
    const std::string sql =
        "INSERT INTO context_items (title, content, content_type, tags, extra_metadata, source, "
        "project_id, is_active, created_at, updated_at, vector, revision) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    if (auto r = impl_->writeItem(sql, item, std::nullopt, std::nullopt); !r)
        return r.error();
    item.id = impl_->db.lastInsertRowId();
    return item;
}

Result<std::optional<ContextItem>> SqliteItemStore::get(ItemId id) {
    std::lock_guard lock(impl_->mutex);
    return impl_->fetchItem(id);
}

Result<ContextItem> SqliteItemStore::upsert(ContextItem item) {
    if (item.id <= 0) {
        return insert(std::move(item));
    }

    const std::string sql =
        "INSERT OR REPLACE INTO context_items (title, content, content_type, tags, "
        "extra_metadata, source, project_id, is_active, created_at, updated_at, vector, "
        "revision, id) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    std::lock_guard lock(impl_->mutex);
    auto written = impl_->atomically("upsert", [&]() -> Result<void> {
        auto existing = impl_->fetchItem(item.id);
        if (!existing)
            return existing.error();
        item.revision = existing.value() ? existing.value()->revision + 1 : 1;
        return impl_->writeItem(sql, item, item.id, std::nullopt);
    });
    if (!written)
        return written.error();
    return item;
}

Result<std::optional<ContextItem>> SqliteItemStore::compareAndSwap(ContextItem item,
                                                                   uint64_t expectedRevision) {
    std::lock_guard lock(impl_->mutex);
    item.revision = expectedRevision + 1;

    const std::string sql =
        "UPDATE context_items SET title = ?, content = ?, content_type = ?, tags = ?, "
        "extra_metadata = ?, source = ?, project_id = ?, is_active = ?, created_at = ?, "
        "updated_at = ?, vector = ?, revision = ? WHERE id = ? AND revision = ?";
    if (auto r = impl_->writeItem(sql, item, item.id, expectedRevision); !r)
        return r.error();

    if (impl_->db.changes() > 0) {
        return std::optional<ContextItem>(std::move(item));
    }

    auto current = impl_->fetchItem(item.id);
    if (!current)
        return current.error();
    if (!current.value()) {
        return Error{ErrorCode::NotFound, "Item " + std::to_string(item.id) + " not found"};
    }
    return std::optional<ContextItem>{};
}

Result<std::unique_ptr<ItemCursor>> SqliteItemStore::scan(ScanSpec spec) {
    return std::unique_ptr<ItemCursor>(std::make_unique<Cursor>(impl_, std::move(spec)));
}

Result<bool> SqliteItemStore::remove(ItemId id) {
    std::lock_guard lock(impl_->mutex);
    auto stmtResult = impl_->db.prepare("DELETE FROM context_items WHERE id = ?");
    if (!stmtResult)
        return storeError(stmtResult.error(), "prepare delete");
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, id); !r)
        return storeError(r.error(), "bind delete");
    if (auto r = stmt.execute(); !r)
        return storeError(r.error(), "delete");
    return impl_->db.changes() > 0;
}

Result<void> SqliteItemStore::insertProject(const ContextProject& project) {
    std::lock_guard lock(impl_->mutex);
    return impl_->atomically("project insert", [&]() -> Result<void> {
        auto check = impl_->db.prepare("SELECT 1 FROM context_projects WHERE id = ?");
        if (!check)
            return storeError(check.error(), "prepare project lookup");
        auto checkStmt = std::move(check).value();
        if (auto r = checkStmt.bind(1, project.id); !r)
            return storeError(r.error(), "bind project lookup");
        auto exists = checkStmt.step();
        if (!exists)
            return storeError(exists.error(), "project lookup");
        if (exists.value()) {
            return Error{ErrorCode::AlreadyExists, "Project '" + project.id + "' already exists"};
        }

        auto stmtResult = impl_->db.prepare(std::string("INSERT INTO context_projects (") +
                                            kProjectColumns + ") VALUES (?, ?, ?, ?, ?, ?, ?)");
        if (!stmtResult)
            return storeError(stmtResult.error(), "prepare project insert");
        auto stmt = std::move(stmtResult).value();
        auto bound = stmt.bind(1, project.id);
        if (bound)
            bound = stmt.bind(2, project.name);
        if (bound)
            bound = bindOptional(stmt, 3, project.description);
        if (bound)
            bound = stmt.bind(4, mapToJsonText(project.settings));
        if (bound)
            bound = stmt.bind(5, project.is_active ? 1 : 0);
        if (bound)
            bound = stmt.bind(6, toMillis(project.created_at));
        if (bound)
            bound = stmt.bind(7, toMillis(project.updated_at));
        if (!bound)
            return storeError(bound.error(), "bind project insert");
        if (auto r = stmt.execute(); !r)
            return storeError(r.error(), "project insert");
        return {};
    });
}

Result<std::optional<ContextProject>> SqliteItemStore::getProject(const std::string& id) {
    std::lock_guard lock(impl_->mutex);
    auto stmtResult = impl_->db.prepare(std::string("SELECT ") + kProjectColumns +
                                        " FROM context_projects WHERE id = ?");
    if (!stmtResult)
        return storeError(stmtResult.error(), "prepare project get");
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, id); !r)
        return storeError(r.error(), "bind project get");

    auto row = stmt.step();
    if (!row)
        return storeError(row.error(), "project get");
    if (!row.value())
        return std::optional<ContextProject>{};

    auto project = readProject(stmt);
    if (!project)
        return project.error();
    return std::optional<ContextProject>(std::move(project).value());
}

Result<void> SqliteItemStore::updateProject(const ContextProject& project) {
    std::lock_guard lock(impl_->mutex);
    auto stmtResult = impl_->db.prepare(
        "UPDATE context_projects SET name = ?, description = ?, settings = ?, is_active = ?, "
        "updated_at = ? WHERE id = ?");
    if (!stmtResult)
        return storeError(stmtResult.error(), "prepare project update");
    auto stmt = std::move(stmtResult).value();
    auto bound = stmt.bind(1, project.name);
    if (bound)
        bound = bindOptional(stmt, 2, project.description);
    if (bound)
        bound = stmt.bind(3, mapToJsonText(project.settings));
    if (bound)
        bound = stmt.bind(4, project.is_active ? 1 : 0);
    if (bound)
        bound = stmt.bind(5, toMillis(project.updated_at));
    if (bound)
        bound = stmt.bind(6, project.id);
    if (!bound)
        return storeError(bound.error(), "bind project update");
    if (auto r = stmt.execute(); !r)
        return storeError(r.error(), "project update");

    if (impl_->db.changes() == 0) {
        return Error{ErrorCode::NotFound, "Project '" + project.id + "' not found"};
    }
    return {};
}

Result<bool> SqliteItemStore::removeProject(const std::string& id) {
    std::lock_guard lock(impl_->mutex);
    auto stmtResult = impl_->db.prepare("DELETE FROM context_projects WHERE id = ?");
    if (!stmtResult)
        return storeError(stmtResult.error(), "prepare project delete");
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, id); !r)
        return storeError(r.error(), "bind project delete");
    if (auto r = stmt.execute(); !r)
        return storeError(r.error(), "project delete");
    return impl_->db.changes() > 0;
}

Result<std::vector<ContextProject>> SqliteItemStore::listProjects() {
    std::lock_guard lock(impl_->mutex);
    auto stmtResult = impl_->db.prepare(std::string("SELECT ") + kProjectColumns +
                                        " FROM context_projects ORDER BY created_at, id");
    if (!stmtResult)
        return storeError(stmtResult.error(), "prepare project list");
    auto stmt = std::move(stmtResult).value();

    std::vector<ContextProject> projects;
    while (true) {
        auto row = stmt.step();
        if (!row)
            return storeError(row.error(), "project list");
        if (!row.value())
            break;
        auto project = readProject(stmt);
        if (!project)
            return project.error();
        projects.push_back(std::move(project).value());
    }
    return projects;
}

} // namespace cortex::context
