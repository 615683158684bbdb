#include <cortex/context/item_store.h>

#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>

namespace cortex::context {

struct InMemoryItemStore::State {
    mutable std::shared_mutex mutex;
    std::map<ItemId, ContextItem> items;
    std::map<std::string, ContextProject> projects;
    ItemId lastId = 0;
};

class InMemoryItemStore::Cursor : public ItemCursor {
public:
    Cursor(std::shared_ptr<State> state, ScanSpec spec)
        : state_(std::move(state)), spec_(std::move(spec)) {}

    Result<std::optional<ContextItem>> next() override {
        while (true) {
            std::optional<ContextItem> candidate;
            {
                std::shared_lock lock(state_->mutex);
                auto it = position_ ? state_->items.upper_bound(*position_)
                                    : state_->items.begin();
                for (; it != state_->items.end(); ++it) {
                    if (matchesPushdown(spec_, it->second)) {
                        candidate = it->second;
                        break;
                    }
                }
            }
            if (!candidate) {
                return std::optional<ContextItem>{};
            }

            position_ = candidate->id;
            // The predicate is caller code; run it outside the lock
            if (!spec_.predicate || spec_.predicate(*candidate)) {
                return candidate;
            }
        }
    }

    void reset() override { position_.reset(); }

private:
    std::shared_ptr<State> state_;
    ScanSpec spec_;
    std::optional<ItemId> position_;
};

InMemoryItemStore::InMemoryItemStore() : state_(std::make_shared<State>()) {}

InMemoryItemStore::~InMemoryItemStore() = default;

Result<ContextItem> InMemoryItemStore::insert(ContextItem item) {
    std::unique_lock lock(state_->mutex);
    item.id = ++state_->lastId;
    item.revision = 1;
    state_->items[item.id] = item;
    return item;
}

Result<std::optional<ContextItem>> InMemoryItemStore::get(ItemId id) {
    std::shared_lock lock(state_->mutex);
    auto it = state_->items.find(id);
    if (it == state_->items.end()) {
        return std::optional<ContextItem>{};
    }
    return std::optional<ContextItem>(it->second);
}

Result<ContextItem> InMemoryItemStore::upsert(ContextItem item) {
    if (item.id <= 0) {
        return insert(std::move(item));
    }

    std::unique_lock lock(state_->mutex);
    auto it = state_->items.find(item.id);
    item.revision = (it == state_->items.end()) ? 1 : it->second.revision + 1;
    state_->lastId = std::max(state_->lastId, item.id);
    state_->items[item.id] = item;
    return item;
}

Result<std::optional<ContextItem>> InMemoryItemStore::compareAndSwap(ContextItem item,
                                                                     uint64_t expectedRevision) {
    std::unique_lock lock(state_->mutex);
    auto it = state_->items.find(item.id);
    if (it == state_->items.end()) {
        return Error{ErrorCode::NotFound, "Item " + std::to_string(item.id) + " not found"};
    }
    if (it->second.revision != expectedRevision) {
        return std::optional<ContextItem>{};
    }
    item.revision = expectedRevision + 1;
    it->second = item;
    return std::optional<ContextItem>(std::move(item));
}

Result<std::unique_ptr<ItemCursor>> InMemoryItemStore::scan(ScanSpec spec) {
    return std::unique_ptr<ItemCursor>(std::make_unique<Cursor>(state_, std::move(spec)));
}

Result<bool> InMemoryItemStore::remove(ItemId id) {
    std::unique_lock lock(state_->mutex);
    return state_->items.erase(id) > 0;
}

Result<void> InMemoryItemStore::insertProject(const ContextProject& project) {
    std::unique_lock lock(state_->mutex);
    if (!state_->projects.emplace(project.id, project).second) {
        return Error{ErrorCode::AlreadyExists, "Project '" + project.id + "' already exists"};
    }
    return {};
}

Result<std::optional<ContextProject>> InMemoryItemStore::getProject(const std::string& id) {
    std::shared_lock lock(state_->mutex);
    auto it = state_->projects.find(id);
    if (it == state_->projects.end()) {
        return std::optional<ContextProject>{};
    }
    return std::optional<ContextProject>(it->second);
}

Result<void> InMemoryItemStore::updateProject(const ContextProject& project) {
    std::unique_lock lock(state_->mutex);
    auto it = state_->projects.find(project.id);
    if (it == state_->projects.end()) {
        return Error{ErrorCode::NotFound, "Project '" + project.id + "' not found"};
    }
    it->second = project;
    return {};
}

Result<bool> InMemoryItemStore::removeProject(const std::string& id) {
    std::unique_lock lock(state_->mutex);
    return state_->projects.erase(id) > 0;
}

Result<std::vector<ContextProject>> InMemoryItemStore::listProjects() {
    std::vector<ContextProject> projects;
    {
        std::shared_lock lock(state_->mutex);
        projects.reserve(state_->projects.size());
        for (const auto& [id, project] : state_->projects) {
            projects.push_back(project);
        }
    }
    std::sort(projects.begin(), projects.end(), [](const auto& a, const auto& b) {
        if (a.created_at != b.created_at)
            return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return projects;
}

} // namespace cortex::context
