#include "fs/Filesystem.hpp"
#include "fs/cache/Registry.hpp"
#include "fs/Errors.hpp"
#include "concurrency/fs/ReadItemTask.hpp"
#include "storage/RecordStore.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <future>
#include <unordered_set>

using namespace folio::fs;
using namespace folio::fs::model;
using namespace folio::concurrency;

Filesystem::Filesystem(std::shared_ptr<storage::RecordStore> store, const unsigned int rebuildWorkers)
    : store_(std::move(store)),
      registry_(std::make_shared<cache::Registry>()),
      resolver_(registry_),
      pool_(std::max(1u, rebuildWorkers)) {
    if (!store_) throw std::invalid_argument("Filesystem requires a record store");
}

Filesystem::~Filesystem() { pool_.stop(); }

void Filesystem::rebuild() {
    log::Registry::index()->info("[Filesystem] Indexing {}", store_->basePath().string());

    std::vector<Identifier> ids;
    try {
        ids = store_->enumerate();
    } catch (const Error& e) {
        log::Registry::index()->error("[Filesystem] Cannot enumerate {}: {}", store_->basePath().string(), e.what());
        return;
    }

    const auto items = readAll(ids);
    registry_->replaceAll(items);

    log::Registry::index()->info("[Filesystem] Indexed {} of {} records", items.size(), ids.size());
}

std::vector<ItemPtr> Filesystem::readAll(const std::vector<Identifier>& ids) {
    std::vector<std::future<ExpectedFuture>> futures;
    futures.reserve(ids.size());

    for (const auto& id : ids) {
        const auto task = std::make_shared<ReadItemTask>(store_, id);
        futures.push_back(task->getFuture().value());
        pool_.submit(task);
    }

    std::vector<ItemPtr> items;
    items.reserve(ids.size());
    for (auto& f : futures) {
        const auto result = f.get();
        if (const auto* item = std::get_if<ItemPtr>(&result); item && *item) items.push_back(*item);
    }

    return items;
}

std::vector<ItemPtr> Filesystem::list(const std::string_view path) const {
    return list(Path(path));
}

std::vector<ItemPtr> Filesystem::list(const Path& path) const {
    if (path.isRoot()) return registry_->children(Parent::root());
    if (path.isTrash()) return trash();
    if (path.isPinned()) return pinned();

    ItemPtr dir;
    try {
        dir = resolver_.resolve(path);
    } catch (const NotFound& e) {
        log::Registry::index()->warn("[Filesystem] list: {}", e.what());
        return {};
    }

    if (!dir->isDirectory()) {
        log::Registry::index()->warn("[Filesystem] list called on a document: {}", path.string());
        return {};
    }

    return registry_->children(Parent::directory(dir->id));
}

std::vector<ItemPtr> Filesystem::pinned() const { return registry_->pinned(); }

std::vector<ItemPtr> Filesystem::trash() const { return registry_->children(Parent::trash()); }

ItemPtr Filesystem::stat(const std::string_view path) const {
    return resolver_.resolve(Path(path));
}

ItemPtr Filesystem::get(const Identifier& id) const {
    if (auto item = registry_->get(id)) return item;
    throw NotFound("No item with identifier " + boost::uuids::to_string(id));
}

Parent Filesystem::targetParentFor(const Item& item, const Path& target) const {
    if (target.isRoot()) return Parent::root();
    if (target.isTrash()) return Parent::trash();

    const auto dir = resolver_.resolve(target);
    if (!dir->isDirectory()) throw NotFound("Move target is not a directory: " + target.string());

    // Walk up from the target; reaching the moved item means the target lies inside it.
    std::unordered_set<Identifier, IdentifierHash> visited;
    for (auto cur = dir; cur; ) {
        if (cur->id == item.id) throw InvalidMove("Cannot move " + item.name + " into itself or a descendant");
        if (!cur->parent.isDirectory() || !visited.insert(cur->id).second) break;
        cur = registry_->get(cur->parent.id);
    }

    return Parent::directory(dir->id);
}

void Filesystem::moveItem(const std::string_view itemPath, const std::string_view targetDirPath) {
    const auto item = resolver_.resolve(Path(itemPath));
    const auto parent = targetParentFor(*item, Path(targetDirPath));

    store_->rewriteParent(item->id, parent);
    log::Registry::index()->info("[Filesystem] Moved {} to '{}'", Path(itemPath).string(), Path(targetDirPath).string());

    if (!refresh(item->id))
        log::Registry::index()->error("[Filesystem] Moved item {} could not be re-read", boost::uuids::to_string(item->id));
}

Path Filesystem::pathOf(const Identifier& id) const {
    auto item = get(id);

    std::vector<std::string> reversed{item->name};
    std::unordered_set<Identifier, IdentifierHash> visited{id};

    while (item->parent.isDirectory()) {
        const auto parentId = item->parent.id;
        if (!visited.insert(parentId).second)
            throw NotFound("Cyclic parent chain for " + boost::uuids::to_string(id));

        item = registry_->get(parentId);
        if (!item) throw NotFound("Dangling parent " + boost::uuids::to_string(parentId) + " for " + boost::uuids::to_string(id));
        reversed.push_back(item->name);
    }

    if (item->parent.isTrash()) reversed.emplace_back(TRASH_DIRECTORY);

    return Path(std::vector(reversed.rbegin(), reversed.rend()));
}

bool Filesystem::refresh(const Identifier& id) {
    try {
        registry_->upsert(std::make_shared<const Item>(store_->readItem(id)));
        log::Registry::index()->debug("[Filesystem] Refreshed {}", boost::uuids::to_string(id));
        return true;
    } catch (const Error& e) {
        log::Registry::index()->error("[Filesystem] Failed to refresh {}: {}", boost::uuids::to_string(id), e.what());
        return false;
    }
}

bool Filesystem::evict(const Identifier& id) {
    const bool removed = registry_->evict(id);
    if (removed) log::Registry::index()->debug("[Filesystem] Evicted {}", boost::uuids::to_string(id));
    return removed;
}
