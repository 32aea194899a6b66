#include "fs/cache/Registry.hpp"
#include "log/Registry.hpp"

#include <mutex>
#include <stdexcept>

using namespace folio::fs::cache;
using namespace folio::fs::model;

Registry::Registry(const std::size_t shardCount) {
    if (shardCount == 0) throw std::invalid_argument("Registry needs at least one shard");
    shards_.reserve(shardCount);
    for (std::size_t i = 0; i < shardCount; ++i) shards_.push_back(std::make_unique<Shard>());
}

std::size_t Registry::shardIndex(const Identifier& id) const {
    return IdentifierHash{}(id) % shards_.size();
}

Registry::Shard& Registry::shardFor(const Identifier& id) const {
    return *shards_[shardIndex(id)];
}

void Registry::upsert(const ItemPtr& item) {
    if (!item) throw std::invalid_argument("Cannot cache a null item");

    auto& shard = shardFor(item->id);
    std::unique_lock lock(shard.mutex);
    shard.items.insert_or_assign(item->id, item);
}

bool Registry::evict(const Identifier& id) {
    auto& shard = shardFor(id);
    std::unique_lock lock(shard.mutex);
    return shard.items.erase(id) > 0;
}

ItemPtr Registry::get(const Identifier& id) const {
    const auto& shard = shardFor(id);
    std::shared_lock lock(shard.mutex);
    if (const auto it = shard.items.find(id); it != shard.items.end()) return it->second;
    return nullptr;
}

bool Registry::contains(const Identifier& id) const {
    const auto& shard = shardFor(id);
    std::shared_lock lock(shard.mutex);
    return shard.items.contains(id);
}

void Registry::replaceAll(const std::vector<ItemPtr>& items) {
    std::vector<Map> fresh(shards_.size());
    for (const auto& item : items) {
        if (!item) continue;
        fresh[shardIndex(item->id)].insert_or_assign(item->id, item);
    }

    // Fixed acquisition order; every other operation holds at most one shard lock.
    std::vector<std::unique_lock<std::shared_mutex>> locks;
    locks.reserve(shards_.size());
    for (const auto& shard : shards_) locks.emplace_back(shard->mutex);

    for (std::size_t i = 0; i < shards_.size(); ++i) shards_[i]->items.swap(fresh[i]);

    log::Registry::index()->debug("[Registry] Replaced index contents with {} items", items.size());
}

std::size_t Registry::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        total += shard->items.size();
    }
    return total;
}

std::vector<ItemPtr> Registry::snapshot() const {
    return filter([](const Item&) { return true; });
}

std::vector<ItemPtr> Registry::children(const Parent& parent) const {
    return filter([&parent](const Item& item) { return item.parent == parent; });
}

std::vector<ItemPtr> Registry::pinned() const {
    return filter([](const Item& item) { return item.pinned; });
}

std::vector<ItemPtr> Registry::named(const std::string& name) const {
    return filter([&name](const Item& item) { return item.name == name; });
}
