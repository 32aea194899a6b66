#pragma once

#include "fs/model/Item.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace folio::fs::cache {

// Identifier -> item map split across independently locked shards so writers on
// unrelated identifiers never contend on one lock. Items are immutable once
// published; updates replace the whole pointer.
class Registry {
public:
    static constexpr std::size_t DEFAULT_SHARD_COUNT = 16;

    explicit Registry(std::size_t shardCount = DEFAULT_SHARD_COUNT);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    void upsert(const model::ItemPtr& item);
    bool evict(const model::Identifier& id);

    [[nodiscard]] model::ItemPtr get(const model::Identifier& id) const;
    [[nodiscard]] bool contains(const model::Identifier& id) const;

    // Swaps in a complete new generation of items under every shard lock.
    void replaceAll(const std::vector<model::ItemPtr>& items);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t shardCount() const { return shards_.size(); }

    // Each shard is copied under its own read lock; the result is not a single
    // linearizable view across shards.
    [[nodiscard]] std::vector<model::ItemPtr> snapshot() const;

    template <typename Pred>
    [[nodiscard]] std::vector<model::ItemPtr> filter(Pred&& pred) const {
        std::vector<model::ItemPtr> out;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard->mutex);
            for (const auto& [_, item] : shard->items)
                if (pred(*item)) out.push_back(item);
        }
        return out;
    }

    [[nodiscard]] std::vector<model::ItemPtr> children(const model::Parent& parent) const;
    [[nodiscard]] std::vector<model::ItemPtr> pinned() const;
    [[nodiscard]] std::vector<model::ItemPtr> named(const std::string& name) const;

private:
    using Map = std::unordered_map<model::Identifier, model::ItemPtr, model::IdentifierHash>;

    struct Shard {
        mutable std::shared_mutex mutex;
        Map items;
    };

    std::vector<std::unique_ptr<Shard>> shards_;

    [[nodiscard]] std::size_t shardIndex(const model::Identifier& id) const;
    [[nodiscard]] Shard& shardFor(const model::Identifier& id) const;
};

}
