#pragma once

#include "concurrency/ThreadPool.hpp"
#include "fs/PathResolver.hpp"
#include "fs/model/Item.hpp"
#include "fs/model/Path.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace folio::storage {
class RecordStore;
}

namespace folio::fs {

namespace cache {
class Registry;
}

// Query and mutation surface over the live index. Reads are answered from the
// index; mutations write through the record store and then refresh the index.
class Filesystem {
public:
    static constexpr unsigned int DEFAULT_REBUILD_WORKERS = 8;

    explicit Filesystem(std::shared_ptr<storage::RecordStore> store,
                        unsigned int rebuildWorkers = DEFAULT_REBUILD_WORKERS);

    ~Filesystem();

    Filesystem(const Filesystem&) = delete;
    Filesystem& operator=(const Filesystem&) = delete;

    // Re-reads every record and swaps the result in as the new index contents.
    // An unreadable base directory leaves the current contents in place.
    void rebuild();

    [[nodiscard]] std::vector<model::ItemPtr> list(std::string_view path) const;
    [[nodiscard]] std::vector<model::ItemPtr> list(const model::Path& path) const;

    [[nodiscard]] std::vector<model::ItemPtr> pinned() const;
    [[nodiscard]] std::vector<model::ItemPtr> trash() const;

    // Throws NotFound, AmbiguousPath, InvalidMove, or the store's IoError/ParseError.
    void moveItem(std::string_view itemPath, std::string_view targetDirPath);

    [[nodiscard]] model::ItemPtr stat(std::string_view path) const;
    [[nodiscard]] model::ItemPtr get(const model::Identifier& id) const;

    // Display-name path of an item, e.g. "/Books/Alice" or "/Trash/Old".
    [[nodiscard]] model::Path pathOf(const model::Identifier& id) const;

    // Re-reads one record into the index. On failure the previous entry stays.
    bool refresh(const model::Identifier& id);
    bool evict(const model::Identifier& id);

    // Reads the given records concurrently on the worker pool. Failed reads are
    // logged and left out of the result.
    [[nodiscard]] std::vector<model::ItemPtr> readAll(const std::vector<model::Identifier>& ids);

    [[nodiscard]] const std::shared_ptr<cache::Registry>& registry() const { return registry_; }
    [[nodiscard]] const std::shared_ptr<storage::RecordStore>& store() const { return store_; }

private:
    std::shared_ptr<storage::RecordStore> store_;
    std::shared_ptr<cache::Registry> registry_;
    PathResolver resolver_;
    concurrency::ThreadPool pool_;

    [[nodiscard]] model::Parent targetParentFor(const model::Item& item, const model::Path& target) const;
};

}
