#pragma once

#include "fs/model/Item.hpp"

#include <filesystem>
#include <vector>

namespace folio::storage {

// Backing store of item records. The index reads through this seam so it never
// touches the disk layout directly.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    [[nodiscard]] virtual const std::filesystem::path& basePath() const = 0;

    [[nodiscard]] virtual std::vector<fs::model::Identifier> enumerate() const = 0;

    [[nodiscard]] virtual fs::model::Item readItem(const fs::model::Identifier& id) const = 0;

    virtual void rewriteParent(const fs::model::Identifier& id, const fs::model::Parent& newParent) = 0;
};

}
