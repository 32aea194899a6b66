#pragma once

#include "fs/model/Item.hpp"
#include "fs/model/Path.hpp"

#include <memory>

namespace folio::fs {

namespace cache {
class Registry;
}

// Maps a display-name path onto the item it names. Display names are not
// unique, so when several items share the final segment the candidates are
// narrowed by walking each one's parent chain against the path.
class PathResolver {
public:
    explicit PathResolver(std::shared_ptr<cache::Registry> registry);

    // Throws NotFound or AmbiguousPath.
    [[nodiscard]] model::ItemPtr resolve(const model::Path& path) const;

    // True when the chain of parents above candidate spells out path.parent().
    [[nodiscard]] bool parentChainMatches(const model::Item& candidate, const model::Path& path) const;

private:
    std::shared_ptr<cache::Registry> registry_;
};

}
