#include "fs/PathResolver.hpp"
#include "fs/cache/Registry.hpp"
#include "fs/Errors.hpp"
#include "log/Registry.hpp"

#include <unordered_set>

using namespace folio::fs;
using namespace folio::fs::model;

PathResolver::PathResolver(std::shared_ptr<cache::Registry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) throw std::invalid_argument("PathResolver requires a registry");
}

ItemPtr PathResolver::resolve(const Path& path) const {
    if (path.isRoot()) throw NotFound("The root path does not name an item");

    const auto candidates = registry_->named(path.name());
    if (candidates.empty()) throw NotFound("No item at path: " + path.string());
    if (candidates.size() == 1) return candidates.front();

    std::vector<ItemPtr> matches;
    for (const auto& candidate : candidates)
        if (parentChainMatches(*candidate, path)) matches.push_back(candidate);

    if (matches.empty()) throw NotFound("No item at path: " + path.string());
    if (matches.size() > 1) {
        log::Registry::index()->warn("[PathResolver] {} items match path {}", matches.size(), path.string());
        throw AmbiguousPath("Path matches more than one item: " + path.string());
    }
    return matches.front();
}

bool PathResolver::parentChainMatches(const Item& candidate, const Path& path) const {
    std::unordered_set<Identifier, IdentifierHash> visited{candidate.id};
    auto remaining = path;
    auto parent = candidate.parent;

    while (true) {
        if (remaining.hasParent() && parent.isDirectory()) {
            if (!visited.insert(parent.id).second) {
                log::Registry::index()->warn("[PathResolver] Cycle in parent chain of {}", boost::uuids::to_string(candidate.id));
                return false;
            }

            const auto dir = registry_->get(parent.id);
            remaining = remaining.parent();
            if (!dir || !dir->isDirectory() || dir->name != remaining.name()) return false;
            parent = dir->parent;
            continue;
        }

        if (remaining.hasParent() && parent.isTrash())
            return remaining.segments.size() == 2 && remaining.segments.front() == TRASH_DIRECTORY;

        if (!remaining.hasParent() && parent.isRoot()) return true;

        return false;
    }
}
