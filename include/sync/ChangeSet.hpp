#pragma once

#include "fs/model/Identifier.hpp"

#include <filesystem>
#include <optional>
#include <unordered_set>
#include <vector>

namespace folio::sync {

// Coarse kind of a raw filesystem notification. DirectoryCreated and Overflow
// concern the watch itself rather than a single record.
enum class EventKind { Access, Create, Modify, Remove, DirectoryCreated, Overflow };

struct Change {
    enum class Kind { Update, Delete };

    fs::model::Identifier id{};
    Kind kind{Kind::Update};

    [[nodiscard]] bool operator==(const Change& other) const = default;
};

// Sidecar notifications become changes; access events and paths that do not
// name a record yield nothing.
[[nodiscard]] std::optional<Change> classify(EventKind kind, const std::filesystem::path& path);

// Identifiers touched since the last flush. Repeated changes to one identifier
// collapse into a single entry.
struct ChangeSet {
    std::unordered_set<fs::model::Identifier, fs::model::IdentifierHash> toUpdate{};
    std::unordered_set<fs::model::Identifier, fs::model::IdentifierHash> toDelete{};

    void add(const Change& change);
    void add(const std::vector<Change>& changes);

    [[nodiscard]] bool empty() const { return toUpdate.empty() && toDelete.empty(); }

    void clear();
};

}
