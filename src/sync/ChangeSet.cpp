#include "sync/ChangeSet.hpp"
#include "storage/sidecar.hpp"

using namespace folio::sync;

std::optional<Change> folio::sync::classify(const EventKind kind, const std::filesystem::path& path) {
    if (kind != EventKind::Create && kind != EventKind::Modify && kind != EventKind::Remove) return std::nullopt;

    const auto id = storage::sidecar::classifyPath(path);
    if (!id) return std::nullopt;

    return Change{*id, kind == EventKind::Remove ? Change::Kind::Delete : Change::Kind::Update};
}

void ChangeSet::add(const Change& change) {
    if (change.kind == Change::Kind::Delete) toDelete.insert(change.id);
    else toUpdate.insert(change.id);
}

void ChangeSet::add(const std::vector<Change>& changes) {
    for (const auto& change : changes) add(change);
}

void ChangeSet::clear() {
    toUpdate.clear();
    toDelete.clear();
}
