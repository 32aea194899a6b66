#include "storage/SidecarStore.hpp"
#include "storage/sidecar.hpp"
#include "log/Registry.hpp"

using namespace folio::storage;
using namespace folio::fs::model;
using namespace folio::log;

SidecarStore::SidecarStore(std::filesystem::path basePath) : base_(std::move(basePath)) {
    Registry::store()->debug("[SidecarStore] Using document directory {}", base_.string());
}

std::vector<Identifier> SidecarStore::enumerate() const {
    return sidecar::enumerate(base_);
}

Item SidecarStore::readItem(const Identifier& id) const {
    return sidecar::readItem(base_, id);
}

void SidecarStore::rewriteParent(const Identifier& id, const Parent& newParent) {
    sidecar::rewriteParent(base_, id, newParent);
}
