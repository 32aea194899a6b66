#include "concurrency/fs/ReadItemTask.hpp"
#include "storage/RecordStore.hpp"
#include "fs/model/Item.hpp"
#include "log/Registry.hpp"

using namespace folio::concurrency;
using namespace folio::fs::model;

ReadItemTask::ReadItemTask(std::shared_ptr<storage::RecordStore> s, const Identifier& itemId)
    : store(std::move(s)), id(itemId) {}

void ReadItemTask::operator()() {
    try {
        promise.set_value(std::make_shared<const Item>(store->readItem(id)));
    } catch (const std::exception& e) {
        log::Registry::store()->error("[ReadItemTask] Failed to read item {}: {}", boost::uuids::to_string(id), e.what());
        promise.set_value(false);
    }
}
