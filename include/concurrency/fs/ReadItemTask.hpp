#pragma once

#include "concurrency/Task.hpp"
#include "fs/model/Identifier.hpp"

#include <memory>

namespace folio::storage {
class RecordStore;
}

namespace folio::concurrency {

// Reads one item record; resolves to the item, or false when the read fails.
struct ReadItemTask final : PromisedTask {
    std::shared_ptr<storage::RecordStore> store;
    fs::model::Identifier id;

    ReadItemTask(std::shared_ptr<storage::RecordStore> s, const fs::model::Identifier& itemId);

    void operator()() override;
};

}
