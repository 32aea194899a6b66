#pragma once

#include "storage/RecordStore.hpp"

namespace folio::storage {

// Items stored as <id>.metadata / <id>.content JSON files in one flat directory.
class SidecarStore : public RecordStore {
public:
    explicit SidecarStore(std::filesystem::path basePath);

    [[nodiscard]] const std::filesystem::path& basePath() const override { return base_; }

    [[nodiscard]] std::vector<fs::model::Identifier> enumerate() const override;

    [[nodiscard]] fs::model::Item readItem(const fs::model::Identifier& id) const override;

    void rewriteParent(const fs::model::Identifier& id, const fs::model::Parent& newParent) override;

private:
    std::filesystem::path base_;
};

}
