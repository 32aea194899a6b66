#pragma once

#include "fs/model/Item.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace folio::storage::sidecar {

inline constexpr std::string_view METADATA_EXTENSION = ".metadata";
inline constexpr std::string_view CONTENT_EXTENSION = ".content";

/// Representation of <BASE>/<ID>.metadata
struct Metadata {
    enum class Type { Document, Collection };

    Type type{Type::Collection};
    std::string visibleName{};
    fs::model::Parent parent{};
    bool pinned{false};
};

/// Representation of <BASE>/<ID>.content
struct Content {
    fs::model::Format fileType{fs::model::Format::Notebook};
};

void from_json(const nlohmann::json& j, Metadata& meta);
void from_json(const nlohmann::json& j, Content& content);

[[nodiscard]] std::filesystem::path metadataPath(const std::filesystem::path& baseDir, const fs::model::Identifier& id);
[[nodiscard]] std::filesystem::path contentPath(const std::filesystem::path& baseDir, const fs::model::Identifier& id);

/// Identifier named by a .metadata or .content sidecar path, nothing for any other path.
[[nodiscard]] std::optional<fs::model::Identifier> classifyPath(const std::filesystem::path& path);

[[nodiscard]] bool isMetadataPath(const std::filesystem::path& path);

/// Throws NotFound, ParseError or IoError.
[[nodiscard]] fs::model::Item readItem(const std::filesystem::path& baseDir, const fs::model::Identifier& id);

/// Structural edit of the metadata sidecar: only "parent" changes, every other
/// field and the key order survive untouched.
void rewriteParent(const std::filesystem::path& baseDir, const fs::model::Identifier& id,
                   const fs::model::Parent& newParent);

/// Identifiers of every metadata sidecar directly under baseDir.
[[nodiscard]] std::vector<fs::model::Identifier> enumerate(const std::filesystem::path& baseDir);

}
