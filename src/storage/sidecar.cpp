#include "storage/sidecar.hpp"
#include "fs/Errors.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <boost/uuid/uuid_generators.hpp>
#include <nlohmann/json.hpp>

using namespace folio::fs;
using namespace folio::fs::model;
using namespace folio::log;

namespace folio::storage::sidecar {

namespace {

std::string readSidecar(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) throw NotFound(path.string() + " doesn't exist");

    std::ifstream in(path, std::ios::binary);
    if (!in) throw IoError("Failed to open " + path.string());

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw IoError("Failed to read " + path.string());
    return buffer.str();
}

template <typename Json>
Json parseSidecar(const std::filesystem::path& path) {
    const auto raw = readSidecar(path);
    try {
        return Json::parse(raw);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError("Error parsing json for " + path.string() + ": " + e.what());
    }
}

template <typename T>
T decodeSidecar(const std::filesystem::path& path) {
    const auto doc = parseSidecar<nlohmann::json>(path);
    try {
        return doc.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ParseError("Schema mismatch in " + path.string() + ": " + e.what());
    } catch (const ParseError& e) {
        throw ParseError("Schema mismatch in " + path.string() + ": " + e.what());
    }
}

std::filesystem::path sidecarPath(const std::filesystem::path& baseDir, const Identifier& id,
                                  const std::string_view extension) {
    return baseDir / (to_string(id) + std::string(extension));
}

}

void from_json(const nlohmann::json& j, Metadata& meta) {
    const auto type = j.at("type").get<std::string>();
    if (type == "DocumentType") meta.type = Metadata::Type::Document;
    else if (type == "CollectionType") meta.type = Metadata::Type::Collection;
    else throw ParseError("Unknown element type: '" + type + "'");

    j.at("visibleName").get_to(meta.visibleName);
    j.at("parent").get_to(meta.parent);
    j.at("pinned").get_to(meta.pinned);
}

void from_json(const nlohmann::json& j, Content& content) {
    j.at("fileType").get_to(content.fileType);
}

std::filesystem::path metadataPath(const std::filesystem::path& baseDir, const Identifier& id) {
    return sidecarPath(baseDir, id, METADATA_EXTENSION);
}

std::filesystem::path contentPath(const std::filesystem::path& baseDir, const Identifier& id) {
    return sidecarPath(baseDir, id, CONTENT_EXTENSION);
}

std::optional<Identifier> classifyPath(const std::filesystem::path& path) {
    const auto ext = path.extension().string();
    if (ext != METADATA_EXTENSION && ext != CONTENT_EXTENSION) return std::nullopt;
    return parseIdentifier(path.stem().string());
}

bool isMetadataPath(const std::filesystem::path& path) {
    return path.extension() == METADATA_EXTENSION && classifyPath(path).has_value();
}

Item readItem(const std::filesystem::path& baseDir, const Identifier& id) {
    const auto meta = decodeSidecar<Metadata>(metadataPath(baseDir, id));

    Item item;
    item.id = id;
    item.name = meta.visibleName;
    item.parent = meta.parent;
    item.pinned = meta.pinned;

    if (meta.type == Metadata::Type::Document) {
        const auto content = decodeSidecar<Content>(contentPath(baseDir, id));
        item.kind = Item::Kind::Document;
        item.format = content.fileType;
    } else {
        item.kind = Item::Kind::Directory;
    }

    return item;
}

void rewriteParent(const std::filesystem::path& baseDir, const Identifier& id, const Parent& newParent) {
    const auto path = metadataPath(baseDir, id);
    auto doc = parseSidecar<nlohmann::ordered_json>(path);

    if (!doc.is_object() || !doc.contains("parent"))
        throw ParseError(path.string() + " has no parent field to rewrite");

    doc["parent"] = to_string(newParent);

    // Each write gets its own temp file; concurrent rewrites never interleave.
    auto tmp = path;
    tmp += "." + boost::uuids::to_string(boost::uuids::random_generator()()) + ".tmp";

    std::error_code ec;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw IoError("Failed to open " + tmp.string() + " for writing");
        out << doc.dump(4);
        out.close();
        if (!out) {
            std::filesystem::remove(tmp, ec);
            throw IoError("Failed to write " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        const auto reason = ec.message();
        std::filesystem::remove(tmp, ec);
        throw IoError("Failed to replace " + path.string() + ": " + reason);
    }

    Registry::store()->debug("[Sidecar] Rewrote parent of {} to '{}'", to_string(id), to_string(newParent));
}

std::vector<Identifier> enumerate(const std::filesystem::path& baseDir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(baseDir, ec);
    if (ec) throw IoError("Failed to read dir " + baseDir.string() + ": " + ec.message());

    std::vector<Identifier> ids;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            Registry::store()->warn("[Sidecar] Couldn't read entry in {}: {}", baseDir.string(), ec.message());
            break;
        }

        if (const auto& path = it->path(); path.extension() == METADATA_EXTENSION) {
            if (const auto id = classifyPath(path)) ids.push_back(*id);
        }
    }

    return ids;
}

}
