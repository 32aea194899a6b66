#pragma once

#include "fs/model/Identifier.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace folio::fs::model {

struct Parent {
    enum class Kind { Root, Trash, Directory };

    Kind kind{Kind::Root};
    Identifier id{}; // nil unless kind == Directory

    static Parent root() { return {}; }
    static Parent trash() { return {Kind::Trash, {}}; }
    static Parent directory(const Identifier& id) { return {Kind::Directory, id}; }

    [[nodiscard]] bool isRoot() const { return kind == Kind::Root; }
    [[nodiscard]] bool isTrash() const { return kind == Kind::Trash; }
    [[nodiscard]] bool isDirectory() const { return kind == Kind::Directory; }

    [[nodiscard]] bool operator==(const Parent& other) const = default;
};

enum class Format { Notebook, Pdf, Epub };

struct Item {
    enum class Kind { Directory, Document };

    Identifier id{};
    std::string name{};
    Parent parent{};
    bool pinned{false};
    Kind kind{Kind::Directory};
    std::optional<Format> format{}; // set for documents only

    [[nodiscard]] bool isDirectory() const { return kind == Kind::Directory; }
    [[nodiscard]] bool isDocument() const { return kind == Kind::Document; }

    [[nodiscard]] bool operator==(const Item& other) const = default;
};

using ItemPtr = std::shared_ptr<const Item>;

std::string to_string(const Format& format);
Format formatFromString(const std::string& str);

// "" for root, "trash", or the directory identifier
std::string to_string(const Parent& parent);
Parent parentFromString(const std::string& str);

void to_json(nlohmann::json& j, const Parent& parent);
void from_json(const nlohmann::json& j, Parent& parent);

void to_json(nlohmann::json& j, const Format& format);
void from_json(const nlohmann::json& j, Format& format);

void to_json(nlohmann::json& j, const Item& item);

void to_json(nlohmann::json& j, const std::vector<ItemPtr>& items);

}
