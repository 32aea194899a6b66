#include "fs/model/Item.hpp"
#include "fs/Errors.hpp"

#include <nlohmann/json.hpp>

using namespace folio::fs;
using namespace folio::fs::model;

std::string folio::fs::model::to_string(const Format& format) {
    switch (format) {
        case Format::Notebook: return "notebook";
        case Format::Pdf: return "pdf";
        case Format::Epub: return "epub";
    }
    throw std::invalid_argument("Unknown document format");
}

Format folio::fs::model::formatFromString(const std::string& str) {
    if (str == "notebook") return Format::Notebook;
    if (str == "pdf") return Format::Pdf;
    if (str == "epub") return Format::Epub;
    throw ParseError("Unknown document format: '" + str + "'");
}

std::string folio::fs::model::to_string(const Parent& parent) {
    switch (parent.kind) {
        case Parent::Kind::Root: return "";
        case Parent::Kind::Trash: return "trash";
        case Parent::Kind::Directory: return to_string(parent.id);
    }
    throw std::invalid_argument("Unknown parent kind");
}

Parent folio::fs::model::parentFromString(const std::string& str) {
    if (str.empty()) return Parent::root();
    if (str == "trash") return Parent::trash();
    if (const auto id = parseIdentifierAnyForm(str)) return Parent::directory(*id);
    throw ParseError("Invalid parent reference: '" + str + "'");
}

void folio::fs::model::to_json(nlohmann::json& j, const Parent& parent) {
    j = to_string(parent);
}

void folio::fs::model::from_json(const nlohmann::json& j, Parent& parent) {
    parent = parentFromString(j.get<std::string>());
}

void folio::fs::model::to_json(nlohmann::json& j, const Format& format) {
    j = to_string(format);
}

void folio::fs::model::from_json(const nlohmann::json& j, Format& format) {
    format = formatFromString(j.get<std::string>());
}

void folio::fs::model::to_json(nlohmann::json& j, const Item& item) {
    j = {
        {"id", to_string(item.id)},
        {"name", item.name},
        {"parent", item.parent},
        {"pinned", item.pinned},
        {"type", item.isDirectory() ? "directory" : "document"}
    };

    if (item.format) j["format"] = *item.format;
}

void folio::fs::model::to_json(nlohmann::json& j, const std::vector<ItemPtr>& items) {
    j = nlohmann::json::array();
    for (const auto& item : items)
        if (item) j.push_back(*item);
}
