#include "fs/model/Identifier.hpp"

#include <boost/uuid/string_generator.hpp>

namespace folio::fs::model {

std::optional<Identifier> parseIdentifier(const std::string_view str) {
    if (str.size() != 36) return std::nullopt;

    for (std::size_t i = 0; i < str.size(); ++i) {
        const char c = str[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return std::nullopt;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return std::nullopt;
        }
    }

    return parseIdentifierAnyForm(str);
}

std::optional<Identifier> parseIdentifierAnyForm(const std::string_view str) {
    if (str.empty()) return std::nullopt;

    try {
        return boost::uuids::string_generator()(std::string(str));
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

}
