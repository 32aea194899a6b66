#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/functional/hash.hpp>

namespace folio::fs::model {

using Identifier = boost::uuids::uuid;
using IdentifierHash = boost::hash<Identifier>;

// Accepts only the canonical form sidecar files are named with:
// 36 characters, lowercase hex, hyphenated (8-4-4-4-12).
// Formatting goes through boost::uuids::to_string.
[[nodiscard]] std::optional<Identifier> parseIdentifier(std::string_view str);

// Any form boost's string_generator reads: upper or lower case, with or
// without hyphens, optionally braced. Used for identifiers stored inside
// sidecar content, which other writers may not canonicalize.
[[nodiscard]] std::optional<Identifier> parseIdentifierAnyForm(std::string_view str);

}
