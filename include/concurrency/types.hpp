#pragma once

#include <memory>
#include <variant>

namespace folio::fs::model { struct Item; }

// false when the unit of work could not produce an item
typedef std::variant<bool, std::shared_ptr<const folio::fs::model::Item>> ExpectedFuture;
