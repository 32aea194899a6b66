#pragma once

#include <stdexcept>
#include <string>

namespace folio::fs {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Missing sidecar file or a path that resolves to nothing.
struct NotFound : Error {
    using Error::Error;
};

// Sidecar content that is not JSON or does not match the expected schema.
struct ParseError : Error {
    using Error::Error;
};

// Several items share a display name and the parent chain does not single one out.
struct AmbiguousPath : Error {
    using Error::Error;
};

struct IoError : Error {
    using Error::Error;
};

// A move whose target lies inside the item being moved.
struct InvalidMove : Error {
    using Error::Error;
};

struct WatchSetupError : Error {
    using Error::Error;
};

}
