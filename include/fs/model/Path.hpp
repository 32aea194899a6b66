#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace folio::fs::model {

inline constexpr std::string_view TRASH_DIRECTORY = "Trash";
inline constexpr std::string_view PINNED_DIRECTORY = "Favorites";

// A hierarchical, display-name based path such as "/Books/Alice".
// Leading, trailing and repeated slashes as well as "." segments are ignored.
struct Path {
    std::vector<std::string> segments{};

    Path() = default;
    explicit Path(std::string_view raw);
    explicit Path(std::vector<std::string> segs) : segments(std::move(segs)) {}

    [[nodiscard]] bool isRoot() const { return segments.empty(); }
    [[nodiscard]] bool isTrash() const { return segments.size() == 1 && segments.front() == TRASH_DIRECTORY; }
    [[nodiscard]] bool isPinned() const { return segments.size() == 1 && segments.front() == PINNED_DIRECTORY; }

    [[nodiscard]] bool hasParent() const { return segments.size() > 1; }

    /// Final segment; empty for the root path.
    [[nodiscard]] const std::string& name() const;

    /// Path with the final segment dropped; the root path is its own parent.
    [[nodiscard]] Path parent() const;

    [[nodiscard]] std::string string() const;

    [[nodiscard]] bool operator==(const Path& other) const = default;
};

}
