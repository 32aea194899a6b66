#include "fs/model/Path.hpp"

using namespace folio::fs::model;

Path::Path(const std::string_view raw) {
    std::size_t pos = 0;
    while (pos <= raw.size()) {
        const auto next = raw.find('/', pos);
        const auto end = next == std::string_view::npos ? raw.size() : next;
        if (const auto seg = raw.substr(pos, end - pos); !seg.empty() && seg != ".")
            segments.emplace_back(seg);
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
}

const std::string& Path::name() const {
    static const std::string empty;
    return segments.empty() ? empty : segments.back();
}

Path Path::parent() const {
    if (segments.empty()) return {};
    return Path(std::vector(segments.begin(), segments.end() - 1));
}

std::string Path::string() const {
    if (segments.empty()) return "/";
    std::string out;
    for (const auto& seg : segments) {
        out.push_back('/');
        out += seg;
    }
    return out;
}
