#include "Geometry.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace Capture {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool parseInt(std::string_view s, int32_t& out) {
    if (s.empty()) return false;
    if (s.front() == '+') s.remove_prefix(1);
    const char* end = s.data() + s.size();
    auto result = std::from_chars(s.data(), end, out);
    return result.ec == std::errc() && result.ptr == end;
}

// Splits at the first occurrence of sep; tail is trimmed of extra spaces.
bool splitOnce(std::string_view s, char sep, std::string_view& head, std::string_view& tail) {
    const auto pos = s.find(sep);
    if (pos == std::string_view::npos) return false;
    head = trim(s.substr(0, pos));
    tail = trim(s.substr(pos + 1));
    return true;
}

} // namespace

Rect Rect::unbounded() noexcept {
    return Rect{std::numeric_limits<int32_t>::min() / 2,
                std::numeric_limits<int32_t>::min() / 2,
                std::numeric_limits<int32_t>::max(),
                std::numeric_limits<int32_t>::max()};
}

std::optional<Rect> intersect(const Rect& a, const Rect& b) {
    if (a.empty() || b.empty()) return std::nullopt;

    const int64_t x1 = std::max<int64_t>(a.x, b.x);
    const int64_t y1 = std::max<int64_t>(a.y, b.y);
    const int64_t x2 = std::min(a.right(), b.right());
    const int64_t y2 = std::min(a.bottom(), b.bottom());

    if (x2 - x1 <= 0 || y2 - y1 <= 0) return std::nullopt;

    // Both inputs have edges within int32 range, so the overlap does too.
    return Rect{static_cast<int32_t>(x1), static_cast<int32_t>(y1),
                static_cast<int32_t>(x2 - x1), static_cast<int32_t>(y2 - y1)};
}

std::optional<Rect> boundingBox(const std::vector<Rect>& rects) {
    bool any = false;
    int64_t x1 = 0, y1 = 0, x2 = 0, y2 = 0;

    for (const Rect& r : rects) {
        if (r.empty()) continue;
        if (!any) {
            x1 = r.x; y1 = r.y; x2 = r.right(); y2 = r.bottom();
            any = true;
            continue;
        }
        x1 = std::min<int64_t>(x1, r.x);
        y1 = std::min<int64_t>(y1, r.y);
        x2 = std::max(x2, r.right());
        y2 = std::max(y2, r.bottom());
    }

    if (!any) return std::nullopt;
    if (x2 - x1 > std::numeric_limits<int32_t>::max() || y2 - y1 > std::numeric_limits<int32_t>::max()) {
        return std::nullopt;
    }
    return Rect{static_cast<int32_t>(x1), static_cast<int32_t>(y1),
                static_cast<int32_t>(x2 - x1), static_cast<int32_t>(y2 - y1)};
}

std::optional<Rect> parseRegion(std::string_view text) {
    std::string_view rest = trim(text);
    std::string_view x, y, w, h;

    if (rest.find(',') != std::string_view::npos) {
        // "x,y WxH"
        if (!splitOnce(rest, ',', x, rest)) return std::nullopt;
        if (!splitOnce(rest, ' ', y, rest)) return std::nullopt;
        if (!splitOnce(rest, 'x', w, h)) return std::nullopt;
    } else {
        // "x y w h"
        if (!splitOnce(rest, ' ', x, rest)) return std::nullopt;
        if (!splitOnce(rest, ' ', y, rest)) return std::nullopt;
        if (!splitOnce(rest, ' ', w, h)) return std::nullopt;
    }

    Rect region;
    if (!parseInt(x, region.x) || !parseInt(y, region.y) ||
        !parseInt(w, region.width) || !parseInt(h, region.height)) {
        return std::nullopt;
    }
    if (region.empty()) return std::nullopt;
    return region;
}

} // namespace Capture
