#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace Capture {

// Rectangle in global logical coordinates.
struct Rect {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    bool empty() const noexcept { return width <= 0 || height <= 0; }

    // Right and bottom edges, widened so x + width cannot overflow.
    int64_t right() const noexcept { return static_cast<int64_t>(x) + width; }
    int64_t bottom() const noexcept { return static_cast<int64_t>(y) + height; }

    // Covers every output the compositor could report.
    static Rect unbounded() noexcept;

    bool operator==(const Rect& other) const noexcept {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const noexcept { return !(*this == other); }
};

/**
 * @brief Overlap of a and b
 * @return std::nullopt unless the overlap has positive width and height
 */
std::optional<Rect> intersect(const Rect& a, const Rect& b);

/**
 * @brief Smallest rectangle containing every non-empty rect
 * @return std::nullopt if there is none
 */
std::optional<Rect> boundingBox(const std::vector<Rect>& rects);

/**
 * @brief Parses a region string
 *
 * Accepts "x,y WxH" (slurp's output) and "x y w h". Width and height must
 * be positive.
 */
std::optional<Rect> parseRegion(std::string_view text);

} // namespace Capture
