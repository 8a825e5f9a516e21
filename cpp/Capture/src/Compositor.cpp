#include "Compositor.hpp"
#include "Log.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace Capture {

Compositor::Compositor(const Rect& bounds)
    : m_bounds(bounds) {
    if (bounds.empty()) {
        throw std::invalid_argument("compositor bounds must have a positive size");
    }
    m_canvas.resize(static_cast<std::size_t>(bounds.width), static_cast<std::size_t>(bounds.height));
}

void Compositor::place(const IMGBuffer::Buffer& frame, const Rect& overlap) {
    if (overlap.empty() || overlap.x < m_bounds.x || overlap.y < m_bounds.y ||
        overlap.right() > m_bounds.right() || overlap.bottom() > m_bounds.bottom()) {
        throw std::out_of_range("region " + std::to_string(overlap.width) + "x" + std::to_string(overlap.height) +
                                "+" + std::to_string(overlap.x) + "+" + std::to_string(overlap.y) +
                                " lies outside the canvas");
    }

    const auto width = static_cast<std::size_t>(overlap.width);
    const auto height = static_cast<std::size_t>(overlap.height);
    const auto x = static_cast<std::size_t>(static_cast<int64_t>(overlap.x) - m_bounds.x);
    const auto y = static_cast<std::size_t>(static_cast<int64_t>(overlap.y) - m_bounds.y);

    if (frame.width() != width || frame.height() != height) {
        Log::debug() << "Scaling " << frame.width() << "x" << frame.height()
                     << " frame to " << width << "x" << height << std::endl;
        m_canvas.copyFrom(frame.resized(width, height), x, y);
    } else {
        m_canvas.copyFrom(frame, x, y);
    }
}

IMGBuffer::Buffer Compositor::take() {
    return std::move(m_canvas);
}

} // namespace Capture
