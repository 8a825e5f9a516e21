#pragma once
#include "Geometry.hpp"

#include <buffer.hpp>

namespace Capture {

/**
 * @brief Stitches per-output frames into one canvas
 *
 * The canvas covers bounds (the bounding box of every overlap). Pixels no
 * frame covers stay transparent black.
 */
class Compositor {
public:
    explicit Compositor(const Rect& bounds);

    const Rect& bounds() const noexcept { return m_bounds; }

    /**
     * @brief Scales frame to the pixel size of overlap and copies it in
     *
     * overlap is in global logical coordinates; the frame is at the
     * output's physical resolution, so scaled outputs are resampled.
     * @throws std::out_of_range if overlap is not inside bounds
     */
    void place(const IMGBuffer::Buffer& frame, const Rect& overlap);

    const IMGBuffer::Buffer& canvas() const noexcept { return m_canvas; }
    IMGBuffer::Buffer take();

private:
    Rect m_bounds;
    IMGBuffer::Buffer m_canvas;
};

} // namespace Capture
