#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace IMGBuffer {

// Tightly packed RGBA8 image (stride == width * 4).
class Buffer {
public:
    Buffer() = default;
    Buffer(std::size_t width, std::size_t height);

    void resize(std::size_t width, std::size_t height);

    std::size_t width() const noexcept;
    std::size_t height() const noexcept;
    std::size_t stride() const noexcept;
    bool empty() const noexcept;

    std::uint8_t* data() noexcept;
    const std::uint8_t* data() const noexcept;

    std::uint8_t* row(std::size_t y) noexcept;
    const std::uint8_t* row(std::size_t y) const noexcept;

    // Points at the 4 bytes (R, G, B, A) of pixel (x, y). No bounds check.
    std::uint8_t* pixel(std::size_t x, std::size_t y) noexcept;
    const std::uint8_t* pixel(std::size_t x, std::size_t y) const noexcept;

    void flipVertical();

    /**
     * @brief Copies src into this buffer with its top-left corner at (x, y)
     * @throws std::out_of_range if src does not fit entirely
     */
    void copyFrom(const Buffer& src, std::size_t x, std::size_t y);

    /**
     * @brief Returns this image resampled to width x height
     *
     * Uses a separable triangle filter whose support widens when
     * shrinking, so downscaling averages over the covered area.
     */
    Buffer resized(std::size_t width, std::size_t height) const;

private:
    std::size_t m_width{};
    std::size_t m_height{};
    std::size_t m_stride{};
    std::vector<std::uint8_t> m_data;
};

} // namespace IMGBuffer
