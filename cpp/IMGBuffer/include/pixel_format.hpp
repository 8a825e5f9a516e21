#pragma once

#include "buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace IMGBuffer {

// wl_shm format codes. ARGB8888/XRGB8888 use the legacy 0 and 1, the rest
// are DRM fourcc codes. All are little-endian packed 32-bit pixels.
enum class PixelFormat : std::uint32_t {
    ARGB8888 = 0,
    XRGB8888 = 1,
    ABGR8888 = 0x34324241, // 'AB24'
    XBGR8888 = 0x34324258, // 'XB24'
    RGBA8888 = 0x34324152, // 'RA24'
    RGBX8888 = 0x34325852, // 'RX24'
    BGRA8888 = 0x34324142, // 'BA24'
    BGRX8888 = 0x34325842, // 'BX24'
};

// Layout of a raw frame as reported by the compositor.
struct FrameLayout {
    std::uint32_t format = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t stride = 0;

    std::size_t byteSize() const noexcept {
        return static_cast<std::size_t>(stride) * height;
    }
};

class UnsupportedFormat : public std::runtime_error {
public:
    explicit UnsupportedFormat(std::uint32_t format);

    std::uint32_t format() const noexcept { return m_format; }

private:
    std::uint32_t m_format;
};

bool isSupported(std::uint32_t format) noexcept;

// "ARGB8888" for known codes, the fourcc characters or hex code otherwise.
std::string formatName(std::uint32_t format);

/**
 * @brief Converts a raw frame into an RGBA8 buffer
 *
 * Reads row by row honouring layout.stride; padding past width * 4 bytes is
 * ignored. Formats without alpha produce opaque pixels.
 *
 * @throws UnsupportedFormat for layouts without a conversion
 * @throws std::invalid_argument if size or stride cannot hold the frame
 */
Buffer normalize(const std::uint8_t* data, std::size_t size, const FrameLayout& layout);

} // namespace IMGBuffer
