#include "pixel_format.hpp"

#include <cctype>
#include <cstdio>

namespace IMGBuffer {

namespace {

// Source byte offsets for R, G, B and A. alpha < 0 means opaque.
struct ChannelMap {
    int red;
    int green;
    int blue;
    int alpha;
};

bool channelMap(std::uint32_t format, ChannelMap& map) {
    switch (static_cast<PixelFormat>(format)) {
        case PixelFormat::ARGB8888: map = {2, 1, 0, 3}; return true;   // B G R A
        case PixelFormat::XRGB8888: map = {2, 1, 0, -1}; return true;  // B G R X
        case PixelFormat::ABGR8888: map = {0, 1, 2, 3}; return true;   // R G B A
        case PixelFormat::XBGR8888: map = {0, 1, 2, -1}; return true;  // R G B X
        case PixelFormat::RGBA8888: map = {3, 2, 1, 0}; return true;   // A B G R
        case PixelFormat::RGBX8888: map = {3, 2, 1, -1}; return true;  // X B G R
        case PixelFormat::BGRA8888: map = {1, 2, 3, 0}; return true;   // A R G B
        case PixelFormat::BGRX8888: map = {1, 2, 3, -1}; return true;  // X R G B
    }
    return false;
}

} // namespace

UnsupportedFormat::UnsupportedFormat(std::uint32_t format)
    : std::runtime_error("Unsupported buffer format: " + formatName(format)),
      m_format(format) {}

bool isSupported(std::uint32_t format) noexcept {
    ChannelMap map{};
    return channelMap(format, map);
}

std::string formatName(std::uint32_t format) {
    switch (static_cast<PixelFormat>(format)) {
        case PixelFormat::ARGB8888: return "ARGB8888";
        case PixelFormat::XRGB8888: return "XRGB8888";
        case PixelFormat::ABGR8888: return "ABGR8888";
        case PixelFormat::XBGR8888: return "XBGR8888";
        case PixelFormat::RGBA8888: return "RGBA8888";
        case PixelFormat::RGBX8888: return "RGBX8888";
        case PixelFormat::BGRA8888: return "BGRA8888";
        case PixelFormat::BGRX8888: return "BGRX8888";
    }

    char hex[16];
    std::snprintf(hex, sizeof(hex), "0x%08x", format);

    std::string fourcc;
    for (int shift = 0; shift < 32; shift += 8) {
        const char c = static_cast<char>((format >> shift) & 0xff);
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return hex;
        }
        fourcc += c;
    }
    return fourcc + " (" + hex + ")";
}

Buffer normalize(const std::uint8_t* data, std::size_t size, const FrameLayout& layout) {
    ChannelMap map{};
    if (!channelMap(layout.format, map)) {
        throw UnsupportedFormat(layout.format);
    }

    const std::size_t rowBytes = static_cast<std::size_t>(layout.width) * 4;
    if (layout.stride < rowBytes) {
        throw std::invalid_argument("stride " + std::to_string(layout.stride) +
                                    " is smaller than a row of " + std::to_string(rowBytes) + " bytes");
    }
    if (size < layout.byteSize()) {
        throw std::invalid_argument("frame of " + std::to_string(size) + " bytes is smaller than stride * height (" +
                                    std::to_string(layout.byteSize()) + ")");
    }

    Buffer out(layout.width, layout.height);
    for (std::size_t y = 0; y < layout.height; ++y) {
        const std::uint8_t* src = data + y * layout.stride;
        std::uint8_t* dst = out.row(y);
        for (std::size_t x = 0; x < layout.width; ++x, src += 4, dst += 4) {
            dst[0] = src[map.red];
            dst[1] = src[map.green];
            dst[2] = src[map.blue];
            dst[3] = map.alpha < 0 ? 0xff : src[map.alpha];
        }
    }
    return out;
}

} // namespace IMGBuffer
