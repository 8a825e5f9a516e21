#include "buffer.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <string>

namespace IMGBuffer {

namespace {

struct Contribution {
    std::size_t first = 0;
    std::vector<float> weights;
};

// Per destination sample: the source samples it reads and their weights.
std::vector<Contribution> triangleWeights(std::size_t srcLen, std::size_t dstLen) {
    std::vector<Contribution> result(dstLen);
    const double scale = static_cast<double>(srcLen) / static_cast<double>(dstLen);
    const double radius = std::max(scale, 1.0);

    for (std::size_t i = 0; i < dstLen; ++i) {
        const double center = (static_cast<double>(i) + 0.5) * scale;
        const double lo = std::max(0.0, std::floor(center - radius));
        const double hi = std::min(static_cast<double>(srcLen), std::ceil(center + radius));

        Contribution& c = result[i];
        c.first = static_cast<std::size_t>(lo);

        float sum = 0.0f;
        for (std::size_t j = c.first; j < static_cast<std::size_t>(hi); ++j) {
            const double d = std::fabs((static_cast<double>(j) + 0.5 - center) / radius);
            const float w = d < 1.0 ? static_cast<float>(1.0 - d) : 0.0f;
            c.weights.push_back(w);
            sum += w;
        }

        if (sum > 0.0f) {
            for (float& w : c.weights) {
                w /= sum;
            }
        } else {
            // Unreachable for non-empty inputs; fall back to nearest sample.
            c.first = std::min(static_cast<std::size_t>(center), srcLen - 1);
            c.weights.assign(1, 1.0f);
        }
    }
    return result;
}

std::uint8_t toByte(float v) {
    const float r = std::round(v);
    if (r <= 0.0f) return 0;
    if (r >= 255.0f) return 255;
    return static_cast<std::uint8_t>(r);
}

} // namespace

Buffer::Buffer(std::size_t width, std::size_t height) {
    resize(width, height);
}

void Buffer::resize(std::size_t width, std::size_t height) {
    m_width = width;
    m_height = height;
    m_stride = width * 4; // RGBA8

    m_data.resize(m_stride * m_height);
}

std::size_t Buffer::width() const noexcept {
    return m_width;
}

std::size_t Buffer::height() const noexcept {
    return m_height;
}

std::size_t Buffer::stride() const noexcept {
    return m_stride;
}

bool Buffer::empty() const noexcept {
    return m_width == 0 || m_height == 0;
}

std::uint8_t* Buffer::data() noexcept {
    return m_data.data();
}

const std::uint8_t* Buffer::data() const noexcept {
    return m_data.data();
}

std::uint8_t* Buffer::row(std::size_t y) noexcept {
    return m_data.data() + y * m_stride;
}

const std::uint8_t* Buffer::row(std::size_t y) const noexcept {
    return m_data.data() + y * m_stride;
}

std::uint8_t* Buffer::pixel(std::size_t x, std::size_t y) noexcept {
    return row(y) + x * 4;
}

const std::uint8_t* Buffer::pixel(std::size_t x, std::size_t y) const noexcept {
    return row(y) + x * 4;
}

void Buffer::flipVertical() {
    if (m_height < 2) return;

    std::vector<std::uint8_t> tmp(m_stride);
    for (std::size_t top = 0, bottom = m_height - 1; top < bottom; ++top, --bottom) {
        std::memcpy(tmp.data(), row(top), m_stride);
        std::memcpy(row(top), row(bottom), m_stride);
        std::memcpy(row(bottom), tmp.data(), m_stride);
    }
}

void Buffer::copyFrom(const Buffer& src, std::size_t x, std::size_t y) {
    if (x > m_width || y > m_height ||
        src.width() > m_width - x || src.height() > m_height - y) {
        throw std::out_of_range(
            "image " + std::to_string(src.width()) + "x" + std::to_string(src.height()) +
            " at (" + std::to_string(x) + ", " + std::to_string(y) + ") exceeds " +
            std::to_string(m_width) + "x" + std::to_string(m_height) + " canvas");
    }

    for (std::size_t r = 0; r < src.height(); ++r) {
        std::memcpy(pixel(x, y + r), src.row(r), src.stride());
    }
}

Buffer Buffer::resized(std::size_t width, std::size_t height) const {
    if (width == m_width && height == m_height) {
        return *this;
    }

    Buffer out(width, height);
    if (empty() || out.empty()) {
        return out;
    }

    const auto horizontal = triangleWeights(m_width, width);
    const auto vertical = triangleWeights(m_height, height);

    // Horizontal pass into a float image of width x m_height.
    std::vector<float> tmp(width * m_height * 4);
    for (std::size_t y = 0; y < m_height; ++y) {
        const std::uint8_t* src = row(y);
        float* dst = tmp.data() + y * width * 4;
        for (std::size_t x = 0; x < width; ++x) {
            const Contribution& c = horizontal[x];
            float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
            for (std::size_t k = 0; k < c.weights.size(); ++k) {
                const std::uint8_t* p = src + (c.first + k) * 4;
                for (int ch = 0; ch < 4; ++ch) {
                    acc[ch] += c.weights[k] * p[ch];
                }
            }
            std::copy(acc, acc + 4, dst + x * 4);
        }
    }

    // Vertical pass.
    for (std::size_t y = 0; y < height; ++y) {
        const Contribution& c = vertical[y];
        std::uint8_t* dst = out.row(y);
        for (std::size_t x = 0; x < width; ++x) {
            float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
            for (std::size_t k = 0; k < c.weights.size(); ++k) {
                const float* p = tmp.data() + ((c.first + k) * width + x) * 4;
                for (int ch = 0; ch < 4; ++ch) {
                    acc[ch] += c.weights[k] * p[ch];
                }
            }
            for (int ch = 0; ch < 4; ++ch) {
                dst[x * 4 + ch] = toByte(acc[ch]);
            }
        }
    }

    return out;
}

} // namespace IMGBuffer
