#pragma once

#include "buffer.hpp"

#include <optional>
#include <ostream>
#include <string_view>

namespace IMGBuffer {

enum class EncodingFormat {
    Png,
    Jpg,
    Ppm
};

// Accepts png, jpg, jpeg and ppm, ignoring case and surrounding whitespace.
std::optional<EncodingFormat> parseEncodingFormat(std::string_view name);

// File extension without the dot.
const char* extension(EncodingFormat format) noexcept;

/**
 * @brief Encodes image into out
 *
 * JPEG and PPM have no alpha channel; alpha is dropped.
 * @throws std::runtime_error on encoder or stream failure
 */
void writeImage(std::ostream& out, const Buffer& image, EncodingFormat format);

} // namespace IMGBuffer
