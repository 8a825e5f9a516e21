#include "encoder.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include <jpeglib.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace IMGBuffer {

namespace {

constexpr int kJpegQuality = 90;

void streamWrite(void* context, void* data, int size) {
    auto* out = static_cast<std::ostream*>(context);
    out->write(static_cast<const char*>(data), size);
}

std::vector<std::uint8_t> rgbRow(const Buffer& image, std::size_t y) {
    std::vector<std::uint8_t> row(image.width() * 3);
    const std::uint8_t* src = image.row(y);
    for (std::size_t x = 0; x < image.width(); ++x) {
        row[x * 3 + 0] = src[x * 4 + 0];
        row[x * 3 + 1] = src[x * 4 + 1];
        row[x * 3 + 2] = src[x * 4 + 2];
    }
    return row;
}

void writePng(std::ostream& out, const Buffer& image) {
    const int ok = stbi_write_png_to_func(streamWrite, &out,
                                          static_cast<int>(image.width()),
                                          static_cast<int>(image.height()),
                                          4, image.data(),
                                          static_cast<int>(image.stride()));
    if (!ok) {
        throw std::runtime_error("PNG encoding failed");
    }
}

void writeJpeg(std::ostream& out, const Buffer& image) {
    jpeg_compress_struct cinfo;
    jpeg_error_mgr jerr;
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);

    cinfo.image_width = static_cast<JDIMENSION>(image.width());
    cinfo.image_height = static_cast<JDIMENSION>(image.height());
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;

    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, kJpegQuality, TRUE);

    unsigned char* jpegBuffer = nullptr;
    unsigned long jpegSize = 0;
    jpeg_mem_dest(&cinfo, &jpegBuffer, &jpegSize);

    jpeg_start_compress(&cinfo, TRUE);
    for (std::size_t y = 0; y < image.height(); ++y) {
        std::vector<std::uint8_t> row = rgbRow(image, y);
        JSAMPROW rowPointer[1] = {row.data()};
        jpeg_write_scanlines(&cinfo, rowPointer, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    if (jpegBuffer && jpegSize > 0) {
        out.write(reinterpret_cast<const char*>(jpegBuffer), static_cast<std::streamsize>(jpegSize));
    }
    std::free(jpegBuffer);

    if (jpegSize == 0) {
        throw std::runtime_error("JPEG encoding produced no data");
    }
}

void writePpm(std::ostream& out, const Buffer& image) {
    out << "P6\n" << image.width() << " " << image.height() << "\n255\n";
    for (std::size_t y = 0; y < image.height(); ++y) {
        std::vector<std::uint8_t> row = rgbRow(image, y);
        out.write(reinterpret_cast<const char*>(row.data()), static_cast<std::streamsize>(row.size()));
    }
}

} // namespace

std::optional<EncodingFormat> parseEncodingFormat(std::string_view name) {
    std::string ext;
    for (char c : name) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            ext += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (!ext.empty()) {
            break;
        }
    }

    if (ext == "png") return EncodingFormat::Png;
    if (ext == "jpg" || ext == "jpeg") return EncodingFormat::Jpg;
    if (ext == "ppm") return EncodingFormat::Ppm;
    return std::nullopt;
}

const char* extension(EncodingFormat format) noexcept {
    switch (format) {
        case EncodingFormat::Png: return "png";
        case EncodingFormat::Jpg: return "jpg";
        case EncodingFormat::Ppm: return "ppm";
    }
    return "png";
}

void writeImage(std::ostream& out, const Buffer& image, EncodingFormat format) {
    if (image.empty()) {
        throw std::runtime_error("refusing to encode an empty image");
    }

    switch (format) {
        case EncodingFormat::Png: writePng(out, image); break;
        case EncodingFormat::Jpg: writeJpeg(out, image); break;
        case EncodingFormat::Ppm: writePpm(out, image); break;
    }

    out.flush();
    if (!out) {
        throw std::runtime_error("failed to write encoded image");
    }
}

} // namespace IMGBuffer
