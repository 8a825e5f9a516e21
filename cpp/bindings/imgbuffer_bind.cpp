#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

#include <buffer.hpp>
#include <encoder.hpp>

namespace py = pybind11;

void bind_imgbuffer(py::module_ &m)
{
    py::class_<IMGBuffer::Buffer, std::shared_ptr<IMGBuffer::Buffer>>(m, "Buffer", py::buffer_protocol(), R"doc(
        An RGBA8 screenshot held in C++ memory.
    )doc")
        .def(py::init<>())
        .def(py::init<std::size_t, std::size_t>(),
             py::arg("width"),
             py::arg("height"),
             "Constructs a transparent black image of the given size.")

        .def_property_readonly("width", &IMGBuffer::Buffer::width, "The width of the image in pixels.")
        .def_property_readonly("height", &IMGBuffer::Buffer::height, "The height of the image in pixels.")
        .def_property_readonly("stride", &IMGBuffer::Buffer::stride, "The number of bytes per row (Width * 4).")

        .def("resized", &IMGBuffer::Buffer::resized,
             py::arg("width"),
             py::arg("height"),
             "Returns a resampled copy of the image.")

        .def("save", [](const IMGBuffer::Buffer &b, const std::string &path, const std::string &ext) {
            auto format = IMGBuffer::parseEncodingFormat(ext);
            if (!format) {
                throw std::invalid_argument("Unknown extension '" + ext + "'");
            }
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw std::runtime_error("Failed to open '" + path + "' for writing");
            }
            IMGBuffer::writeImage(file, b, *format);
        }, py::arg("path"), py::arg("extension") = "png",
           "Encodes the image as png, jpg or ppm and writes it to path.")

        // Expose as a NumPy-compatible array without copying memory
        .def_property_readonly("view", [](py::object self) {
            auto &b = self.cast<IMGBuffer::Buffer &>();
            return py::array_t<std::uint8_t>(
                { b.height(), b.width(), std::size_t(4) },      // Shape: (H, W, C)
                { b.stride(), std::size_t(4), std::size_t(1) }, // Strides in bytes
                b.data(),
                self                                            // Keep the Buffer alive while the array exists
            );
        }, "Returns a zero-copy NumPy view of the pixels, shape (height, width, 4).")

        // Enables support for: np.array(buffer_instance) or memoryview(buffer_instance)
        .def_buffer([](IMGBuffer::Buffer &b) -> py::buffer_info {
            return py::buffer_info(
                b.data(),
                sizeof(std::uint8_t),
                py::format_descriptor<std::uint8_t>::format(),
                3,
                { b.height(), b.width(), std::size_t(4) },
                {
                    static_cast<py::ssize_t>(b.stride()),
                    static_cast<py::ssize_t>(4),
                    static_cast<py::ssize_t>(1)
                }
            );
        });
}
