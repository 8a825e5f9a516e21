#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>

#include "CaptureError.hpp"
#include "CaptureManager.hpp"
#include "backends/WaylandClient.hpp"

namespace py = pybind11;

void bind_capture(py::module_& m) {
    using Capture::CaptureManager;

    static py::exception<Capture::CaptureError> captureError(m, "CaptureError");
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const Capture::CaptureError& e) {
            captureError(
                (std::string(Capture::errorKindName(e.kind())) + ": " + e.what()).c_str());
        }
    });

    py::class_<Capture::Rect>(m, "Rect")
        .def(py::init<>())
        .def(py::init([](int32_t x, int32_t y, int32_t w, int32_t h) { return Capture::Rect{x, y, w, h}; }),
             py::arg("x"), py::arg("y"), py::arg("width"), py::arg("height"))
        .def_readwrite("x", &Capture::Rect::x)
        .def_readwrite("y", &Capture::Rect::y)
        .def_readwrite("width", &Capture::Rect::width)
        .def_readwrite("height", &Capture::Rect::height)
        .def("__repr__", [](const Capture::Rect& r) {
            return "Rect(" + std::to_string(r.x) + ", " + std::to_string(r.y) + ", " +
                   std::to_string(r.width) + ", " + std::to_string(r.height) + ")";
        });

    py::class_<Capture::OutputInfo>(m, "Output")
        .def_readonly("name", &Capture::OutputInfo::name)
        .def_readonly("logical", &Capture::OutputInfo::logical);

    py::class_<CaptureManager>(m, "CaptureManager")
        .def(py::init([] {
            return std::make_unique<CaptureManager>(
                [] { return std::make_unique<Capture::WaylandClient>(); });
        }))
        .def("init", &CaptureManager::init,
             "Checks that the compositor supports screencopy. Raises CaptureError otherwise.")
        .def("list_outputs", &CaptureManager::listOutputs)
        .def("capture", [](CaptureManager& self, std::optional<std::string> output,
                           py::object region, bool cursor) {
                Capture::CaptureOptions options;
                options.outputName = std::move(output);
                options.withCursor = cursor;
                if (py::isinstance<py::str>(region)) {
                    const std::string text = region.cast<std::string>();
                    auto parsed = Capture::parseRegion(text);
                    if (!parsed) {
                        throw Capture::CaptureError(Capture::ErrorKind::FatalGeometry,
                                                    "Invalid geometry '" + text + "'");
                    }
                    options.region = *parsed;
                } else if (!region.is_none()) {
                    options.region = region.cast<Capture::Rect>();
                }

                // The Wayland roundtrips block; let other Python threads run.
                py::gil_scoped_release release;
                return self.capture(options);
            },
            py::arg("output") = py::none(), py::arg("region") = py::none(), py::arg("cursor") = false,
            "Takes a screenshot. Every call returns a new Buffer.")
        .def_property_readonly("last_frame", &CaptureManager::getLastFrame)
        .def_property_readonly("frame_count", &CaptureManager::getFrameCount);
}
