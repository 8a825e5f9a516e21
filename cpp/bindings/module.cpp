#include <pybind11/pybind11.h>

namespace py = pybind11;

void bind_imgbuffer(py::module_&);
void bind_capture(py::module_&);

PYBIND11_MODULE(wlsnap, m) {
    m.doc() = "Wayland screenshots through wlr-screencopy";
    bind_imgbuffer(m);
    bind_capture(m);
}
