#pragma once
#include <pybind11/pybind11.h>
namespace py = pybind11;

void bind_enums_and_structs(py::module_& m);
void bind_exceptions(py::module_& m);
void bind_requests(py::module_& m);
void bind_core(py::module_& m);
void bind_monitors(py::module_& m);
