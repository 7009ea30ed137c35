#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "spherical_harmonic.hpp"

namespace py = pybind11;

void bind_spherical_harmonic(py::module_ &m)
{
    m.def("compute_Y",
        [](int l_max, std::vector<double> xyz) {
            return compute_Y(l_max, xyz);
        },
        "Real spherical harmonics with component normalization.");
    m.def("compute_Y_with_gradients",
        [](int l_max, std::vector<double> xyz) {
            auto Y = std::vector<double>();
            auto Y_grad = std::vector<double>();
            compute_Y(l_max, xyz, Y, Y_grad);
            return py::make_tuple(Y, Y_grad);
        },
        "Real spherical harmonics and their gradients.");
}
