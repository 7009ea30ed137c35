#include <pybind11/pybind11.h>
#include <pybind11/complex.h>
#include <pybind11/stl.h>

#include "clebsch_gordan.hpp"

namespace py = pybind11;

void bind_clebsch_gordan(py::module_ &m)
{
    m.def("clebsch_gordan", &clebsch_gordan, "Complex-basis Clebsch-Gordan coefficient.");
    m.def("real_to_complex_matrix", &real_to_complex_matrix, "Real to complex spherical harmonic change of basis.");
    m.def("real_clebsch_gordan", &real_clebsch_gordan, "Real-basis coupling tensor [m1][m2][m3] with unit norm.");
}
