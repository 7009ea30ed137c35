#include <pybind11/pybind11.h>
#include <pybind11/operators.h>
#include <pybind11/stl.h>

#include "irreps.hpp"

namespace py = pybind11;

void bind_irreps(py::module_ &m)
{
    py::class_<Irrep>(m, "Irrep")
        .def(py::init<int,int>())
        .def(py::init<const std::string&>())
        .def_readonly("l", &Irrep::l)
        .def_readonly("p", &Irrep::p)
        .def("dim", &Irrep::dim)
        .def("__repr__", &Irrep::to_string)
        .def(py::self == py::self)
        .def(py::self < py::self)
        .def_static("iterator", &Irrep::iterator);

    m.def("coupled_irreps", &coupled_irreps, "Irreps allowed in the product of two irreps.");

    py::class_<Irreps>(m, "Irreps")
        .def(py::init<const std::string&>())
        .def_static("spherical_harmonics", &Irreps::spherical_harmonics)
        .def("dim", &Irreps::dim)
        .def("lmax", &Irreps::lmax)
        .def("count", &Irreps::count)
        .def("__len__", &Irreps::size)
        .def("__repr__", &Irreps::to_string)
        .def(py::self == py::self);
}
