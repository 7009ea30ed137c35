#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "radial_embedding.hpp"

namespace py = pybind11;

void bind_radial_embedding(py::module_ &m)
{
    py::class_<Envelope>(m, "Envelope")
        .def_static("polynomial", &Envelope::polynomial)
        .def_static("soft", &Envelope::soft)
        .def("evaluate", &Envelope::evaluate)
        .def("__repr__", &Envelope::to_string);

    py::class_<RadialEmbedding>(m, "RadialEmbedding")
        .def(py::init<double,int,std::optional<int>,std::optional<int>,double,double,std::optional<double>>(),
             py::arg("r_max"), py::arg("num_bessel"),
             py::arg("num_deriv_in_zero") = py::none(), py::arg("num_deriv_in_one") = py::none(),
             py::arg("arg_multiplicator") = 2.0, py::arg("value_at_origin") = 1.2,
             py::arg("avg_r_min") = py::none())
        .def_readonly("envelope", &RadialEmbedding::envelope)
        .def_readonly("normalization", &RadialEmbedding::normalization)
        .def("compute_R",
            [](const RadialEmbedding& self, std::vector<double> r) {
                auto R = std::vector<double>();
                auto R_deriv = std::vector<double>();
                self.compute_R(r, R, R_deriv);
                return py::make_tuple(R, R_deriv);
            });
}
