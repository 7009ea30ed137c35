#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "multivariate_polynomial.hpp"

namespace py = pybind11;

void bind_multivariate_polynomial(py::module_ &m)
{
    py::class_<MultivariatePolynomial>(m, "MultivariatePolynomial")
        .def(py::init<int,std::vector<std::vector<double>>,std::vector<std::vector<int>>>())
        .def_readonly("num_outputs", &MultivariatePolynomial::num_outputs)
        .def("evaluate",
            [](MultivariatePolynomial& self, std::vector<double> x) { return self.evaluate(x); })
        .def("evaluate_simple",
            [](MultivariatePolynomial& self, std::vector<double> x) { return self.evaluate_simple(x); })
        .def("evaluate_batch",
            [](MultivariatePolynomial& self, std::vector<double> x, int batch_size) {
                return self.evaluate_batch(x, batch_size);
            })
        .def("reverse_batch",
            [](MultivariatePolynomial& self, std::vector<double> f_adj, int batch_size) {
                return self.reverse_batch(f_adj, batch_size);
            })
        ;
}
