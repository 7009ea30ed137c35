#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "errors.hpp"

namespace py = pybind11;

void bind_clebsch_gordan(py::module_ &m);
void bind_energy_forces(py::module_ &m);
void bind_irreps(py::module_ &m);
void bind_mace(py::module_ &m);
void bind_multivariate_polynomial(py::module_ &m);
void bind_parameters(py::module_ &m);
void bind_radial_embedding(py::module_ &m);
void bind_spherical_harmonic(py::module_ &m);

PYBIND11_MODULE(equimace, m)
{
    m.doc() = "equimace";

    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<DomainError>(m, "DomainError", PyExc_ValueError);
    py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError", PyExc_RuntimeError);

    bind_clebsch_gordan(m);
    bind_energy_forces(m);
    bind_irreps(m);
    bind_mace(m);
    bind_multivariate_polynomial(m);
    bind_parameters(m);
    bind_radial_embedding(m);
    bind_spherical_harmonic(m);
}
