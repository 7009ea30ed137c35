#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "model_config.hpp"
#include "parameters.hpp"

namespace py = pybind11;

void bind_parameters(py::module_ &m)
{
    py::class_<Tensor>(m, "Tensor")
        .def_readonly("shape", &Tensor::shape)
        .def_readwrite("values", &Tensor::values);

    py::class_<Parameters>(m, "Parameters")
        .def(py::init<>())
        .def_readwrite("tensors", &Parameters::tensors)
        .def("add", &Parameters::add)
        .def("contains", &Parameters::contains)
        .def("paths", &Parameters::paths)
        .def("num_parameters", &Parameters::num_parameters)
        .def("save", &Parameters::save)
        .def_static("load", &Parameters::load);

    py::enum_<InteractionNormalization>(m, "InteractionNormalization")
        .value("epsilon", InteractionNormalization::epsilon)
        .value("sqrt_avg_num_neighbors", InteractionNormalization::sqrt_avg_num_neighbors);

    py::class_<ModelConfig>(m, "ModelConfig")
        .def(py::init<>())
        .def_readwrite("output_irreps", &ModelConfig::output_irreps)
        .def_readwrite("r_max", &ModelConfig::r_max)
        .def_readwrite("num_interactions", &ModelConfig::num_interactions)
        .def_readwrite("hidden_irreps", &ModelConfig::hidden_irreps)
        .def_readwrite("readout_mlp_irreps", &ModelConfig::readout_mlp_irreps)
        .def_readwrite("avg_num_neighbors", &ModelConfig::avg_num_neighbors)
        .def_readwrite("num_species", &ModelConfig::num_species)
        .def_readwrite("num_bessel", &ModelConfig::num_bessel)
        .def_readwrite("num_deriv_in_zero", &ModelConfig::num_deriv_in_zero)
        .def_readwrite("num_deriv_in_one", &ModelConfig::num_deriv_in_one)
        .def_readwrite("envelope_arg_multiplicator", &ModelConfig::envelope_arg_multiplicator)
        .def_readwrite("envelope_value_at_origin", &ModelConfig::envelope_value_at_origin)
        .def_readwrite("radial_mlp_hidden", &ModelConfig::radial_mlp_hidden)
        .def_readwrite("avg_r_min", &ModelConfig::avg_r_min)
        .def_readwrite("max_ell", &ModelConfig::max_ell)
        .def_readwrite("correlation", &ModelConfig::correlation)
        .def_readwrite("max_poly_order", &ModelConfig::max_poly_order)
        .def_readwrite("activation", &ModelConfig::activation)
        .def_readwrite("interaction_normalization", &ModelConfig::interaction_normalization)
        .def_readwrite("epsilon", &ModelConfig::epsilon)
        .def_readwrite("learnable_atomic_energies", &ModelConfig::learnable_atomic_energies)
        .def_readwrite("atomic_energies", &ModelConfig::atomic_energies)
        .def("validate", &ModelConfig::validate)
        .def("save", &ModelConfig::save)
        .def_static("load", &ModelConfig::load);
}
