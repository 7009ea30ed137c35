#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <sstream>

#include "mace.hpp"

namespace py = pybind11;

void bind_mace(py::module_ &m)
{
    py::class_<MACE>(m, "MACE")
        .def(py::init<ModelConfig>())
        .def_readonly("num_features", &MACE::num_features)
        .def_readonly("num_species", &MACE::num_species)
        .def_readonly("num_layers", &MACE::num_layers)
        .def_readonly("poly_orders", &MACE::poly_orders)
        .def_readonly("shapes", &MACE::shapes)
        .def_readonly("contributions", &MACE::contributions)
        .def("init",
            [](const MACE& self, std::uint64_t seed) { return self.init(seed); })
        .def("init",
            [](MACE& self, std::uint64_t seed, const AtomicGraph& template_graph) {
                return self.init(seed, template_graph);
            })
        .def("reload_parameters",
            [](const MACE& self, const std::string& filename) { return self.reload_parameters(filename); })
        .def("forward",
            [](MACE& self,
               const Parameters& parameters,
               py::array_t<double> vectors,
               py::array_t<int> node_species,
               py::array_t<int> senders,
               py::array_t<int> receivers,
               std::vector<bool> edge_mask,
               std::vector<bool> node_mask) {
                return self.forward(
                    parameters,
                    std::span<const double>(vectors.data(), vectors.size()),
                    std::span<const int>(node_species.data(), node_species.size()),
                    std::span<const int>(senders.data(), senders.size()),
                    std::span<const int>(receivers.data(), receivers.size()),
                    edge_mask,
                    node_mask);
            },
            py::arg("parameters"), py::arg("vectors"), py::arg("node_species"),
            py::arg("senders"), py::arg("receivers"),
            py::arg("edge_mask") = std::vector<bool>(), py::arg("node_mask") = std::vector<bool>())
        .def("reverse",
            [](MACE& self, const Parameters& parameters, py::array_t<double> contributions_adj) {
                return self.reverse(
                    parameters,
                    std::span<const double>(contributions_adj.data(), contributions_adj.size()));
            })
        .def("summary",
            [](const MACE& self) {
                std::stringstream stream;
                self.log_summary(stream);
                return stream.str();
            });

    m.def("build_model",
        [](const std::string& filename) { return build_model(filename); },
        "Model from a JSON configuration file.");
    m.def("build_model",
        [](const ModelConfig& config) { return build_model(config); },
        "Model from a configuration.");
}
