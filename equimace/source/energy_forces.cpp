#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "calibration.hpp"
#include "energy_forces.hpp"

namespace py = pybind11;

void bind_energy_forces(py::module_ &m)
{
    py::class_<AtomicGraph>(m, "AtomicGraph")
        .def(py::init<>())
        .def_readwrite("positions", &AtomicGraph::positions)
        .def_readwrite("species", &AtomicGraph::species)
        .def_readwrite("senders", &AtomicGraph::senders)
        .def_readwrite("receivers", &AtomicGraph::receivers)
        .def_readwrite("shifts", &AtomicGraph::shifts)
        .def_readwrite("cells", &AtomicGraph::cells)
        .def_readwrite("n_node", &AtomicGraph::n_node)
        .def_readwrite("n_edge", &AtomicGraph::n_edge)
        .def_readwrite("node_mask", &AtomicGraph::node_mask)
        .def_readwrite("edge_mask", &AtomicGraph::edge_mask)
        .def_readwrite("graph_mask", &AtomicGraph::graph_mask)
        .def_readwrite("energies", &AtomicGraph::energies)
        .def_readwrite("forces", &AtomicGraph::forces)
        .def("edge_vectors", [](const AtomicGraph& self) { return self.edge_vectors(); })
        .def("validate", &AtomicGraph::validate);

    py::class_<EnergyForceResult>(m, "EnergyForceResult")
        .def_readonly("graph_energies", &EnergyForceResult::graph_energies)
        .def_readonly("node_energies", &EnergyForceResult::node_energies)
        .def_readonly("forces", &EnergyForceResult::forces);

    py::class_<EnergyForceDriver>(m, "EnergyForceDriver")
        .def(py::init<ModelConfig>())
        .def_readonly("model", &EnergyForceDriver::model)
        .def("evaluate",
            [](EnergyForceDriver& self, const Parameters& parameters, const AtomicGraph& graph,
               std::vector<double> atomic_energies, double scale, double shift) {
                return self.evaluate(parameters, graph, atomic_energies, scale, shift);
            },
            py::arg("parameters"), py::arg("graph"), py::arg("atomic_energies"),
            py::arg("scale") = 1.0, py::arg("shift") = 0.0)
        .def("evaluate_learnable",
            [](EnergyForceDriver& self, const Parameters& parameters, const AtomicGraph& graph,
               double scale, double shift) {
                return self.evaluate(parameters, graph, scale, shift);
            },
            py::arg("parameters"), py::arg("graph"), py::arg("scale") = 1.0, py::arg("shift") = 0.0);

    m.def("compute_avg_num_neighbors", &compute_avg_num_neighbors, "Mean in-degree of nodes with neighbors.");
    m.def("compute_avg_min_neighbor_distance", &compute_avg_min_neighbor_distance,
        "Mean over structures of the shortest edge.");
    m.def("check_num_species", &check_num_species, "Check species indices against num_species.");

    py::class_<EnergyScaling>(m, "EnergyScaling")
        .def_readonly("shift", &EnergyScaling::shift)
        .def_readonly("scale", &EnergyScaling::scale);
    m.def("std_scaling",
        [](const std::vector<AtomicGraph>& graphs, std::vector<double> atomic_energies) {
            return compute_mean_std_atomic_inter_energy(graphs, atomic_energies);
        },
        "Mean and standard deviation of the interaction energy per atom.");
    m.def("rms_forces_scaling",
        [](const std::vector<AtomicGraph>& graphs, std::vector<double> atomic_energies) {
            return compute_mean_rms_energy_forces(graphs, atomic_energies);
        },
        "Mean interaction energy per atom and RMS force component.");
    m.def("compute_average_atomic_energies", &compute_average_atomic_energies,
        "Least-squares atomic energies per species.");
}
