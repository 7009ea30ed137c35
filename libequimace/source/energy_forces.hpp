#pragma once

#include <span>
#include <vector>

#include "atomic_graph.hpp"
#include "mace.hpp"
#include "model_config.hpp"
#include "parameters.hpp"

struct EnergyForceResult {
std::vector<double> graph_energies;  // [num_graphs]
std::vector<double> node_energies;   // [num_nodes]
std::vector<double> forces;          // [num_nodes][3]
};

// Total energies and forces from per-node energies
//     E_i = E0[s_i] + shift + scale * \sum_t out_t[i][0]
// differentiated in a single reverse pass through the model.
class EnergyForceDriver {

public:

EnergyForceDriver(ModelConfig config);

MACE model;

// fixed atomic energies E0 (one per species)
EnergyForceResult evaluate(const Parameters& parameters,
                           const AtomicGraph& graph,
                           std::span<const double> atomic_energies,
                           double scale = 1.0,
                           double shift = 0.0);
// atomic energies from the parameter tree
EnergyForceResult evaluate(const Parameters& parameters,
                           const AtomicGraph& graph,
                           double scale = 1.0,
                           double shift = 0.0);

private:

EnergyForceResult compute(const Parameters& parameters,
                          const AtomicGraph& graph,
                          std::span<const double> atomic_energies,
                          double scale,
                          double shift);

};
