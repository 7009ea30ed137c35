#pragma once

#include <span>
#include <vector>

#include "atomic_graph.hpp"

// Mean number of incoming edges over the nodes that receive at least one
// valid edge, pooled over all graphs. Throws ConfigurationError without edges
// and DomainError for a graph that fails validate().
double compute_avg_num_neighbors(const std::vector<AtomicGraph>& graphs);

// Mean over structures of the shortest valid edge. Throws ConfigurationError without edges.
double compute_avg_min_neighbor_distance(const std::vector<AtomicGraph>& graphs);

// Throws ConfigurationError if a valid node has species >= num_species
void check_num_species(int num_species, const std::vector<AtomicGraph>& graphs);

// Energy model E_i = E0[s_i] + shift + scale * sum of contributions
struct EnergyScaling {
    double shift;
    double scale;
};

// The remaining helpers read the reference labels of the valid structures
// and throw ConfigurationError when a graph carries none.

// shift and scale are the mean and standard deviation of (E - sum E0)/n_atoms
EnergyScaling compute_mean_std_atomic_inter_energy(
    const std::vector<AtomicGraph>& graphs,
    std::span<const double> atomic_energies);

// shift is the mean of (E - sum E0)/n_atoms, scale the RMS force component
EnergyScaling compute_mean_rms_energy_forces(
    const std::vector<AtomicGraph>& graphs,
    std::span<const double> atomic_energies);

// Least-squares E0 per species from E ~ sum_s count_s E0[s]. Species absent
// from the data get 0. If the counts do not determine E0, a warning is
// written to std::cerr and all entries are 0.
std::vector<double> compute_average_atomic_energies(
    int num_species,
    const std::vector<AtomicGraph>& graphs);
