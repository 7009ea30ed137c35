#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "tools.hpp"

#include "calibration.hpp"

namespace {

// species counts and energy of every valid structure
struct StructureCounts {
    std::vector<std::vector<int>> counts;
    std::vector<double> energies;
};

StructureCounts count_species(int num_species, const std::vector<AtomicGraph>& graphs)
{
    StructureCounts data;
    for (int g=0; g<graphs.size(); ++g) {
        const auto& graph = graphs[g];
        graph.validate();
        if (graph.energies.empty())
            throw ConfigurationError("Graph " + std::to_string(g) + " has no reference energies");
        const auto node_graph = graph.node_graph();
        const int first = data.counts.size();
        for (int k=0; k<graph.num_graphs(); ++k) {
            data.counts.push_back(std::vector<int>(num_species, 0));
            data.energies.push_back(graph.energies[k]);
        }
        for (int i=0; i<graph.num_nodes(); ++i) {
            if (not graph.node_valid(i))
                continue;
            if (graph.species[i] < 0 or graph.species[i] >= num_species)
                throw ConfigurationError("Graph " + std::to_string(g) + " has species " + std::to_string(graph.species[i])
                    + " but num_species=" + std::to_string(num_species));
            data.counts[first+node_graph[i]][graph.species[i]] += 1;
        }
        // drop masked structures
        for (int k=graph.num_graphs()-1; k>=0; --k) {
            if (not graph.graph_valid(k)) {
                data.counts.erase(data.counts.begin()+first+k);
                data.energies.erase(data.energies.begin()+first+k);
            }
        }
    }
    return data;
}

// (E - sum E0)/n_atoms for every valid structure with atoms
std::vector<double> interaction_energy_per_atom(
    const std::vector<AtomicGraph>& graphs,
    std::span<const double> atomic_energies)
{
    const auto data = count_species(atomic_energies.size(), graphs);
    auto per_atom = std::vector<double>();
    for (int k=0; k<data.counts.size(); ++k) {
        int n = 0;
        double E0 = 0.0;
        for (int s=0; s<atomic_energies.size(); ++s) {
            n += data.counts[k][s];
            E0 += data.counts[k][s]*atomic_energies[s];
        }
        if (n > 0)
            per_atom.push_back((data.energies[k] - E0)/n);
    }
    if (per_atom.empty())
        throw ConfigurationError("No structure with atoms to compute energy statistics from");
    return per_atom;
}

double mean(const std::vector<double>& x)
{
    double s = 0.0;
    for (auto v : x)
        s += v;
    return s/x.size();
}

}

double compute_avg_num_neighbors(const std::vector<AtomicGraph>& graphs)
{
    long num_edges = 0;
    long num_receivers = 0;
    for (const auto& graph : graphs) {
        graph.validate();
        auto in_degree = std::vector<int>(graph.num_nodes(), 0);
        for (int e=0; e<graph.num_edges(); ++e)
            if (graph.edge_valid(e))
                in_degree[graph.receivers[e]] += 1;
        for (auto n : in_degree) {
            num_edges += n;
            num_receivers += (n > 0);
        }
    }
    if (num_receivers == 0)
        throw ConfigurationError("Cannot compute the average number of neighbors of graphs without edges");
    return static_cast<double>(num_edges) / num_receivers;
}

double compute_avg_min_neighbor_distance(const std::vector<AtomicGraph>& graphs)
{
    double sum = 0.0;
    int count = 0;
    for (const auto& graph : graphs) {
        graph.validate();
        const auto vectors = graph.edge_vectors();
        const auto edge_graph = graph.edge_graph();
        auto r_min = std::vector<double>(graph.num_graphs(), std::numeric_limits<double>::infinity());
        for (int e=0; e<graph.num_edges(); ++e) {
            if (not graph.edge_valid(e) or not graph.graph_valid(edge_graph[e]))
                continue;
            const auto v = vectors.data() + 3*e;
            r_min[edge_graph[e]] = std::min(r_min[edge_graph[e]], std::sqrt(v[0]*v[0] + v[1]*v[1] + v[2]*v[2]));
        }
        for (auto r : r_min) {
            if (std::isfinite(r)) {
                sum += r;
                count += 1;
            }
        }
    }
    if (count == 0)
        throw ConfigurationError("Cannot compute the average minimum neighbor distance of graphs without edges");
    return sum/count;
}

void check_num_species(int num_species, const std::vector<AtomicGraph>& graphs)
{
    for (int g=0; g<graphs.size(); ++g) {
        const auto& graph = graphs[g];
        graph.validate();
        for (int i=0; i<graph.num_nodes(); ++i) {
            if (graph.node_valid(i) and (graph.species[i] < 0 or graph.species[i] >= num_species))
                throw ConfigurationError("Graph " + std::to_string(g) + " has species " + std::to_string(graph.species[i])
                    + " but num_species=" + std::to_string(num_species));
        }
    }
}

EnergyScaling compute_mean_std_atomic_inter_energy(
    const std::vector<AtomicGraph>& graphs,
    std::span<const double> atomic_energies)
{
    const auto per_atom = interaction_energy_per_atom(graphs, atomic_energies);
    const double shift = mean(per_atom);
    double variance = 0.0;
    for (auto x : per_atom)
        variance += (x-shift)*(x-shift);
    variance /= per_atom.size();
    return {shift, std::sqrt(variance)};
}

EnergyScaling compute_mean_rms_energy_forces(
    const std::vector<AtomicGraph>& graphs,
    std::span<const double> atomic_energies)
{
    const double shift = mean(interaction_energy_per_atom(graphs, atomic_energies));
    double sum_squares = 0.0;
    long count = 0;
    for (int g=0; g<graphs.size(); ++g) {
        const auto& graph = graphs[g];
        if (graph.forces.empty())
            throw ConfigurationError("Graph " + std::to_string(g) + " has no reference forces");
        const auto node_graph = graph.node_graph();
        for (int i=0; i<graph.num_nodes(); ++i) {
            if (not graph.node_valid(i) or not graph.graph_valid(node_graph[i]))
                continue;
            for (int a=0; a<3; ++a)
                sum_squares += graph.forces[3*i+a]*graph.forces[3*i+a];
            count += 3;
        }
    }
    return {shift, std::sqrt(sum_squares/count)};
}

std::vector<double> compute_average_atomic_energies(
    int num_species,
    const std::vector<AtomicGraph>& graphs)
{
    const auto data = count_species(num_species, graphs);

    // columns for the species present in the data
    auto present = std::vector<int>();
    for (int s=0; s<num_species; ++s) {
        for (const auto& counts : data.counts) {
            if (counts[s] > 0) {
                present.push_back(s);
                break;
            }
        }
    }
    const int n = present.size();
    auto atomic_energies = std::vector<double>(num_species, 0.0);
    if (n == 0)
        return atomic_energies;

    // normal equations (A^T A) x = A^T E
    auto AtA = std::vector<double>(n*n, 0.0);
    auto AtE = std::vector<double>(n, 0.0);
    for (int k=0; k<data.counts.size(); ++k) {
        for (int a=0; a<n; ++a) {
            const double c_a = data.counts[k][present[a]];
            AtE[a] += c_a*data.energies[k];
            for (int b=0; b<n; ++b)
                AtA[a*n+b] += c_a*data.counts[k][present[b]];
        }
    }
    try {
        const auto x = _solve_linear_system(AtA, AtE);
        for (int a=0; a<n; ++a)
            atomic_energies[present[a]] = x[a];
    } catch (const std::invalid_argument&) {
        std::cerr << "Warning: species counts do not determine the atomic energies, using zeros" << std::endl;
    }
    return atomic_energies;
}
