#pragma once

#include <cmath>
#include <random>
#include <vector>

#include "atomic_graph.hpp"
#include "model_config.hpp"

// Small model that keeps the tests fast
inline ModelConfig small_config(int num_species = 2)
{
    ModelConfig config;
    config.r_max = 3.0;
    config.num_interactions = 2;
    config.hidden_irreps = Irreps("4x0e+4x1o");
    config.readout_mlp_irreps = Irreps("4x0e");
    config.avg_num_neighbors = 3.0;
    config.num_species = num_species;
    config.num_bessel = 4;
    config.radial_mlp_hidden = {8, 8};
    config.max_ell = 2;
    config.correlation = 2;
    return config;
}

// two graphs: a dimer in a cubic cell and an open trimer
inline AtomicGraph batched_graph()
{
    AtomicGraph graph;
    graph.positions = {0.0, 0.0, 0.0,  0.5, 0.0, 0.0,
                       1.0, 1.0, 1.0,  2.0, 1.0, 1.0,  1.0, 2.0, 1.0};
    graph.species = {0, 1, 0, 0, 1};
    graph.senders = {1, 0, 1,  3, 4, 2};
    graph.receivers = {0, 1, 0,  2, 2, 3};
    graph.shifts = {0.0, 0.0, 0.0,  0.0, 0.0, 0.0,  -1.0, 0.0, 0.0,
                    0.0, 0.0, 0.0,  0.0, 0.0, 0.0,  0.0, 0.0, 0.0};
    graph.cells = {3.0, 0.0, 0.0,  0.0, 3.0, 0.0,  0.0, 0.0, 3.0,
                   0.0, 0.0, 0.0,  0.0, 0.0, 0.0,  0.0, 0.0, 0.0};
    graph.n_node = {2, 3};
    graph.n_edge = {3, 3};
    return graph;
}

// All ordered pairs closer than r_max
inline AtomicGraph neighbor_graph(std::vector<double> positions, std::vector<int> species, double r_max)
{
    AtomicGraph graph;
    graph.positions = positions;
    graph.species = species;
    const int n = species.size();
    for (int i=0; i<n; ++i) {
        for (int j=0; j<n; ++j) {
            if (i == j)
                continue;
            double r2 = 0.0;
            for (int a=0; a<3; ++a)
                r2 += (positions[3*i+a]-positions[3*j+a]) * (positions[3*i+a]-positions[3*j+a]);
            if (r2 < r_max*r_max) {
                graph.senders.push_back(j);
                graph.receivers.push_back(i);
            }
        }
    }
    return graph;
}

inline std::vector<double> random_positions(int n, double box, unsigned seed)
{
    auto generator = std::mt19937(seed);
    auto uniform = std::uniform_real_distribution<double>(0.0, box);
    auto positions = std::vector<double>(3*n);
    for (auto& x : positions)
        x = uniform(generator);
    return positions;
}

// rotation about the axis (1,2,3)/|(1,2,3)| by the given angle, row-major
inline std::vector<double> rotation_matrix(double angle)
{
    const double norm = std::sqrt(14.0);
    const double u[3] = {1.0/norm, 2.0/norm, 3.0/norm};
    const double c = std::cos(angle), s = std::sin(angle);
    return {
        c+u[0]*u[0]*(1-c),      u[0]*u[1]*(1-c)-u[2]*s, u[0]*u[2]*(1-c)+u[1]*s,
        u[1]*u[0]*(1-c)+u[2]*s, c+u[1]*u[1]*(1-c),      u[1]*u[2]*(1-c)-u[0]*s,
        u[2]*u[0]*(1-c)-u[1]*s, u[2]*u[1]*(1-c)+u[0]*s, c+u[2]*u[2]*(1-c)};
}

inline std::vector<double> rotate(const std::vector<double>& Q, const std::vector<double>& xyz)
{
    auto rotated = std::vector<double>(xyz.size(), 0.0);
    for (int i=0; i<xyz.size()/3; ++i)
        for (int a=0; a<3; ++a)
            for (int b=0; b<3; ++b)
                rotated[3*i+a] += Q[3*a+b] * xyz[3*i+b];
    return rotated;
}
