#include <cmath>
#include <vector>

#include <gtest/gtest.h>

#include "calibration.hpp"
#include "errors.hpp"

#include "test_utilities.hpp"

namespace {

// a labelled structure without edges
AtomicGraph structure(std::vector<int> species, double energy, std::vector<double> forces = {})
{
    AtomicGraph graph;
    graph.positions = std::vector<double>(3*species.size(), 0.0);
    graph.species = species;
    graph.energies = {energy};
    graph.forces = forces;
    return graph;
}

}

TEST(Calibration, AverageNumberOfNeighbors)
{
    // receivers 0, 1, 2, 3 with in-degrees 2, 1, 2, 1
    EXPECT_DOUBLE_EQ(compute_avg_num_neighbors({batched_graph()}), 1.5);

    auto masked = batched_graph();
    masked.edge_mask = {true, true, true, false, false, true};
    // in-degrees 2, 1 and 1 at node 3
    EXPECT_DOUBLE_EQ(compute_avg_num_neighbors({batched_graph(), masked}), (6.0+4.0)/(4.0+3.0));

    AtomicGraph empty;
    empty.positions = {0.0, 0.0, 0.0};
    empty.species = {0};
    EXPECT_THROW(compute_avg_num_neighbors({empty}), ConfigurationError);
}

TEST(Calibration, NumberOfSpecies)
{
    const auto graph = batched_graph();
    EXPECT_NO_THROW(check_num_species(2, {graph}));
    EXPECT_THROW(check_num_species(1, {graph}), ConfigurationError);

    auto masked = graph;
    masked.node_mask = {true, false, true, true, false};
    EXPECT_NO_THROW(check_num_species(1, {masked}));
}

TEST(Calibration, InvalidGraphs)
{
    AtomicGraph graph;
    graph.positions = {0.0, 0.0, 0.0,  1.0, 0.0, 0.0};
    graph.species = {0, 0};
    graph.senders = {0};
    graph.receivers = {7};
    EXPECT_THROW(compute_avg_num_neighbors({graph}), DomainError);
    EXPECT_THROW(compute_avg_min_neighbor_distance({graph}), DomainError);
    EXPECT_THROW(check_num_species(1, {batched_graph(), graph}), DomainError);

    auto labelled = structure({0, 0}, -1.0);
    labelled.energies = {-1.0, -2.0};
    EXPECT_THROW(compute_average_atomic_energies(1, {labelled}), DomainError);
}

TEST(Calibration, AverageMinimumNeighborDistance)
{
    const auto dimer = neighbor_graph({0.0, 0.0, 0.0,  1.0, 0.0, 0.0}, {0, 0}, 3.0);
    const auto trimer = neighbor_graph({0.0, 0.0, 0.0,  0.0, 0.8, 0.0,  0.0, 0.0, 2.0}, {0, 0, 0}, 3.0);
    EXPECT_NEAR(compute_avg_min_neighbor_distance({dimer, trimer}), 0.9, 1e-14);

    // structures of the batch: 0.5 through the cell and 1.0
    EXPECT_NEAR(compute_avg_min_neighbor_distance({batched_graph()}), 0.75, 1e-14);
    auto masked = batched_graph();
    masked.graph_mask = {false, true};
    EXPECT_NEAR(compute_avg_min_neighbor_distance({masked}), 1.0, 1e-14);

    EXPECT_THROW(compute_avg_min_neighbor_distance({structure({0}, 0.0)}), ConfigurationError);
}

TEST(Calibration, StdScaling)
{
    const auto E0 = std::vector<double>{-1.0, -2.0};
    const auto graphs = std::vector<AtomicGraph>{
        structure({0, 0}, -1.0),
        structure({0, 1}, -4.0),
        structure({1, 1, 1}, -3.0)};
    // interaction energies per atom 0.5, -0.5 and 1.0
    const double mean = 1.0/3.0;
    const double deviation = std::sqrt((std::pow(0.5-mean, 2) + std::pow(-0.5-mean, 2) + std::pow(1.0-mean, 2))/3.0);
    const auto scaling = compute_mean_std_atomic_inter_energy(graphs, E0);
    EXPECT_NEAR(scaling.shift, mean, 1e-14);
    EXPECT_NEAR(scaling.scale, deviation, 1e-14);

    // the masked structure does not count
    AtomicGraph batch;
    batch.positions = std::vector<double>(3*5, 0.0);
    batch.species = {0, 0,  0, 1, 1};
    batch.n_node = {2, 3};
    batch.n_edge = {0, 0};
    batch.energies = {-1.0, 100.0};
    batch.graph_mask = {true, false};
    const auto single = compute_mean_std_atomic_inter_energy({batch}, E0);
    EXPECT_NEAR(single.shift, 0.5, 1e-14);
    EXPECT_NEAR(single.scale, 0.0, 1e-14);

    EXPECT_THROW(compute_mean_std_atomic_inter_energy({batched_graph()}, E0), ConfigurationError);
}

TEST(Calibration, RmsForcesScaling)
{
    const auto E0 = std::vector<double>{-1.0, -2.0};
    const auto graphs = std::vector<AtomicGraph>{
        structure({0, 0}, -1.0, {1.0, 0.0, 0.0,  -1.0, 0.0, 0.0}),
        structure({0, 1}, -4.0, {0.0, 2.0, 0.0,  0.0, 0.0, -2.0})};
    const auto scaling = compute_mean_rms_energy_forces(graphs, E0);
    EXPECT_NEAR(scaling.shift, 0.0, 1e-14);
    EXPECT_NEAR(scaling.scale, std::sqrt(10.0/12.0), 1e-14);

    EXPECT_THROW(compute_mean_rms_energy_forces({structure({0}, -1.0)}, E0), ConfigurationError);
}

TEST(Calibration, AverageAtomicEnergies)
{
    // E0 = -1.5 and -4.0; species 2 never appears
    const auto graphs = std::vector<AtomicGraph>{
        structure({0, 0}, -3.0),
        structure({0, 1}, -5.5),
        structure({1, 1, 1}, -12.0),
        structure({1, 0, 1, 0}, -11.0)};
    const auto E0 = compute_average_atomic_energies(3, graphs);
    ASSERT_EQ(E0.size(), 3);
    EXPECT_NEAR(E0[0], -1.5, 1e-10);
    EXPECT_NEAR(E0[1], -4.0, 1e-10);
    EXPECT_EQ(E0[2], 0.0);

    // species 0 and 1 always appear together
    const auto degenerate = compute_average_atomic_energies(2, {structure({0, 1}, -2.0), structure({1, 0}, -3.0)});
    EXPECT_EQ(degenerate, (std::vector<double>{0.0, 0.0}));

    EXPECT_THROW(compute_average_atomic_energies(1, graphs), ConfigurationError);
}
