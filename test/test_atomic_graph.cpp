#include <vector>

#include <gtest/gtest.h>

#include "atomic_graph.hpp"
#include "errors.hpp"

#include "test_utilities.hpp"

TEST(AtomicGraph, EdgeVectors)
{
    const auto graph = batched_graph();
    EXPECT_NO_THROW(graph.validate());
    EXPECT_EQ(graph.num_graphs(), 2);
    EXPECT_EQ(graph.node_graph(), (std::vector<int>{0, 0, 1, 1, 1}));
    EXPECT_EQ(graph.edge_graph(), (std::vector<int>{0, 0, 0, 1, 1, 1}));
    const auto vectors = graph.edge_vectors();
    const auto expected = std::vector<double>{
        -0.5, 0.0, 0.0,  0.5, 0.0, 0.0,  -3.5, 0.0, 0.0,
        -1.0, 0.0, 0.0,  0.0, -1.0, 0.0,  1.0, 0.0, 0.0};
    ASSERT_EQ(vectors.size(), expected.size());
    for (int n=0; n<vectors.size(); ++n)
        EXPECT_DOUBLE_EQ(vectors[n], expected[n]);
}

TEST(AtomicGraph, SingleGraphDefaults)
{
    const auto graph = neighbor_graph({0.0, 0.0, 0.0, 1.0, 0.0, 0.0}, {0, 0}, 2.0);
    EXPECT_NO_THROW(graph.validate());
    EXPECT_EQ(graph.num_graphs(), 1);
    EXPECT_EQ(graph.node_graph(), (std::vector<int>{0, 0}));
    EXPECT_TRUE(graph.edge_valid(0));
    EXPECT_TRUE(graph.graph_valid(0));
}

TEST(AtomicGraph, Masks)
{
    auto graph = batched_graph();
    graph.node_mask = {true, true, true, true, false};
    graph.edge_mask = {true, false, true, true, true, true};
    EXPECT_NO_THROW(graph.validate());
    EXPECT_TRUE(graph.edge_valid(0));
    EXPECT_FALSE(graph.edge_valid(1));
    EXPECT_FALSE(graph.edge_valid(4));
    EXPECT_TRUE(graph.edge_valid(5));
    EXPECT_FALSE(graph.node_valid(4));
}

TEST(AtomicGraph, Validate)
{
    auto graph = batched_graph();
    graph.positions.pop_back();
    EXPECT_THROW(graph.validate(), DomainError);

    graph = batched_graph();
    graph.receivers[2] = 5;
    EXPECT_THROW(graph.validate(), DomainError);

    graph = batched_graph();
    graph.n_node = {2, 2};
    EXPECT_THROW(graph.validate(), DomainError);

    graph = batched_graph();
    graph.n_edge = {3};
    EXPECT_THROW(graph.validate(), DomainError);

    graph = batched_graph();
    graph.cells.resize(9);
    EXPECT_THROW(graph.validate(), DomainError);

    graph = batched_graph();
    graph.cells.clear();
    EXPECT_THROW(graph.validate(), DomainError);

    graph = batched_graph();
    graph.graph_mask = {true};
    EXPECT_THROW(graph.validate(), DomainError);

    graph = batched_graph();
    EXPECT_THROW(graph.edge_vectors(std::vector<double>(3)), DomainError);
}
