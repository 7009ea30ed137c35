#include <numeric>
#include <string>

#include "errors.hpp"

#include "atomic_graph.hpp"

int AtomicGraph::num_graphs() const
{
    return n_node.empty() ? 1 : n_node.size();
}

bool AtomicGraph::edge_valid(int e) const
{
    if (not edge_mask.empty() and not edge_mask[e])
        return false;
    return node_valid(senders[e]) and node_valid(receivers[e]);
}

std::vector<int> AtomicGraph::node_graph() const
{
    auto g_of_i = std::vector<int>(num_nodes(), 0);
    int i = 0;
    for (int g=0; g<n_node.size(); ++g)
        for (int n=0; n<n_node[g]; ++n)
            g_of_i[i++] = g;
    return g_of_i;
}

std::vector<int> AtomicGraph::edge_graph() const
{
    auto g_of_e = std::vector<int>(num_edges(), 0);
    int e = 0;
    for (int g=0; g<n_edge.size(); ++g)
        for (int n=0; n<n_edge[g]; ++n)
            g_of_e[e++] = g;
    return g_of_e;
}

std::vector<double> AtomicGraph::edge_vectors(std::span<const double> xyz) const
{
    if (xyz.size() != 3*num_nodes())
        throw DomainError("AtomicGraph: expected " + std::to_string(3*num_nodes())
            + " coordinates, got " + std::to_string(xyz.size()));
    auto vectors = std::vector<double>(3*num_edges());
    const auto g_of_e = edge_graph();
    for (int e=0; e<num_edges(); ++e) {
        const int i = receivers[e];
        const int j = senders[e];
        for (int a=0; a<3; ++a)
            vectors[3*e+a] = xyz[3*i+a] - xyz[3*j+a];
        if (shifts.empty() or cells.empty())
            continue;
        const auto cell = cells.data() + 9*g_of_e[e];
        for (int a=0; a<3; ++a)
            for (int b=0; b<3; ++b)
                vectors[3*e+b] += shifts[3*e+a] * cell[3*a+b];
    }
    return vectors;
}

void AtomicGraph::validate() const
{
    const int N = num_nodes();
    const int E = num_edges();
    if (positions.size() != 3*N)
        throw DomainError("AtomicGraph: positions must have shape [" + std::to_string(N) + "][3]");
    if (receivers.size() != E)
        throw DomainError("AtomicGraph: senders and receivers differ in length");
    for (int e=0; e<E; ++e)
        if (senders[e] < 0 or senders[e] >= N or receivers[e] < 0 or receivers[e] >= N)
            throw DomainError("AtomicGraph: edge " + std::to_string(e) + " refers to a missing node");
    if (not shifts.empty() and shifts.size() != 3*E)
        throw DomainError("AtomicGraph: shifts must have shape [" + std::to_string(E) + "][3]");
    if (not n_node.empty() or not n_edge.empty()) {
        if (n_node.size() != n_edge.size())
            throw DomainError("AtomicGraph: n_node and n_edge differ in length");
        if (std::accumulate(n_node.begin(), n_node.end(), 0) != N)
            throw DomainError("AtomicGraph: n_node does not add up to the number of nodes");
        if (std::accumulate(n_edge.begin(), n_edge.end(), 0) != E)
            throw DomainError("AtomicGraph: n_edge does not add up to the number of edges");
    }
    if (not cells.empty() and cells.size() != 9*num_graphs())
        throw DomainError("AtomicGraph: cells must have shape [" + std::to_string(num_graphs()) + "][3][3]");
    if (not shifts.empty() and cells.empty())
        throw DomainError("AtomicGraph: edge shifts given without cells");
    if (not node_mask.empty() and node_mask.size() != N)
        throw DomainError("AtomicGraph: node_mask has the wrong length");
    if (not edge_mask.empty() and edge_mask.size() != E)
        throw DomainError("AtomicGraph: edge_mask has the wrong length");
    if (not graph_mask.empty() and graph_mask.size() != num_graphs())
        throw DomainError("AtomicGraph: graph_mask has the wrong length");
    if (not energies.empty() and energies.size() != num_graphs())
        throw DomainError("AtomicGraph: energies must have shape [" + std::to_string(num_graphs()) + "]");
    if (not forces.empty() and forces.size() != 3*N)
        throw DomainError("AtomicGraph: forces must have shape [" + std::to_string(N) + "][3]");
}
