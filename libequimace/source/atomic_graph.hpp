#pragma once

#include <span>
#include <vector>

// One or more structures batched into a single graph. Nodes and edges of
// graph g are contiguous and counted by n_node[g] and n_edge[g]. Empty masks
// mean every entry is valid; empty cells and shifts mean open boundaries.
struct AtomicGraph {

std::vector<double> positions;  // [num_nodes][3]
std::vector<int> species;       // [num_nodes]
std::vector<int> senders;       // [num_edges]
std::vector<int> receivers;     // [num_edges]
std::vector<double> shifts;     // [num_edges][3], integer multiples of the cell vectors
std::vector<double> cells;      // [num_graphs][3][3], cell vectors as rows
std::vector<int> n_node;        // [num_graphs]
std::vector<int> n_edge;        // [num_graphs]
std::vector<bool> node_mask;
std::vector<bool> edge_mask;
std::vector<bool> graph_mask;
// reference labels, read only by the calibration helpers
std::vector<double> energies;   // [num_graphs]
std::vector<double> forces;     // [num_nodes][3]

int num_nodes() const { return species.size(); }
int num_edges() const { return senders.size(); }
int num_graphs() const;

bool node_valid(int i) const { return node_mask.empty() or node_mask[i]; }
// padding edges and edges touching a masked node are invalid
bool edge_valid(int e) const;
bool graph_valid(int g) const { return graph_mask.empty() or graph_mask[g]; }

std::vector<int> node_graph() const;
std::vector<int> edge_graph() const;

// pos[receiver] - pos[sender] + shift . cell for every edge
std::vector<double> edge_vectors(std::span<const double> xyz) const;
std::vector<double> edge_vectors() const { return edge_vectors(positions); }

// throws DomainError for inconsistent sizes or indices
void validate() const;

};
