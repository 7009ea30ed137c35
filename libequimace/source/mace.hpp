#ifndef MACE_HPP_INCLUDED
#define MACE_HPP_INCLUDED
#include <cstdint>
#include <map>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "atomic_graph.hpp"
#include "interaction.hpp"
#include "irreps.hpp"
#include "linear.hpp"
#include "model_config.hpp"
#include "parameters.hpp"
#include "radial_embedding.hpp"
#include "readout.hpp"
#include "symmetric_contraction.hpp"

class MACE {

public:

MACE(ModelConfig config);

// Basic model information
ModelConfig config;
int num_features;
int num_species;
int num_layers;
double r_max;
int max_ell, num_lm;
Irreps hidden_irreps;
Irreps sh_irreps;
Irreps output_irreps;
// polynomial order in atom positions of the node features after each layer
std::vector<int> poly_orders;

// Layers
RadialEmbedding radial_embedding;
std::vector<InteractionLayer> interactions;
std::vector<SymmetricContraction> symmetric_contractions;
std::vector<Linear> product_linears;
std::vector<Readout> readouts;

// Parameters
std::map<std::string,std::vector<int>> shapes;
Parameters init(std::uint64_t seed) const;
// also runs one forward pass over template_graph
Parameters init(std::uint64_t seed, const AtomicGraph& template_graph);
// throws ShapeMismatchError unless the stored tree fits this model
Parameters reload_parameters(const std::string& filename) const;
Parameters reload_parameters(const Parameters& parameters) const;
std::string layer_name(int t) const;

// Edges that survive masking, in input order; shorter edges raise DomainError
static constexpr double min_edge_length = 1e-9;
std::vector<int> node_types;
std::vector<int> edge_index;
std::vector<int> edge_senders, edge_receivers;
std::vector<double> edge_xyz, edge_r;
void compute_edges(std::span<const double> vectors,
                   std::span<const int> node_species,
                   std::span<const int> senders,
                   std::span<const int> receivers,
                   const std::vector<bool>& edge_mask,
                   const std::vector<bool>& node_mask);

// Embeddings
std::vector<double> Y, Y_grad;
std::vector<double> R, R_deriv;
void compute_node_embedding(const Parameters& parameters);

// Node features entering each layer, plus the final ones
std::vector<IrrepsArray> H;
std::vector<IrrepsArray> B;

// Forward pass: contributions[(i*num_layers+t)*output_dim+o]
int num_nodes;
std::vector<double> contributions;
const std::vector<double>& forward(const Parameters& parameters,
                                   std::span<const double> vectors,
                                   std::span<const int> node_species,
                                   std::span<const int> senders,
                                   std::span<const int> receivers,
                                   const std::vector<bool>& edge_mask = {},
                                   const std::vector<bool>& node_mask = {});

// Reverse pass for the most recent forward: dE/d(edge vectors), [num_edges][3]
std::vector<double> Y_adj, R_adj;
std::vector<IrrepsArray> H_adj;
std::vector<double> reverse(const Parameters& parameters,
                            std::span<const double> contributions_adj);

void log_summary(std::ostream& os) const;

private:

int num_input_edges;

};

// model from a JSON configuration file
MACE build_model(const std::string& filename);
MACE build_model(ModelConfig config);
#endif
