#pragma once

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "activation.hpp"
#include "clebsch_gordan.hpp"
#include "irreps.hpp"
#include "linear.hpp"
#include "multilayer_perceptron.hpp"
#include "parameters.hpp"

// The first interaction has no self-connection, later ones are residual
enum class InteractionKind { first, residual };

// Coupling of input block i_in with Y_{l2} into the message block i_msg
struct InteractionPath {
int i_in;
int l1, l2, l3;
int i_msg;
std::vector<CouplingEntry> entries;
};

// One round of equivariant message passing:
//     u = Linear(h)
//     m_i = 1/avg_num_neighbors \sum_{j->i} w_ji (u_j x Y_ji)
//     A = scale * Linear(m)
// with per-edge path weights w_ji from a radial MLP chosen by the
// unordered species pair of the edge. Residual layers also return the
// species-indexed self-connection sc = Linear_s(h) into the hidden irreps.
class InteractionLayer {

public:

InteractionLayer(std::string name,
                 InteractionKind kind,
                 Irreps irreps_in,
                 Irreps hidden_irreps,
                 int max_ell,
                 int num_bessel,
                 std::vector<int> radial_mlp_hidden,
                 Activation activation,
                 int num_species,
                 double avg_num_neighbors,
                 double output_scale);

std::string name;
InteractionKind kind;
int num_features;
int max_ell, num_lm;
int num_bessel;
int num_species;
double avg_num_neighbors;
double output_scale;

Irreps irreps_in;
Irreps message_irreps;
Irreps irreps_out;
Irreps hidden_irreps;
std::vector<InteractionPath> paths;

Linear linear_up;
Linear linear_down;
Linear skip_tp;
std::vector<MultilayerPerceptron> radial_mlps;

void parameter_shapes(std::map<std::string,std::vector<int>>& shapes) const;

// Forward pass
IrrepsArray u, messages, A, sc;
std::vector<double> edge_weights;
std::vector<std::vector<int>> pair_edges;
void compute(const Parameters& parameters,
             const IrrepsArray& h,
             std::span<const int> node_types,
             std::span<const int> senders,
             std::span<const int> receivers,
             std::span<const double> Y,
             std::span<const double> R);

// Reverse pass. Adds dE/dh to h_adj and writes dE/dY, dE/dR.
IrrepsArray u_adj, messages_adj;
std::vector<double> edge_weights_adj;
void reverse(const Parameters& parameters,
             const IrrepsArray& A_adj,
             const IrrepsArray* sc_adj,
             std::span<const int> node_types,
             std::span<const int> senders,
             std::span<const int> receivers,
             std::span<const double> Y,
             std::span<const double> R,
             IrrepsArray& h_adj,
             std::vector<double>& Y_adj,
             std::vector<double>& R_adj);

int species_pair(int type_i, int type_j) const;

private:

std::vector<std::span<const double>> mlp_weights(const Parameters& parameters, int q) const;
void compute_edge_weights(const Parameters& parameters,
                          std::span<const int> node_types,
                          std::span<const int> senders,
                          std::span<const int> receivers,
                          std::span<const double> R);

};
