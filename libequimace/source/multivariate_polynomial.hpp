#pragma once

#include <array>
#include <span>
#include <vector>

// A set of polynomials sharing one monomial graph. Output o is
//     f_o(x) = \sum_i coefficients[o][i] * \prod_{v in monomials[i]} x_v
// Monomials are sorted lists of variable indices (repeats allowed).
class MultivariatePolynomial
{

public:

MultivariatePolynomial();
MultivariatePolynomial(int num_variables,
                       std::vector<std::vector<double>> coefficients,
                       std::vector<std::vector<int>> monomials);

auto evaluate(std::span<const double> x) -> std::vector<double>;
// x[v*batch_size+j] -> f[o*batch_size+j]
auto evaluate_batch(std::span<const double> x, const int batch_size) -> std::vector<double>;
// f_adj[o*batch_size+j] -> x_adj[v*batch_size+j], for the most recent evaluate_batch
auto reverse_batch(std::span<const double> f_adj, const int batch_size) -> std::vector<double>;

// polynomial definition
int num_variables;
int num_outputs;
std::vector<std::vector<double>> coefficients;
std::vector<std::vector<int>> monomials;

// graph-related variables
int num_auxiliary_nodes;
std::vector<std::vector<int>> nodes;
std::vector<std::array<int,2>> edges;
std::vector<double> node_coefficients;
std::vector<double> node_values;
std::vector<double> node_adjoints;

// non-recursive evaluation, used for testing
auto evaluate_simple(std::span<const double> x) -> std::vector<double>;

private:

void batched_initialize_forward_pass(std::span<const double> x, const int batch_size);
void batched_forward_pass(const int batch_size);
void batched_initialize_backward_pass(std::span<const double> f_adj, const int batch_size);
void batched_backward_pass(const int batch_size);

};
