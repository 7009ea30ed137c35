#pragma once

#include <map>
#include <optional>
#include <span>
#include <vector>

#include "irreps.hpp"
#include "multivariate_polynomial.hpp"

// sparse polynomial: sorted variable indices -> coefficient
using Polynomial = std::map<std::vector<int>,double>;

// Equivariant polynomial basis function of one target irrep, built from the
// coupled product of the input blocks listed in `blocks`
struct BasisFunction {
std::vector<int> blocks;
std::vector<Polynomial> components;
};

// Orthonormal basis of coupled products ((x_a1 x x_a2)_L2 x x_a3)_L3 ... of
// up to `correlation` input blocks (a1 <= a2 <= ...), one basis per target
// irrep. Blocks of the same multiset are orthonormalized together, which
// removes vanishing and redundant couplings.
std::vector<std::vector<BasisFunction>> product_basis(
    const Irreps& irreps_in,
    const Irreps& irreps_out,
    int correlation,
    std::optional<int> degree_budget = std::nullopt,
    int input_poly_order = 0);

// Per channel k, all blocks of A form one variable vector x_k and
//     [B_t]_Mk = 1/sqrt(n_t) \sum_b W[s][b][k] P_tb(x_k)_M
// with species-specific weights W.
class SymmetricContraction {

public:

SymmetricContraction();
SymmetricContraction(Irreps irreps_in,
                     Irreps irreps_out,
                     int correlation,
                     int num_species,
                     int max_ell,
                     int input_poly_order = 0,
                     std::optional<int> max_poly_order = std::nullopt);

Irreps irreps_in;
Irreps irreps_out;
int num_features;
int correlation;
int num_species;
int num_variables;

// polynomial order in atom positions before and after this layer
int input_poly_order;
int output_poly_order;

std::vector<int> num_basis;
std::vector<int> basis_offset;
std::vector<int> output_offset;
int total_basis;
MultivariatePolynomial polynomial;

std::vector<int> weight_shape() const;

void compute(std::span<const double> weights,
             const IrrepsArray& A,
             std::span<const int> node_types,
             IrrepsArray& B);
// writes dE/dA
void reverse(std::span<const double> weights,
             const IrrepsArray& A,
             const IrrepsArray& B_adj,
             std::span<const int> node_types,
             IrrepsArray& A_adj);

};
