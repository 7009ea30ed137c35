#pragma once

#include <span>
#include <vector>

#include "irreps.hpp"

// Weight block W[mul_in][mul_out] connecting input block i_in to output block i_out
struct LinearInstruction {
int i_in;
int i_out;
int weight_offset;
double alpha;
};

// Equivariant linear map. Every output block receives each input block of the
// same irrep, mixed over multiplicities and normalized by 1/sqrt(fan_in).
// Output blocks with no matching input are zero. With num_species > 0 the
// weights are indexed by the species of each row.
class Linear {

public:

Linear();
Linear(Irreps irreps_in, Irreps irreps_out, int num_species = 0);

Irreps irreps_in;
Irreps irreps_out;
int num_species;
std::vector<LinearInstruction> instructions;
int num_weights;

std::vector<int> weight_shape() const;

void compute(std::span<const double> weights,
             const IrrepsArray& input,
             std::span<const int> species,
             IrrepsArray& output) const;
// adds the input adjoint to input_adj
void reverse(std::span<const double> weights,
             const IrrepsArray& output_adj,
             std::span<const int> species,
             IrrepsArray& input_adj) const;

private:

const double* weights_for_row(std::span<const double> weights, std::span<const int> species, int i) const;
void check(std::span<const double> weights, int num_rows, std::span<const int> species) const;

};
