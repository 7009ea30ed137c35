#include <cmath>

#include <cblas.h>

#include "errors.hpp"

#include "linear.hpp"

Linear::Linear()
    : num_species(0),
      num_weights(0)
{
}

Linear::Linear(Irreps irreps_in, Irreps irreps_out, int num_species)
    : irreps_in(irreps_in),
      irreps_out(irreps_out),
      num_species(num_species),
      num_weights(0)
{
    if (num_species < 0)
        throw ConfigurationError("Linear: negative number of species");
    for (int i_out=0; i_out<irreps_out.size(); ++i_out) {
        int fan_in = 0;
        for (int i_in=0; i_in<irreps_in.size(); ++i_in)
            if (irreps_in[i_in].ir == irreps_out[i_out].ir)
                fan_in += irreps_in[i_in].mul;
        if (fan_in == 0)
            continue;
        for (int i_in=0; i_in<irreps_in.size(); ++i_in) {
            if (irreps_in[i_in].ir != irreps_out[i_out].ir)
                continue;
            instructions.push_back({i_in, i_out, num_weights, 1.0/std::sqrt(fan_in)});
            num_weights += irreps_in[i_in].mul * irreps_out[i_out].mul;
        }
    }
}

std::vector<int> Linear::weight_shape() const
{
    if (num_species > 0)
        return {num_species, num_weights};
    return {num_weights};
}

void Linear::check(
    std::span<const double> weights,
    int num_rows,
    std::span<const int> species) const
{
    const int expected = (num_species > 0) ? num_species*num_weights : num_weights;
    if (weights.size() != expected)
        throw DomainError("Linear " + irreps_in.to_string() + " -> " + irreps_out.to_string()
            + " expects " + std::to_string(expected) + " weights, got " + std::to_string(weights.size()));
    if (num_species > 0 and species.size() < num_rows)
        throw DomainError("Linear: species array is shorter than the input");
}

const double* Linear::weights_for_row(
    std::span<const double> weights,
    std::span<const int> species,
    int i) const
{
    if (num_species == 0)
        return weights.data();
    return weights.data() + species[i]*num_weights;
}

void Linear::compute(
    std::span<const double> weights,
    const IrrepsArray& input,
    std::span<const int> species,
    IrrepsArray& output) const
{
    if (input.irreps != irreps_in)
        throw DomainError("Linear: input irreps " + input.irreps.to_string()
            + " differ from " + irreps_in.to_string());
    check(weights, input.num_rows, species);
    output = IrrepsArray(irreps_out, input.num_rows);
    for (int i=0; i<input.num_rows; ++i) {
        const double* W = weights_for_row(weights, species, i);
        for (const auto& ins : instructions) {
            const int mul_in = irreps_in[ins.i_in].mul;
            const int mul_out = irreps_out[ins.i_out].mul;
            const int dim = irreps_in[ins.i_in].ir.dim();
            if (mul_in == 0 or mul_out == 0)
                continue;
            // [out_i]_mv += alpha \sum_u [in_i]_mu W_uv
            cblas_dgemm(
                CblasRowMajor,              // const CBLAS_LAYOUT Layout
                CblasNoTrans,               // const CBLAS_TRANSPOSE transa
                CblasNoTrans,               // const CBLAS_TRANSPOSE transb
                dim,                        // const MKL_INT m
                mul_out,                    // const MKL_INT n
                mul_in,                     // const MKL_INT k
                ins.alpha,                  // const double alpha
                input.block(i,ins.i_in),    // const double *a
                mul_in,                     // const MKL_INT lda
                W+ins.weight_offset,        // const double *b
                mul_out,                    // const MKL_INT ldb
                1.0,                        // const double beta
                output.block(i,ins.i_out),  // double *c
                mul_out);                   // const MKL_INT ldc
        }
    }
}

void Linear::reverse(
    std::span<const double> weights,
    const IrrepsArray& output_adj,
    std::span<const int> species,
    IrrepsArray& input_adj) const
{
    if (output_adj.irreps != irreps_out)
        throw DomainError("Linear: adjoint irreps " + output_adj.irreps.to_string()
            + " differ from " + irreps_out.to_string());
    check(weights, output_adj.num_rows, species);
    if (input_adj.irreps != irreps_in or input_adj.num_rows != output_adj.num_rows)
        input_adj = IrrepsArray(irreps_in, output_adj.num_rows);
    for (int i=0; i<output_adj.num_rows; ++i) {
        const double* W = weights_for_row(weights, species, i);
        for (const auto& ins : instructions) {
            const int mul_in = irreps_in[ins.i_in].mul;
            const int mul_out = irreps_out[ins.i_out].mul;
            const int dim = irreps_in[ins.i_in].ir.dim();
            if (mul_in == 0 or mul_out == 0)
                continue;
            // [in_adj_i]_mu += alpha \sum_v [out_adj_i]_mv W_uv
            cblas_dgemm(
                CblasRowMajor,                  // const CBLAS_LAYOUT Layout
                CblasNoTrans,                   // const CBLAS_TRANSPOSE transa
                CblasTrans,                     // const CBLAS_TRANSPOSE transb
                dim,                            // const MKL_INT m
                mul_in,                         // const MKL_INT n
                mul_out,                        // const MKL_INT k
                ins.alpha,                      // const double alpha
                output_adj.block(i,ins.i_out),  // const double *a
                mul_out,                        // const MKL_INT lda
                W+ins.weight_offset,            // const double *b
                mul_out,                        // const MKL_INT ldb
                1.0,                            // const double beta
                input_adj.block(i,ins.i_in),    // double *c
                mul_in);                        // const MKL_INT ldc
        }
    }
}
