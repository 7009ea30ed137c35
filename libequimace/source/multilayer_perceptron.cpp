#include <algorithm>
#include <cmath>

#include <cblas.h>

#include "errors.hpp"

#include "multilayer_perceptron.hpp"

MultilayerPerceptron::MultilayerPerceptron()
{
}

MultilayerPerceptron::MultilayerPerceptron(
    std::vector<int> shape,
    Activation activation)
    : shape(shape),
      activation(activation)
{
    if (shape.size() < 2)
        throw ConfigurationError("MultilayerPerceptron needs at least two layers");
    for (auto n : shape)
        if (n < 1)
            throw ConfigurationError("MultilayerPerceptron layer widths must be positive");
    for (int i=0; i<shape.size(); ++i) {
        node_values.push_back(std::vector<double>(shape[i]));
        node_activation_derivs.push_back(std::vector<double>(shape[i]));
    }
}

void MultilayerPerceptron::check_weights(
    const std::vector<std::span<const double>>& weights) const
{
    if (weights.size() != shape.size()-1)
        throw DomainError("MultilayerPerceptron expects " + std::to_string(shape.size()-1)
            + " weight matrices, got " + std::to_string(weights.size()));
    for (int l=0; l<weights.size(); ++l)
        if (weights[l].size() != shape[l]*shape[l+1])
            throw DomainError("MultilayerPerceptron weight matrix " + std::to_string(l) + " has the wrong size");
}

auto MultilayerPerceptron::evaluate(
    std::span<const double> input,
    const std::vector<std::span<const double>>& weights
    )-> std::vector<double>
{
    return evaluate_batch(input, 1, weights);
}

auto MultilayerPerceptron::evaluate_batch(
    std::span<const double> input,
    const int batch_size,
    const std::vector<std::span<const double>>& weights
    )-> std::vector<double>
{
    check_weights(weights);
    if (input.size() != batch_size*shape[0])
        throw DomainError("MultilayerPerceptron input has the wrong size");
    // Reshape node arrays and send input to nodes
    for (int i=0; i<shape.size(); ++i) {
        node_values[i].resize(batch_size*shape[i]);
        node_activation_derivs[i].resize(batch_size*shape[i]);
    }
    std::copy(input.begin(), input.end(), node_values[0].begin());
    if (batch_size == 0)
        return node_values.back();
    // Evaluate layers
    for (int l=0; l<shape.size()-1; ++l) {
        cblas_dgemm(
            CblasRowMajor,            // const CBLAS_LAYOUT Layout
            CblasNoTrans,             // const CBLAS_TRANSPOSE transa
            CblasTrans,               // const CBLAS_TRANSPOSE transb
            batch_size,               // const MKL_INT m
            shape[l+1],               // const MKL_INT n
            shape[l],                 // const MKL_INT k
            1.0/std::sqrt(shape[l]),  // const double alpha
            node_values[l].data(),    // const double *a
            shape[l],                 // const MKL_INT lda
            weights[l].data(),        // const double *b
            shape[l],                 // const MKL_INT ldb
            0.0,                      // const double beta
            node_values[l+1].data(),  // double *c
            shape[l+1]);              // const MKL_INT ldc
        // final layer has no nonlinearity
        if (l == shape.size()-2)
            break;
        for (int i=0; i<node_values[l+1].size(); ++i) {
            double f, d;
            activation.evaluate_deriv(node_values[l+1][i], f, d);
            node_values[l+1][i] = f;
            node_activation_derivs[l+1][i] = d;
        }
    }
    return node_values.back();
}

auto MultilayerPerceptron::reverse_batch(
    std::span<const double> output_adj,
    const int batch_size,
    const std::vector<std::span<const double>>& weights
    )-> std::vector<double>
{
    check_weights(weights);
    if (output_adj.size() != batch_size*shape.back() or node_values.back().size() != output_adj.size())
        throw DomainError("MultilayerPerceptron adjoint does not match the last evaluation");
    auto adj = std::vector<double>(output_adj.begin(), output_adj.end());
    if (batch_size == 0)
        return std::vector<double>();
    // Differentiate backwards
    for (int l=shape.size()-2; l>=0; --l) {
        auto adj_l = std::vector<double>(batch_size*shape[l]);
        cblas_dgemm(
            CblasRowMajor,            // const CBLAS_LAYOUT Layout
            CblasNoTrans,             // const CBLAS_TRANSPOSE transa
            CblasNoTrans,             // const CBLAS_TRANSPOSE transb
            batch_size,               // const MKL_INT m
            shape[l],                 // const MKL_INT n
            shape[l+1],               // const MKL_INT k
            1.0/std::sqrt(shape[l]),  // const double alpha
            adj.data(),               // const double *a
            shape[l+1],               // const MKL_INT lda
            weights[l].data(),        // const double *b
            shape[l],                 // const MKL_INT ldb
            0.0,                      // const double beta
            adj_l.data(),             // double *c
            shape[l]);                // const MKL_INT ldc
        if (l > 0)
            for (int i=0; i<adj_l.size(); ++i)
                adj_l[i] *= node_activation_derivs[l][i];
        adj = std::move(adj_l);
    }
    return adj;
}
