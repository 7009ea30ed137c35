#pragma once

#include <span>
#include <vector>

#include "activation.hpp"

// Bias-free perceptron. Layer l maps shape[l] -> shape[l+1] with weights
// stored row-major as [shape[l+1]][shape[l]] and scaled by 1/sqrt(shape[l]).
// The activation acts on every layer except the last.
class MultilayerPerceptron {

public:

MultilayerPerceptron();
MultilayerPerceptron(std::vector<int> shape, Activation activation);

std::vector<int> shape;
Activation activation;

auto evaluate(
    std::span<const double> input,
    const std::vector<std::span<const double>>& weights) -> std::vector<double>;
auto evaluate_batch(
    std::span<const double> input,
    const int batch_size,
    const std::vector<std::span<const double>>& weights) -> std::vector<double>;
// input adjoint from output adjoint, for the most recent evaluate_batch
auto reverse_batch(
    std::span<const double> output_adj,
    const int batch_size,
    const std::vector<std::span<const double>>& weights) -> std::vector<double>;

private:

std::vector<std::vector<double>> node_values;
std::vector<std::vector<double>> node_activation_derivs;

void check_weights(const std::vector<std::span<const double>>& weights) const;

};
