#include <algorithm>
#include <map>
#include <set>

#include <cblas.h>

#include "errors.hpp"
#include "tools.hpp"

#include "multivariate_polynomial.hpp"

MultivariatePolynomial::MultivariatePolynomial()
    : num_variables(0),
      num_outputs(0),
      num_auxiliary_nodes(0)
{
}

MultivariatePolynomial::MultivariatePolynomial(
    int num_variables,
    std::vector<std::vector<double>> coefficients,
    std::vector<std::vector<int>> monomials)
    : num_variables(num_variables),
      num_outputs(coefficients.size())
{
    for (const auto& c : coefficients)
        if (c.size() != monomials.size())
            throw ConfigurationError("MultivariatePolynomial: coefficients and monomials differ in size");
    for (const auto& monomial : monomials) {
        if (monomial.empty())
            throw ConfigurationError("MultivariatePolynomial: empty monomial");
        if (not std::is_sorted(monomial.begin(), monomial.end()))
            throw ConfigurationError("MultivariatePolynomial: monomial indices must be sorted");
        for (auto v : monomial)
            if (v < 0 or v >= num_variables)
                throw ConfigurationError("MultivariatePolynomial: variable index out of range");
    }

    // comparison function governing lexographic ordering for monomial vectors
    auto lex_less = [](std::vector<int> v1, std::vector<int> v2) {
        if (v1.size() < v2.size()) {
            return true;
        } else if (v1.size() > v2.size()) {
            return false;
        } else {
            return v1 < v2;
        }
    };

    // store coefficients and monomials in lexographic order, merging repeats
    std::map<std::vector<int>,std::vector<double>,decltype(lex_less)> map(lex_less);
    for (int i=0; i<monomials.size(); ++i) {
        auto [it, inserted] = map.insert({monomials[i], std::vector<double>(num_outputs, 0.0)});
        for (int o=0; o<num_outputs; ++o)
            it->second[o] += coefficients[o][i];
    }
    this->monomials.clear();
    this->coefficients = std::vector<std::vector<double>>(num_outputs);
    for (auto [m,c] : map) {
        this->monomials.push_back(m);
        for (int o=0; o<num_outputs; ++o)
            this->coefficients[o].push_back(c[o]);
    }

    // create lexographically ordered node set from input
    std::set<std::vector<int>,decltype(lex_less)> node_set(lex_less);
    for (int i=0; i<num_variables; ++i)
        node_set.insert({i});
    for (auto monomial : this->monomials)
        node_set.insert(monomial);

    // add auxiliary nodes until all nodes have two upstream factors
    num_auxiliary_nodes = 0;
    auto find_parents = [](const std::vector<int>& node,
                           const std::set<std::vector<int>,decltype(lex_less)>& node_set) {
        auto partitions = _two_part_partitions(node);
        for (const auto& partition : partitions)
            if (node_set.contains(partition[0]) && node_set.contains(partition[1]))
                return partition;
        return std::vector<std::vector<int>>();
    };
    for (auto node : node_set) {
        if (node.size() == 1)
            continue;
        auto factors = find_parents(node, node_set);
        while (factors.size() == 0) {
            node.pop_back();
            node_set.insert(node);
            num_auxiliary_nodes += 1;
            factors = find_parents(node, node_set);
        }
    }
    nodes = std::vector<std::vector<int>>(node_set.begin(), node_set.end());

    // find edges
    for (auto node : node_set) {
        if (node.size() == 1)
            continue;
        const auto factors = find_parents(node, node_set);
        const int i0 = std::distance(
            nodes.begin(),
            std::find(nodes.begin(), nodes.end(), factors[0]));
        const int i1 = std::distance(
            nodes.begin(),
            std::find(nodes.begin(), nodes.end(), factors[1]));
        edges.push_back({i0, i1});
    }

    // node coefficients are [num_outputs][nodes.size()]
    node_coefficients = std::vector<double>(num_outputs*nodes.size(), 0.0);
    int j = 0;
    for (int i=0; i<this->monomials.size(); ++i) {
        while (this->monomials[i] != nodes[j]) {
            j += 1;
        }
        for (int o=0; o<num_outputs; ++o)
            node_coefficients[o*nodes.size()+j] = this->coefficients[o][i];
    }
    node_values = std::vector<double>(nodes.size());
    node_adjoints = std::vector<double>(nodes.size());
}

auto MultivariatePolynomial::evaluate(
    std::span<const double> x)
    -> std::vector<double>
{
    return evaluate_batch(x, 1);
}

auto MultivariatePolynomial::evaluate_batch(
    std::span<const double> x,
    const int batch_size)
    -> std::vector<double>
{
    if (x.size() != num_variables*batch_size)
        throw DomainError("MultivariatePolynomial: input has the wrong size");
    auto f = std::vector<double>(num_outputs*batch_size, 0.0);
    batched_initialize_forward_pass(x, batch_size);
    batched_forward_pass(batch_size);
    if (num_outputs == 0 or batch_size == 0)
        return f;
    cblas_dgemm(
        CblasRowMajor,             // const CBLAS_LAYOUT Layout
        CblasNoTrans,              // const CBLAS_TRANSPOSE transa
        CblasNoTrans,              // const CBLAS_TRANSPOSE transb
        num_outputs,               // const MKL_INT m
        batch_size,                // const MKL_INT n
        nodes.size(),              // const MKL_INT k
        1.0,                       // const double alpha
        node_coefficients.data(),  // const double *a
        nodes.size(),              // const MKL_INT lda
        node_values.data(),        // const double *b
        batch_size,                // const MKL_INT ldb
        0.0,                       // const double beta
        f.data(),                  // double *c
        batch_size);               // const MKL_INT ldc
    return f;
}

auto MultivariatePolynomial::reverse_batch(
    std::span<const double> f_adj,
    const int batch_size)
    -> std::vector<double>
{
    if (f_adj.size() != num_outputs*batch_size or node_values.size() != nodes.size()*batch_size)
        throw DomainError("MultivariatePolynomial: adjoint does not match the last evaluation");
    batched_initialize_backward_pass(f_adj, batch_size);
    batched_backward_pass(batch_size);
    return std::vector<double>(node_adjoints.begin(), node_adjoints.begin()+num_variables*batch_size);
}

void MultivariatePolynomial::batched_initialize_forward_pass(
    std::span<const double> x,
    const int batch_size)
{
    node_values.resize(batch_size * nodes.size());
    std::copy(x.begin(), x.end(), node_values.begin());
}

void MultivariatePolynomial::batched_forward_pass(
    const int batch_size)
{
    for (int i=0; i<edges.size(); ++i) {
        const auto [i0, i1] = edges[i];
        double* node_val = node_values.data() + (num_variables+i)*batch_size;
        const double* node_val_0 = node_values.data() + i0*batch_size;
        const double* node_val_1 = node_values.data() + i1*batch_size;
        for (int j=0; j<batch_size; ++j) {
            node_val[j] = node_val_0[j] * node_val_1[j];
        }
    }
}

void MultivariatePolynomial::batched_initialize_backward_pass(
    std::span<const double> f_adj,
    const int batch_size)
{
    node_adjoints.resize(batch_size * nodes.size());
    std::fill(node_adjoints.begin(), node_adjoints.end(), 0.0);
    if (num_outputs == 0 or batch_size == 0)
        return;
    cblas_dgemm(
        CblasRowMajor,             // const CBLAS_LAYOUT Layout
        CblasTrans,                // const CBLAS_TRANSPOSE transa
        CblasNoTrans,              // const CBLAS_TRANSPOSE transb
        nodes.size(),              // const MKL_INT m
        batch_size,                // const MKL_INT n
        num_outputs,               // const MKL_INT k
        1.0,                       // const double alpha
        node_coefficients.data(),  // const double *a
        nodes.size(),              // const MKL_INT lda
        f_adj.data(),              // const double *b
        batch_size,                // const MKL_INT ldb
        0.0,                       // const double beta
        node_adjoints.data(),      // double *c
        batch_size);               // const MKL_INT ldc
}

void MultivariatePolynomial::batched_backward_pass(
    const int batch_size)
{
    for (int i=edges.size()-1; i>=0; --i) {
        const auto [i0, i1] = edges[i];
        double* node_adj = node_adjoints.data() + (num_variables+i)*batch_size;
        double* node_val_0 = node_values.data() + i0*batch_size;
        double* node_val_1 = node_values.data() + i1*batch_size;
        double* node_adj_0 = node_adjoints.data() + i0*batch_size;
        double* node_adj_1 = node_adjoints.data() + i1*batch_size;
        for (int j=0; j<batch_size; ++j)
            node_adj_0[j] += node_adj[j] * node_val_1[j];
        for (int j=0; j<batch_size; ++j)
            node_adj_1[j] += node_adj[j] * node_val_0[j];
    }
}

auto MultivariatePolynomial::evaluate_simple(std::span<const double> x) -> std::vector<double>
{
    auto f = std::vector<double>(num_outputs, 0.0);
    for (int i=0; i<monomials.size(); ++i) {
        double monomial = x[monomials[i][0]];
        for (int j=1; j<monomials[i].size(); ++j) {
            monomial *= x[monomials[i][j]];
        }
        for (int o=0; o<num_outputs; ++o)
            f[o] += coefficients[o][i] * monomial;
    }
    return f;
}
