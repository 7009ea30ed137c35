#include <algorithm>
#include <cmath>
#include <set>

#include "clebsch_gordan.hpp"
#include "errors.hpp"

#include "symmetric_contraction.hpp"

namespace {

struct CouplingState {
    std::vector<int> blocks;
    Irrep ir;
    std::vector<Polynomial> components;
};

Polynomial multiply_by_variable(const Polynomial& p, int v)
{
    Polynomial q;
    for (const auto& [monomial, c] : p) {
        auto m = monomial;
        m.insert(std::upper_bound(m.begin(), m.end(), v), v);
        q[m] += c;
    }
    return q;
}

void add_scaled(Polynomial& target, const Polynomial& p, double c)
{
    for (const auto& [monomial, value] : p)
        target[monomial] += c*value;
}

double dot(const std::vector<Polynomial>& p, const std::vector<Polynomial>& q)
{
    double s = 0.0;
    for (int M=0; M<p.size(); ++M) {
        for (const auto& [monomial, value] : p[M]) {
            auto it = q[M].find(monomial);
            if (it != q[M].end())
                s += value * it->second;
        }
    }
    return s;
}

}

std::vector<std::vector<BasisFunction>> product_basis(
    const Irreps& irreps_in,
    const Irreps& irreps_out,
    int correlation,
    std::optional<int> degree_budget,
    int input_poly_order)
{
    if (correlation < 1)
        throw ConfigurationError("correlation must be at least 1");
    const int num_blocks = irreps_in.size();
    int l_max = 0;
    auto var_offsets = std::vector<int>();
    int num_variables = 0;
    for (const auto& block : irreps_in) {
        var_offsets.push_back(num_variables);
        num_variables += block.ir.dim();
        l_max = std::max(l_max, block.ir.l);
    }
    auto targets = std::set<std::pair<int,int>>();
    int max_target_l = 0;
    for (const auto& block : irreps_out) {
        targets.insert({block.ir.l, block.ir.p});
        max_target_l = std::max(max_target_l, block.ir.l);
    }

    // candidates[t][blocks] lists the couplings of one multiset of blocks
    auto candidates = std::vector<std::map<std::vector<int>,std::vector<std::vector<Polynomial>>>>(irreps_out.size());

    auto states = std::vector<CouplingState>();
    for (int a=0; a<num_blocks; ++a) {
        auto state = CouplingState{{a}, irreps_in[a].ir, std::vector<Polynomial>(irreps_in[a].ir.dim())};
        for (int m=0; m<irreps_in[a].ir.dim(); ++m)
            state.components[m][{var_offsets[a]+m}] = 1.0;
        states.push_back(state);
    }
    for (int nu=1; nu<=correlation; ++nu) {
        for (const auto& state : states) {
            int sum_l = 0;
            for (auto a : state.blocks)
                sum_l += irreps_in[a].ir.l;
            if (degree_budget.has_value() and nu*input_poly_order + sum_l > *degree_budget)
                continue;
            for (int t=0; t<irreps_out.size(); ++t)
                if (irreps_out[t].ir == state.ir)
                    candidates[t][state.blocks].push_back(state.components);
        }
        if (nu == correlation)
            break;
        auto next_states = std::vector<CouplingState>();
        for (const auto& state : states) {
            for (int a=state.blocks.back(); a<num_blocks; ++a) {
                const auto ir_a = irreps_in[a].ir;
                for (const auto& ir : coupled_irreps(state.ir, ir_a)) {
                    // each remaining coupling lowers L by at most l_max
                    if (ir.l > max_target_l + (correlation-nu-1)*l_max)
                        continue;
                    if (nu+1 == correlation and not targets.contains({ir.l, ir.p}))
                        continue;
                    auto next = CouplingState{state.blocks, ir, std::vector<Polynomial>(ir.dim())};
                    next.blocks.push_back(a);
                    for (const auto& c : coupling_entries(state.ir.l, ir_a.l, ir.l)) {
                        const auto p = multiply_by_variable(state.components[c.m1], var_offsets[a]+c.m2);
                        add_scaled(next.components[c.m3], p, c.value);
                    }
                    next_states.push_back(std::move(next));
                }
            }
        }
        states = std::move(next_states);
    }

    // Gram-Schmidt within each multiset of blocks; different multisets
    // share no monomials and are orthogonal already
    auto basis = std::vector<std::vector<BasisFunction>>(irreps_out.size());
    for (int t=0; t<irreps_out.size(); ++t) {
        for (const auto& [blocks, polys] : candidates[t]) {
            auto accepted = std::vector<std::vector<Polynomial>>();
            for (auto p : polys) {
                const double norm_0 = std::sqrt(dot(p, p));
                if (norm_0 < 1e-12)
                    continue;
                for (const auto& q : accepted) {
                    const double overlap = dot(p, q);
                    for (int M=0; M<p.size(); ++M)
                        add_scaled(p[M], q[M], -overlap);
                }
                const double norm = std::sqrt(dot(p, p));
                if (norm < 1e-9*norm_0)
                    continue;
                for (auto& component : p) {
                    for (auto it=component.begin(); it!=component.end(); ) {
                        it->second /= norm;
                        if (std::abs(it->second) < 1e-12)
                            it = component.erase(it);
                        else
                            ++it;
                    }
                }
                accepted.push_back(p);
                basis[t].push_back({blocks, p});
            }
        }
    }
    return basis;
}

SymmetricContraction::SymmetricContraction()
    : num_features(0),
      correlation(0),
      num_species(0),
      num_variables(0),
      input_poly_order(0),
      output_poly_order(0),
      total_basis(0)
{
}

SymmetricContraction::SymmetricContraction(
    Irreps irreps_in,
    Irreps irreps_out,
    int correlation,
    int num_species,
    int max_ell,
    int input_poly_order,
    std::optional<int> max_poly_order)
    : irreps_in(irreps_in),
      irreps_out(irreps_out),
      correlation(correlation),
      num_species(num_species),
      input_poly_order(input_poly_order)
{
    if (irreps_in.size() == 0 or not irreps_in.has_uniform_multiplicity())
        throw ConfigurationError("SymmetricContraction: input irreps " + irreps_in.to_string()
            + " must have a uniform multiplicity");
    num_features = irreps_in[0].mul;
    if (irreps_out.size() == 0 or not irreps_out.has_uniform_multiplicity() or irreps_out[0].mul != num_features)
        throw ConfigurationError("SymmetricContraction: output irreps " + irreps_out.to_string()
            + " must all have multiplicity " + std::to_string(num_features));
    num_variables = irreps_in.dim() / num_features;

    if (max_poly_order.has_value())
        output_poly_order = correlation*input_poly_order + *max_poly_order;
    else
        output_poly_order = correlation*(input_poly_order + max_ell);
    const auto budget = max_poly_order.has_value() ? std::optional<int>(output_poly_order) : std::nullopt;
    const auto basis = product_basis(irreps_in, irreps_out, correlation, budget, input_poly_order);

    // one polynomial output per (target, basis function, component)
    total_basis = 0;
    int num_outputs = 0;
    for (int t=0; t<irreps_out.size(); ++t) {
        if (basis[t].empty())
            throw ConfigurationError("SymmetricContraction: no product of " + irreps_in.to_string()
                + " up to correlation " + std::to_string(correlation) + " reaches " + irreps_out[t].ir.to_string());
        num_basis.push_back(basis[t].size());
        basis_offset.push_back(total_basis);
        output_offset.push_back(num_outputs);
        total_basis += basis[t].size();
        num_outputs += basis[t].size()*irreps_out[t].ir.dim();
    }
    auto monomial_index = std::map<std::vector<int>,int>();
    for (const auto& basis_t : basis)
        for (const auto& f : basis_t)
            for (const auto& component : f.components)
                for (const auto& [monomial, c] : component)
                    monomial_index.insert({monomial, 0});
    auto monomials = std::vector<std::vector<int>>();
    for (auto& [monomial, index] : monomial_index) {
        index = monomials.size();
        monomials.push_back(monomial);
    }
    auto coefficients = std::vector<std::vector<double>>(num_outputs, std::vector<double>(monomials.size(), 0.0));
    for (int t=0; t<irreps_out.size(); ++t) {
        const int dim = irreps_out[t].ir.dim();
        for (int b=0; b<basis[t].size(); ++b)
            for (int M=0; M<dim; ++M)
                for (const auto& [monomial, c] : basis[t][b].components[M])
                    coefficients[output_offset[t]+b*dim+M][monomial_index[monomial]] = c;
    }
    polynomial = MultivariatePolynomial(num_variables, coefficients, monomials);
}

std::vector<int> SymmetricContraction::weight_shape() const
{
    return {num_species, total_basis, num_features};
}

void SymmetricContraction::compute(
    std::span<const double> weights,
    const IrrepsArray& A,
    std::span<const int> node_types,
    IrrepsArray& B)
{
    const int K = num_features;
    if (A.irreps != irreps_in)
        throw DomainError("SymmetricContraction: input irreps " + A.irreps.to_string()
            + " differ from " + irreps_in.to_string());
    if (weights.size() != num_species*total_basis*K)
        throw DomainError("SymmetricContraction: wrong number of weights");
    B = IrrepsArray(irreps_out, A.num_rows);
    for (int i=0; i<A.num_rows; ++i) {
        const auto f = polynomial.evaluate_batch(std::span<const double>(A.row(i), num_variables*K), K);
        const auto W_i = weights.data() + node_types[i]*total_basis*K;
        for (int t=0; t<irreps_out.size(); ++t) {
            const int dim = irreps_out[t].ir.dim();
            const double norm = 1.0/std::sqrt(num_basis[t]);
            auto B_it = B.block(i, t);
            for (int b=0; b<num_basis[t]; ++b) {
                const auto W_ib = W_i + (basis_offset[t]+b)*K;
                for (int M=0; M<dim; ++M) {
                    const auto f_bM = f.data() + (output_offset[t]+b*dim+M)*K;
                    for (int k=0; k<K; ++k)
                        B_it[M*K+k] += norm * W_ib[k] * f_bM[k];
                }
            }
        }
    }
}

void SymmetricContraction::reverse(
    std::span<const double> weights,
    const IrrepsArray& A,
    const IrrepsArray& B_adj,
    std::span<const int> node_types,
    IrrepsArray& A_adj)
{
    const int K = num_features;
    A_adj = IrrepsArray(irreps_in, A.num_rows);
    auto f_adj = std::vector<double>(polynomial.num_outputs*K);
    for (int i=0; i<A.num_rows; ++i) {
        const auto W_i = weights.data() + node_types[i]*total_basis*K;
        for (int t=0; t<irreps_out.size(); ++t) {
            const int dim = irreps_out[t].ir.dim();
            const double norm = 1.0/std::sqrt(num_basis[t]);
            const auto B_adj_it = B_adj.block(i, t);
            for (int b=0; b<num_basis[t]; ++b) {
                const auto W_ib = W_i + (basis_offset[t]+b)*K;
                for (int M=0; M<dim; ++M) {
                    auto f_adj_bM = f_adj.data() + (output_offset[t]+b*dim+M)*K;
                    for (int k=0; k<K; ++k)
                        f_adj_bM[k] = norm * W_ib[k] * B_adj_it[M*K+k];
                }
            }
        }
        // recompute the monomial graph of node i before differentiating
        polynomial.evaluate_batch(std::span<const double>(A.row(i), num_variables*K), K);
        const auto x_adj = polynomial.reverse_batch(f_adj, K);
        std::copy(x_adj.begin(), x_adj.end(), A_adj.row(i));
    }
}
