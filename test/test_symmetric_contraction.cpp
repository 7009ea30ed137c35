#include <cmath>
#include <vector>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "symmetric_contraction.hpp"

TEST(ProductBasis, PowersOfAScalar)
{
    const auto basis = product_basis(Irreps("1x0e"), Irreps("1x0e"), 3);
    ASSERT_EQ(basis.size(), 1);
    ASSERT_EQ(basis[0].size(), 3);
    for (int nu=1; nu<=3; ++nu) {
        const auto& f = basis[0][nu-1];
        EXPECT_EQ(f.blocks, std::vector<int>(nu, 0));
        ASSERT_EQ(f.components.size(), 1);
        ASSERT_EQ(f.components[0].size(), 1);
        EXPECT_NEAR(f.components[0].at(std::vector<int>(nu, 0)), 1.0, 1e-12);
    }
}

TEST(ProductBasis, InvariantsOfOneVector)
{
    // only |x|^2 up to third order: the cubic couplings have odd parity
    const auto basis = product_basis(Irreps("1x1o"), Irreps("1x0e"), 3);
    ASSERT_EQ(basis[0].size(), 1);
    const auto& f = basis[0][0].components[0];
    EXPECT_EQ(f.size(), 3);
    for (int m=0; m<3; ++m)
        EXPECT_NEAR(std::abs(f.at({m, m})), 1.0/std::sqrt(3.0), 1e-12);
}

TEST(ProductBasis, RedundantCouplingsAreRemoved)
{
    // x and |x|^2 x; ((x x)_1 x)_1 vanishes
    const auto basis = product_basis(Irreps("1x1o"), Irreps("1x1o"), 3);
    ASSERT_EQ(basis[0].size(), 2);
    EXPECT_EQ(basis[0][0].blocks.size(), 1);
    EXPECT_EQ(basis[0][1].blocks.size(), 3);
}

TEST(ProductBasis, Orthonormal)
{
    const auto basis = product_basis(Irreps("1x0e+1x1o+1x2e"), Irreps("1x0e+1x1o"), 3);
    for (const auto& basis_t : basis) {
        for (int a=0; a<basis_t.size(); ++a) {
            for (int b=0; b<basis_t.size(); ++b) {
                double s = 0.0;
                for (int M=0; M<basis_t[a].components.size(); ++M)
                    for (const auto& [monomial, c] : basis_t[a].components[M])
                        if (basis_t[b].components[M].contains(monomial))
                            s += c * basis_t[b].components[M].at(monomial);
                EXPECT_NEAR(s, (a == b) ? 1.0 : 0.0, 1e-10);
            }
        }
    }
}

TEST(ProductBasis, IndependentOfBlockOrder)
{
    // intermediate couplings above the largest input l must be kept
    const auto irreps_out = Irreps("0e+1o+2e+3o");
    const auto expected = std::vector<int>{13, 16, 20, 19};
    for (const auto order : {"0e+1o+2e+3o", "3o+2e+1o+0e", "2e+0e+3o+1o"}) {
        const auto basis = product_basis(Irreps(order), irreps_out, 3);
        ASSERT_EQ(basis.size(), expected.size());
        for (int t=0; t<expected.size(); ++t)
            EXPECT_EQ(basis[t].size(), expected[t]) << order << " " << irreps_out[t].ir.to_string();
    }
}

TEST(ProductBasis, DegreeBudget)
{
    const auto irreps_in = Irreps("1x0e+1x1o+1x2e");
    const auto full = product_basis(irreps_in, Irreps("1x0e"), 2);
    const auto truncated = product_basis(irreps_in, Irreps("1x0e"), 2, 2);
    EXPECT_LT(truncated[0].size(), full[0].size());
    for (const auto& f : truncated[0]) {
        int sum_l = 0;
        for (auto a : f.blocks)
            sum_l += irreps_in[a].ir.l;
        EXPECT_LE(sum_l, 2);
    }
}

TEST(SymmetricContraction, ScalarPolynomial)
{
    const int K = 2;
    auto contraction = SymmetricContraction(Irreps("2x0e"), Irreps("2x0e"), 3, 2, 0);
    EXPECT_EQ(contraction.total_basis, 3);
    EXPECT_EQ(contraction.weight_shape(), (std::vector<int>{2, 3, K}));

    // W[s][b][k]
    const auto weights = std::vector<double>{
        1.0, 2.0,  0.5, -1.0,  0.0, 3.0,
        -1.0, 0.0,  0.0, 1.0,  1.0, 1.0};
    auto A = IrrepsArray(Irreps("2x0e"), 2);
    A.array = {0.5, -2.0, 1.5, 0.3};
    const auto node_types = std::vector<int>{0, 1};
    auto B = IrrepsArray();
    contraction.compute(weights, A, node_types, B);
    for (int i=0; i<2; ++i) {
        for (int k=0; k<K; ++k) {
            const double x = A.array[i*K+k];
            const auto W = weights.data() + node_types[i]*3*K;
            const double expected = (W[k]*x + W[K+k]*x*x + W[2*K+k]*x*x*x) / std::sqrt(3.0);
            EXPECT_NEAR(B.array[i*K+k], expected, 1e-13);
        }
    }
}

TEST(SymmetricContraction, ReverseMatchesFiniteDifferences)
{
    const int K = 3;
    const auto irreps_in = Irreps("0e+1o+2e").with_multiplicity(K);
    const auto irreps_out = Irreps("0e+1o").with_multiplicity(K);
    auto contraction = SymmetricContraction(irreps_in, irreps_out, 3, 2, 2);
    auto weights = std::vector<double>(2*contraction.total_basis*K);
    for (int i=0; i<weights.size(); ++i)
        weights[i] = std::sin(0.37*i + 0.1);
    auto A = IrrepsArray(irreps_in, 2);
    for (int i=0; i<A.array.size(); ++i)
        A.array[i] = std::cos(1.3*i);
    auto B_adj = IrrepsArray(irreps_out, 2);
    for (int i=0; i<B_adj.array.size(); ++i)
        B_adj.array[i] = std::sin(0.9*i + 0.4);
    const auto node_types = std::vector<int>{1, 0};

    auto loss = [&](const IrrepsArray& x) {
        auto B = IrrepsArray();
        contraction.compute(weights, x, node_types, B);
        double s = 0.0;
        for (int i=0; i<B.array.size(); ++i)
            s += B.array[i]*B_adj.array[i];
        return s;
    };
    auto A_adj = IrrepsArray();
    contraction.reverse(weights, A, B_adj, node_types, A_adj);
    ASSERT_EQ(A_adj.array.size(), A.array.size());
    const double h = 1e-6;
    for (int i=0; i<A.array.size(); ++i) {
        auto A_p = A, A_m = A;
        A_p.array[i] += h;
        A_m.array[i] -= h;
        EXPECT_NEAR(A_adj.array[i], (loss(A_p)-loss(A_m))/(2*h), 1e-6);
    }
}

TEST(SymmetricContraction, PolynomialOrder)
{
    const auto irreps = Irreps("0e+1o").with_multiplicity(2);
    EXPECT_EQ(SymmetricContraction(irreps, irreps, 3, 1, 1, 2).output_poly_order, 3*(2+1));
    EXPECT_EQ(SymmetricContraction(irreps, irreps, 3, 1, 1, 2, 4).output_poly_order, 3*2+4);
}

TEST(SymmetricContraction, UnreachableIrrep)
{
    EXPECT_THROW(SymmetricContraction(Irreps("2x1o"), Irreps("2x0o"), 3, 1, 1), ConfigurationError);
    EXPECT_THROW(SymmetricContraction(Irreps("2x0e"), Irreps("2x1o"), 3, 1, 0), ConfigurationError);
    EXPECT_THROW(SymmetricContraction(Irreps("2x0e+1x1o"), Irreps("2x0e"), 2, 1, 1), ConfigurationError);
}
