#include <cmath>
#include <vector>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "multivariate_polynomial.hpp"

namespace {

MultivariatePolynomial example_polynomial()
{
    // f_0 = 2 x0 + x0 x1 x2 - 3 x1^2 x2
    // f_1 = x2^3 + 0.5 x0 x1 x1 x2
    const auto monomials = std::vector<std::vector<int>>{{0}, {0,1,2}, {1,1,2}, {2,2,2}, {0,1,1,2}};
    const auto coefficients = std::vector<std::vector<double>>{
        {2.0, 1.0, -3.0, 0.0, 0.0},
        {0.0, 0.0, 0.0, 1.0, 0.5}};
    return MultivariatePolynomial(3, coefficients, monomials);
}

}

TEST(MultivariatePolynomial, MatchesDirectEvaluation)
{
    auto p = example_polynomial();
    const auto x = std::vector<double>{0.7, -1.3, 0.4};
    const auto f = p.evaluate(x);
    ASSERT_EQ(f.size(), 2);
    const double f0 = 2*x[0] + x[0]*x[1]*x[2] - 3*x[1]*x[1]*x[2];
    const double f1 = x[2]*x[2]*x[2] + 0.5*x[0]*x[1]*x[1]*x[2];
    EXPECT_NEAR(f[0], f0, 1e-14);
    EXPECT_NEAR(f[1], f1, 1e-14);
    const auto f_simple = p.evaluate_simple(x);
    EXPECT_NEAR(f_simple[0], f0, 1e-14);
    EXPECT_NEAR(f_simple[1], f1, 1e-14);
}

TEST(MultivariatePolynomial, MergesRepeatedMonomials)
{
    auto p = MultivariatePolynomial(2, {{1.0, 2.0, 0.5}}, {{0,1}, {0,1}, {1}});
    EXPECT_EQ(p.monomials.size(), 2);
    const auto f = p.evaluate(std::vector<double>{2.0, 3.0});
    EXPECT_NEAR(f[0], 3.0*6.0 + 1.5, 1e-14);
}

TEST(MultivariatePolynomial, BatchLayout)
{
    auto p = example_polynomial();
    const int batch_size = 3;
    const auto x = std::vector<double>{
        0.1, 0.2, 0.3,     // x0
        -0.5, 1.0, 2.0,    // x1
        0.9, -0.8, 0.7};   // x2
    const auto f = p.evaluate_batch(x, batch_size);
    ASSERT_EQ(f.size(), 2*batch_size);
    for (int j=0; j<batch_size; ++j) {
        const auto f_j = p.evaluate_simple(std::vector<double>{x[j], x[batch_size+j], x[2*batch_size+j]});
        EXPECT_NEAR(f[j], f_j[0], 1e-14);
        EXPECT_NEAR(f[batch_size+j], f_j[1], 1e-14);
    }
}

TEST(MultivariatePolynomial, ReverseMatchesFiniteDifferences)
{
    auto p = example_polynomial();
    const int batch_size = 2;
    const auto x = std::vector<double>{0.3, -0.6, 1.2, 0.5, -0.4, 0.8};
    const auto f_adj = std::vector<double>{1.0, -2.0, 0.5, 0.25};
    auto loss = [&](const std::vector<double>& y) {
        const auto f = p.evaluate_batch(y, batch_size);
        double s = 0.0;
        for (int i=0; i<f.size(); ++i)
            s += f[i]*f_adj[i];
        return s;
    };
    p.evaluate_batch(x, batch_size);
    const auto x_adj = p.reverse_batch(f_adj, batch_size);
    ASSERT_EQ(x_adj.size(), x.size());
    const double h = 1e-6;
    for (int i=0; i<x.size(); ++i) {
        auto x_p = x, x_m = x;
        x_p[i] += h;
        x_m[i] -= h;
        EXPECT_NEAR(x_adj[i], (loss(x_p)-loss(x_m))/(2*h), 1e-8);
    }
}

TEST(MultivariatePolynomial, RejectsInvalidMonomials)
{
    EXPECT_THROW(MultivariatePolynomial(2, {{1.0}}, {{1,0}}), ConfigurationError);
    EXPECT_THROW(MultivariatePolynomial(2, {{1.0}}, {{0,2}}), ConfigurationError);
    EXPECT_THROW(MultivariatePolynomial(2, {{1.0, 1.0}}, {{0}}), ConfigurationError);
    EXPECT_THROW(MultivariatePolynomial(2, {{1.0}}, {{}}), ConfigurationError);
}
