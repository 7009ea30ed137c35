#include <cmath>
#include <numbers>
#include <vector>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "radial_embedding.hpp"

TEST(Envelope, PolynomialCoefficients)
{
    // f(u) = 1 - 28u^6 + 48u^7 - 21u^8
    const auto envelope = Envelope::polynomial(5.0, 5, 2);
    ASSERT_EQ(envelope.powers, (std::vector<int>{6, 7, 8}));
    EXPECT_NEAR(envelope.coefficients[0], -28.0, 1e-10);
    EXPECT_NEAR(envelope.coefficients[1], 48.0, 1e-10);
    EXPECT_NEAR(envelope.coefficients[2], -21.0, 1e-10);
    EXPECT_NEAR(envelope.evaluate(0.0), 1.0, 1e-14);
    EXPECT_NEAR(envelope.evaluate(5.0*(1.0-1e-9)), 0.0, 1e-12);
}

TEST(Envelope, ZeroBeyondCutoff)
{
    for (const auto& envelope : {Envelope::polynomial(4.0, 4, 2), Envelope::soft(4.0)}) {
        double f, d;
        envelope.evaluate_deriv(4.0, f, d);
        EXPECT_EQ(f, 0.0);
        EXPECT_EQ(d, 0.0);
        envelope.evaluate_deriv(7.5, f, d);
        EXPECT_EQ(f, 0.0);
        EXPECT_EQ(d, 0.0);
    }
}

TEST(Envelope, SoftValueAtOrigin)
{
    EXPECT_NEAR(Envelope::soft(3.0).evaluate(0.0), 1.2, 1e-14);
    EXPECT_NEAR(Envelope::soft(3.0, 1.0, 2.0).evaluate(0.0), 2.0, 1e-14);
}

TEST(Envelope, DerivativeMatchesFiniteDifferences)
{
    const double h = 1e-6;
    for (const auto& envelope : {Envelope::polynomial(4.0, 4, 2), Envelope::soft(4.0)}) {
        for (double r : {0.3, 1.7, 3.2}) {
            double f, d;
            envelope.evaluate_deriv(r, f, d);
            EXPECT_NEAR(d, (envelope.evaluate(r+h)-envelope.evaluate(r-h))/(2*h), 1e-7);
        }
    }
}

TEST(RadialEmbedding, BesselValues)
{
    const double r_max = 5.0;
    auto radial = RadialEmbedding(r_max, 3, 5, 2);
    auto R = std::vector<double>();
    auto R_deriv = std::vector<double>();
    radial.compute_R(std::vector<double>{0.0, 1.5, 6.0}, R, R_deriv);
    ASSERT_EQ(R.size(), 9);
    const double c = std::sqrt(2.0/r_max);
    const double f = radial.envelope.evaluate(1.5);
    for (int n=1; n<=3; ++n) {
        const double a = n*std::numbers::pi/r_max;
        EXPECT_NEAR(R[n-1], c*a, 1e-12);
        EXPECT_NEAR(R_deriv[n-1], 0.0, 1e-12);
        EXPECT_NEAR(R[3+n-1], c*std::sin(a*1.5)/1.5*f, 1e-12);
        EXPECT_EQ(R[6+n-1], 0.0);
    }
}

TEST(RadialEmbedding, DerivativeMatchesFiniteDifferences)
{
    auto radial = RadialEmbedding(4.0, 6);
    const double h = 1e-6;
    const auto r = std::vector<double>{0.5, 2.1, 3.7};
    auto r_p = r, r_m = r;
    for (int i=0; i<r.size(); ++i) {
        r_p[i] += h;
        r_m[i] -= h;
    }
    auto R = std::vector<double>(), R_deriv = std::vector<double>();
    auto R_p = std::vector<double>(), R_m = std::vector<double>(), unused = std::vector<double>();
    radial.compute_R(r, R, R_deriv);
    radial.compute_R(r_p, R_p, unused);
    radial.compute_R(r_m, R_m, unused);
    for (int i=0; i<R.size(); ++i)
        EXPECT_NEAR(R_deriv[i], (R_p[i]-R_m[i])/(2*h), 1e-6);
}

TEST(RadialEmbedding, AverageMinimumDistanceNormalization)
{
    const double r_max = 5.0, avg_r_min = 1.2;
    auto plain = RadialEmbedding(r_max, 4);
    auto normalized = RadialEmbedding(r_max, 4, std::nullopt, std::nullopt, 2.0, 1.2, avg_r_min);
    EXPECT_EQ(plain.normalization, 1.0);

    auto r = std::vector<double>(1000);
    for (int i=0; i<r.size(); ++i)
        r[i] = avg_r_min + (r_max - avg_r_min)*i/999.0;
    auto R = std::vector<double>(), R_deriv = std::vector<double>();
    normalized.compute_R(r, R, R_deriv);
    double mean_square = 0.0;
    for (auto x : R)
        mean_square += x*x;
    EXPECT_NEAR(mean_square/R.size(), 1.0, 1e-12);

    auto R_plain = std::vector<double>(), R_deriv_plain = std::vector<double>();
    plain.compute_R(r, R_plain, R_deriv_plain);
    for (int i=0; i<R.size(); i+=97) {
        EXPECT_NEAR(R[i], normalized.normalization*R_plain[i], 1e-12);
        EXPECT_NEAR(R_deriv[i], normalized.normalization*R_deriv_plain[i], 1e-10);
    }

    EXPECT_THROW(RadialEmbedding(r_max, 4, std::nullopt, std::nullopt, 2.0, 1.2, r_max), ConfigurationError);
    EXPECT_THROW(RadialEmbedding(r_max, 4, std::nullopt, std::nullopt, 2.0, 1.2, -0.5), ConfigurationError);
}

TEST(RadialEmbedding, EnvelopeDegreesMustBeSetTogether)
{
    EXPECT_THROW(RadialEmbedding(5.0, 8, 5, std::nullopt), ConfigurationError);
    EXPECT_THROW(RadialEmbedding(5.0, 8, std::nullopt, 2), ConfigurationError);
    EXPECT_NO_THROW(RadialEmbedding(5.0, 8));
    EXPECT_THROW(RadialEmbedding(5.0, 0), ConfigurationError);
}
