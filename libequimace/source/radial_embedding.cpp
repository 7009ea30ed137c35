#include <cmath>
#include <numbers>

#include "errors.hpp"
#include "tools.hpp"

#include "radial_embedding.hpp"

Envelope Envelope::polynomial(double r_max, int degree0, int degree1)
{
    if (r_max <= 0.0)
        throw ConfigurationError("Envelope cutoff must be positive");
    if (degree0 < 0 or degree1 < 0)
        throw ConfigurationError("Envelope degrees must be non-negative");
    Envelope envelope;
    envelope.r_max = r_max;
    envelope.is_polynomial = true;
    envelope.arg_multiplicator = 0.0;
    envelope.prefactor = 0.0;
    // f(u) = 1 + \sum_k a_k u^(degree0+1+k), k = 0..degree1,
    // with the j-th derivative at u=1 vanishing for j = 0..degree1
    const int n = degree1+1;
    for (int k=0; k<n; ++k)
        envelope.powers.push_back(degree0+1+k);
    auto a = std::vector<double>(n*n);
    auto b = std::vector<double>(n, 0.0);
    b[0] = -1.0;
    for (int j=0; j<n; ++j) {
        for (int k=0; k<n; ++k) {
            const int p = envelope.powers[k];
            double falling = 1.0;
            for (int q=0; q<j; ++q)
                falling *= (p-q);
            a[j*n+k] = falling;
        }
    }
    envelope.coefficients = _solve_linear_system(a, b);
    return envelope;
}

Envelope Envelope::soft(double r_max, double arg_multiplicator, double value_at_origin)
{
    if (r_max <= 0.0)
        throw ConfigurationError("Envelope cutoff must be positive");
    if (arg_multiplicator <= 0.0)
        throw ConfigurationError("Envelope arg_multiplicator must be positive");
    Envelope envelope;
    envelope.r_max = r_max;
    envelope.is_polynomial = false;
    envelope.arg_multiplicator = arg_multiplicator;
    envelope.prefactor = value_at_origin * std::exp(1.0/arg_multiplicator);
    return envelope;
}

double Envelope::evaluate(double r) const
{
    double f, d;
    evaluate_deriv(r, f, d);
    return f;
}

void Envelope::evaluate_deriv(double r, double& f, double& d) const
{
    const double u = r / r_max;
    if (u >= 1.0) {
        f = 0.0;
        d = 0.0;
        return;
    }
    if (is_polynomial) {
        f = 1.0;
        d = 0.0;
        for (int k=0; k<powers.size(); ++k) {
            f += coefficients[k] * std::pow(u, powers[k]);
            d += coefficients[k] * powers[k] * std::pow(u, powers[k]-1);
        }
        d /= r_max;
    } else {
        const double x = arg_multiplicator * (1.0-u);
        f = prefactor * std::exp(-1.0/x);
        d = -f / (arg_multiplicator * (1.0-u) * (1.0-u)) / r_max;
    }
}

std::string Envelope::to_string() const
{
    if (not is_polynomial)
        return "soft(arg_multiplicator=" + std::to_string(arg_multiplicator) + ")";
    return "polynomial(" + std::to_string(powers.front()-1) + "," + std::to_string(powers.size()-1) + ")";
}

RadialEmbedding::RadialEmbedding(
    double r_max,
    int num_bessel,
    std::optional<int> num_deriv_in_zero,
    std::optional<int> num_deriv_in_one,
    double arg_multiplicator,
    double value_at_origin,
    std::optional<double> avg_r_min)
    : r_max(r_max),
      num_bessel(num_bessel),
      normalization(1.0)
{
    if (num_bessel < 1)
        throw ConfigurationError("num_bessel must be positive, got " + std::to_string(num_bessel));
    if (num_deriv_in_zero.has_value() != num_deriv_in_one.has_value())
        throw ConfigurationError("num_deriv_in_zero and num_deriv_in_one must be set together");
    if (num_deriv_in_zero.has_value())
        envelope = Envelope::polynomial(r_max, *num_deriv_in_zero, *num_deriv_in_one);
    else
        envelope = Envelope::soft(r_max, arg_multiplicator, value_at_origin);

    if (avg_r_min.has_value()) {
        if (*avg_r_min < 0.0 or *avg_r_min >= r_max)
            throw ConfigurationError("avg_r_min must lie in [0, r_max), got " + std::to_string(*avg_r_min));
        const int num_samples = 1000;
        auto r = std::vector<double>(num_samples);
        for (int i=0; i<num_samples; ++i)
            r[i] = *avg_r_min + (r_max - *avg_r_min)*i/(num_samples-1);
        auto R = std::vector<double>();
        auto R_deriv = std::vector<double>();
        compute_R(r, R, R_deriv);
        double mean_square = 0.0;
        for (auto x : R)
            mean_square += x*x;
        mean_square /= R.size();
        normalization = 1.0/std::sqrt(mean_square);
    }
}

void RadialEmbedding::compute_R(
    std::span<const double> r,
    std::vector<double>& R,
    std::vector<double>& R_deriv) const
{
    R.resize(r.size()*num_bessel);
    R_deriv.resize(r.size()*num_bessel);
    const double c = std::sqrt(2.0/r_max);
    for (int i=0; i<r.size(); ++i) {
        double f, df;
        envelope.evaluate_deriv(r[i], f, df);
        auto R_i = R.data() + i*num_bessel;
        auto R_deriv_i = R_deriv.data() + i*num_bessel;
        for (int n=1; n<=num_bessel; ++n) {
            const double a = n*std::numbers::pi/r_max;
            double b, db;
            if (r[i] == 0.0) {
                b = c*a;
                db = 0.0;
            } else {
                b = c*std::sin(a*r[i])/r[i];
                db = c*(a*r[i]*std::cos(a*r[i]) - std::sin(a*r[i]))/(r[i]*r[i]);
            }
            R_i[n-1] = normalization*b*f;
            R_deriv_i[n-1] = normalization*(db*f + b*df);
        }
    }
}
