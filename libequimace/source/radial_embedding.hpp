#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>

// Smooth cutoff multiplier, exactly zero for r >= r_max.
class Envelope {

public:

// polynomial envelope with degree0 vanishing derivatives at the origin and
// f(1) = f'(1) = ... = f^(degree1)(1) = 0
static Envelope polynomial(double r_max, int degree0, int degree1);
// C-infinity envelope c*exp(-1/(a*(1-r/r_max))) with value_at_origin at r=0
static Envelope soft(double r_max, double arg_multiplicator = 2.0, double value_at_origin = 1.2);

double r_max;
bool is_polynomial;

// polynomial envelope: f(u) = 1 + \sum_k coefficients[k]*u^powers[k]
std::vector<int> powers;
std::vector<double> coefficients;

// soft envelope
double arg_multiplicator;
double prefactor;

double evaluate(double r) const;
// value and derivative with respect to r
void evaluate_deriv(double r, double& f, double& d) const;

std::string to_string() const;

};

// Bessel basis times envelope: R_n(r) = sqrt(2/r_max) sin(n pi r/r_max)/r * f(r)
class RadialEmbedding {

public:

RadialEmbedding(double r_max,
                int num_bessel,
                std::optional<int> num_deriv_in_zero = std::nullopt,
                std::optional<int> num_deriv_in_one = std::nullopt,
                double arg_multiplicator = 2.0,
                double value_at_origin = 1.2,
                std::optional<double> avg_r_min = std::nullopt);

double r_max;
int num_bessel;
Envelope envelope;
// 1, or the factor giving the basis unit mean square on [avg_r_min, r_max]
double normalization;

// R[i*num_bessel+n] and dR/dr for every length r[i]
void compute_R(std::span<const double> r,
               std::vector<double>& R,
               std::vector<double>& R_deriv) const;

};
