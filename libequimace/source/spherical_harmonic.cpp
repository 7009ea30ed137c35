#include <cmath>
#include <numbers>

#include "sphericart.hpp"

#include "spherical_harmonic.hpp"

void compute_Y(
    int l_max,
    std::span<const double> xyz,
    std::vector<double>& Y,
    std::vector<double>& Y_grad)
{
    const int num = xyz.size()/3;
    const int num_lm = (l_max+1)*(l_max+1);
    Y.resize(num*num_lm);
    Y_grad.resize(3*num*num_lm);
    if (num == 0) return;
    // shuffle to match e3nn conventions
    auto xyz_shuffled = std::vector<double>(3*num);
    for (int i=0; i<num; ++i) {
        xyz_shuffled[3*i]   = xyz[3*i+2];
        xyz_shuffled[3*i+1] = xyz[3*i];
        xyz_shuffled[3*i+2] = xyz[3*i+1];
    }
    sphericart::SphericalHarmonics<double> sphericart(l_max);
    sphericart.compute_with_gradients(xyz_shuffled, Y, Y_grad);
    // normalize to match e3nn conventions
    for (int i=0; i<Y.size(); ++i)
        Y[i] *= 2*std::sqrt(std::numbers::pi);
    for (int i=0; i<Y_grad.size(); ++i)
        Y_grad[i] *= 2*std::sqrt(std::numbers::pi);
    // unshuffle gradient
    auto Y_grad_shuffled = Y_grad;
    for (int i=0; i<num; ++i) {
        for (int lm=0; lm<num_lm; ++lm) {
            Y_grad[3*i*num_lm+0*num_lm+lm] = Y_grad_shuffled[3*i*num_lm+1*num_lm+lm];
            Y_grad[3*i*num_lm+1*num_lm+lm] = Y_grad_shuffled[3*i*num_lm+2*num_lm+lm];
            Y_grad[3*i*num_lm+2*num_lm+lm] = Y_grad_shuffled[3*i*num_lm+0*num_lm+lm];
        }
    }
}

std::vector<double> compute_Y(int l_max, std::span<const double> xyz)
{
    const int num = xyz.size()/3;
    auto Y = std::vector<double>(num*(l_max+1)*(l_max+1));
    if (num == 0) return Y;
    auto xyz_shuffled = std::vector<double>(3*num);
    for (int i=0; i<num; ++i) {
        xyz_shuffled[3*i]   = xyz[3*i+2];
        xyz_shuffled[3*i+1] = xyz[3*i];
        xyz_shuffled[3*i+2] = xyz[3*i+1];
    }
    sphericart::SphericalHarmonics<double> sphericart(l_max);
    sphericart.compute(xyz_shuffled, Y);
    for (auto& y : Y)
        y *= 2*std::sqrt(std::numbers::pi);
    return Y;
}
