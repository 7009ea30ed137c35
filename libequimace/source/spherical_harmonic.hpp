#pragma once

#include <span>
#include <vector>

// Real spherical harmonics Y_lm(xyz/|xyz|) for all l <= l_max, in the e3nn
// axis convention with "component" normalization (sum_m Y_lm^2 = 2l+1).
// For sample i, Y[i*num_lm + lm] and Y_grad[(3*i+a)*num_lm + lm] with
// lm = l*l+l+m. The gradient is taken with respect to the unnormalized xyz.
void compute_Y(int l_max,
               std::span<const double> xyz,
               std::vector<double>& Y,
               std::vector<double>& Y_grad);

// Same as above without gradients
std::vector<double> compute_Y(int l_max, std::span<const double> xyz);
