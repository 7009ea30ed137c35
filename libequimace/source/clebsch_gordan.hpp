#pragma once

#include <complex>
#include <vector>

// <l1 m1 l2 m2 | l3 m3> for complex spherical harmonics (Condon-Shortley phase)
double clebsch_gordan(int l1, int m1, int l2, int m2, int l3, int m3);

// Unitary map from real to complex spherical harmonics of degree l,
//     Y_complex[l+mu] = \sum_m U[(l+mu)*(2l+1) + (l+m)] Y_real[l+m]
std::vector<std::complex<double>> real_to_complex_matrix(int l);

// Coupling tensor C[(m1*(2l2+1) + m2)*(2l3+1) + m3] in the real basis with
// unit Frobenius norm. Empty if the triangle condition fails.
std::vector<double> real_clebsch_gordan(int l1, int l2, int l3);

// One nonzero entry of a coupling tensor
struct CouplingEntry {
int m1, m2, m3;
double value;
};

// Nonzero entries of sqrt(2l3+1)*real_clebsch_gordan(l1,l2,l3): the
// "component" normalized product of two degree-l1 and degree-l2 irreps
std::vector<CouplingEntry> coupling_entries(int l1, int l2, int l3);
