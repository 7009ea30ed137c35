#include <algorithm>
#include <cmath>

#include "tools.hpp"

#include "clebsch_gordan.hpp"

double clebsch_gordan(int l1, int m1, int l2, int m2, int l3, int m3)
{
    if (m3 != m1+m2)
        return 0.0;
    if (std::abs(m1) > l1 or std::abs(m2) > l2 or std::abs(m3) > l3)
        return 0.0;
    if (l3 < std::abs(l1-l2) or l3 > l1+l2)
        return 0.0;

    // Racah formula
    double prefactor = (2*l3+1)
        * _factorial(l3+l1-l2) * _factorial(l3-l1+l2) * _factorial(l1+l2-l3)
        / _factorial(l1+l2+l3+1);
    prefactor *= _factorial(l3+m3) * _factorial(l3-m3)
        * _factorial(l1-m1) * _factorial(l1+m1)
        * _factorial(l2-m2) * _factorial(l2+m2);
    prefactor = std::sqrt(prefactor);

    const int k_min = std::max({0, l2-l3-m1, l1-l3+m2});
    const int k_max = std::min({l1+l2-l3, l1-m1, l2+m2});
    double sum = 0.0;
    for (int k=k_min; k<=k_max; ++k) {
        const double denominator = _factorial(k) * _factorial(l1+l2-l3-k)
            * _factorial(l1-m1-k) * _factorial(l2+m2-k)
            * _factorial(l3-l2+m1+k) * _factorial(l3-l1-m2+k);
        sum += ((k % 2 == 0) ? 1.0 : -1.0) / denominator;
    }
    return prefactor * sum;
}

std::vector<std::complex<double>> real_to_complex_matrix(int l)
{
    const int n = 2*l+1;
    const auto imag = std::complex<double>{0.0,1.0};
    const double inv_sq_2 = 1.0 / std::sqrt(2.0);
    auto U = std::vector<std::complex<double>>(n*n, 0.0);
    for (int mu=-l; mu<=l; ++mu) {
        auto U_mu = U.data() + (l+mu)*n;
        if (mu < 0) {
            U_mu[l-mu] = inv_sq_2;
            U_mu[l+mu] = -imag*inv_sq_2;
        } else if (mu == 0) {
            U_mu[l] = 1.0;
        } else {
            const double sign = (mu % 2 == 0) ? 1.0 : -1.0;
            U_mu[l+mu] = sign*inv_sq_2;
            U_mu[l-mu] = sign*imag*inv_sq_2;
        }
    }
    return U;
}

std::vector<double> real_clebsch_gordan(int l1, int l2, int l3)
{
    if (l3 < std::abs(l1-l2) or l3 > l1+l2)
        return {};
    const int n1 = 2*l1+1, n2 = 2*l2+1, n3 = 2*l3+1;
    const auto U1 = real_to_complex_matrix(l1);
    const auto U2 = real_to_complex_matrix(l2);
    const auto U3 = real_to_complex_matrix(l3);

    // C_real[m1,m2,m3] = \sum_mu U1[mu1,m1] U2[mu2,m2] conj(U3[mu3,m3]) CG(mu1,mu2,mu3)
    auto C = std::vector<std::complex<double>>(n1*n2*n3, 0.0);
    for (int mu1=-l1; mu1<=l1; ++mu1) {
        for (int mu2=-l2; mu2<=l2; ++mu2) {
            const int mu3 = mu1+mu2;
            if (std::abs(mu3) > l3)
                continue;
            const double cg = clebsch_gordan(l1, mu1, l2, mu2, l3, mu3);
            if (cg == 0.0)
                continue;
            for (int m1=0; m1<n1; ++m1) {
                const auto u1 = U1[(l1+mu1)*n1+m1];
                if (u1 == 0.0) continue;
                for (int m2=0; m2<n2; ++m2) {
                    const auto u2 = U2[(l2+mu2)*n2+m2];
                    if (u2 == 0.0) continue;
                    for (int m3=0; m3<n3; ++m3) {
                        const auto u3 = U3[(l3+mu3)*n3+m3];
                        if (u3 == 0.0) continue;
                        C[(m1*n2+m2)*n3+m3] += u1*u2*std::conj(u3)*cg;
                    }
                }
            }
        }
    }

    // the tensor is real for even l1+l2+l3 and imaginary otherwise
    const bool use_real = ((l1+l2+l3) % 2 == 0);
    auto C_real = std::vector<double>(C.size());
    double norm = 0.0;
    for (int i=0; i<C.size(); ++i) {
        C_real[i] = use_real ? C[i].real() : C[i].imag();
        norm += C_real[i]*C_real[i];
    }
    norm = std::sqrt(norm);
    // fix the overall sign so the first significant entry is positive
    double sign = 1.0;
    for (auto c : C_real) {
        if (std::abs(c) > 1e-10*norm) {
            sign = (c > 0) ? 1.0 : -1.0;
            break;
        }
    }
    for (auto& c : C_real)
        c *= sign / norm;
    return C_real;
}

std::vector<CouplingEntry> coupling_entries(int l1, int l2, int l3)
{
    const auto C = real_clebsch_gordan(l1, l2, l3);
    const int n2 = 2*l2+1, n3 = 2*l3+1;
    const double factor = std::sqrt(2.0*l3+1.0);
    auto entries = std::vector<CouplingEntry>();
    for (int i=0; i<C.size(); ++i) {
        if (std::abs(C[i]) < 1e-12)
            continue;
        const int m3 = i % n3;
        const int m2 = (i / n3) % n2;
        const int m1 = i / (n3*n2);
        entries.push_back({m1, m2, m3, factor*C[i]});
    }
    return entries;
}
