#include <cmath>
#include <stdexcept>

#include "tools.hpp"

double _factorial(int n)
{
    if (n < 0)
        throw std::invalid_argument("Negative argument in _factorial.");
    double f = 1.0;
    for (int i=2; i<=n; ++i)
        f *= i;
    return f;
}

std::vector<std::vector<std::vector<int>>> _two_part_partitions(std::vector<int> v)
{
    auto partitions = std::vector<std::vector<std::vector<int>>>();
    const int n = v.size();
    if (n < 2)
        return partitions;
    // bit i of mask puts v[i] in the first part; v[0] always goes first,
    // so each unordered split appears once
    for (unsigned mask=1; mask<(1u<<n)-1; mask+=2) {
        auto first = std::vector<int>();
        auto second = std::vector<int>();
        for (int i=0; i<n; ++i) {
            if (mask & (1u<<i))
                first.push_back(v[i]);
            else
                second.push_back(v[i]);
        }
        partitions.push_back({first, second});
    }
    return partitions;
}

std::vector<double> _solve_linear_system(std::vector<double> a, std::vector<double> b)
{
    const int n = b.size();
    if (a.size() != n*n)
        throw std::invalid_argument("Inconsistent sizes in _solve_linear_system.");
    for (int col=0; col<n; ++col) {
        // partial pivoting
        int pivot = col;
        for (int row=col+1; row<n; ++row)
            if (std::abs(a[row*n+col]) > std::abs(a[pivot*n+col]))
                pivot = row;
        if (a[pivot*n+col] == 0.0)
            throw std::invalid_argument("Singular matrix in _solve_linear_system.");
        if (pivot != col) {
            for (int k=0; k<n; ++k)
                std::swap(a[col*n+k], a[pivot*n+k]);
            std::swap(b[col], b[pivot]);
        }
        for (int row=col+1; row<n; ++row) {
            const double f = a[row*n+col] / a[col*n+col];
            for (int k=col; k<n; ++k)
                a[row*n+k] -= f*a[col*n+k];
            b[row] -= f*b[col];
        }
    }
    auto x = std::vector<double>(n, 0.0);
    for (int row=n-1; row>=0; --row) {
        double s = b[row];
        for (int k=row+1; k<n; ++k)
            s -= a[row*n+k]*x[k];
        x[row] = s / a[row*n+row];
    }
    return x;
}
