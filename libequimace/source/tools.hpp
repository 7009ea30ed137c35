#pragma once

#include <vector>

double _factorial(int n);

// all splits of a sorted multiset into two non-empty sorted parts
std::vector<std::vector<std::vector<int>>> _two_part_partitions(std::vector<int> v);

// solves the dense n x n system a*x = b (row-major) by Gaussian elimination
std::vector<double> _solve_linear_system(std::vector<double> a, std::vector<double> b);
