#pragma once

#include <string>
#include <vector>

// A single irreducible representation of O(3): degree l and parity p (+1/-1).
struct Irrep {

Irrep();
Irrep(int l, int p);
explicit Irrep(const std::string& name);

int l;
int p;

int dim() const { return 2*l+1; }
bool is_scalar() const { return l == 0 and p == 1; }
std::string to_string() const;

bool operator==(const Irrep& other) const { return l == other.l and p == other.p; }
bool operator!=(const Irrep& other) const { return not (*this == other); }
// ordered as 0e, 0o, 1o, 1e, 2e, 2o, ...
bool operator<(const Irrep& other) const;

// all irreps with degree <= l_max, in the order above
static std::vector<Irrep> iterator(int l_max);
};

// Irreps allowed by the selection rule for the product ir1 x ir2.
std::vector<Irrep> coupled_irreps(const Irrep& ir1, const Irrep& ir2);

struct MulIrrep {
int mul;
Irrep ir;
int dim() const { return mul*ir.dim(); }
};

class Irreps {

public:

Irreps();
Irreps(std::vector<MulIrrep> blocks);
explicit Irreps(const std::string& text);

// 1x0e+1x1o+1x2e+... up to l_max
static Irreps spherical_harmonics(int l_max);

int size() const { return blocks.size(); }
int dim() const { return total_dim; }
int num_irreps() const;
int lmax() const;
int count(const Irrep& ir) const;
bool contains(const Irrep& ir) const { return count(ir) > 0; }
int offset(int i) const { return offsets[i]; }
bool has_uniform_multiplicity() const;

// same irreps, every block with multiplicity mul
Irreps with_multiplicity(int mul) const;
// distinct irreps in block order
std::vector<Irrep> distinct() const;

std::string to_string() const;

const MulIrrep& operator[](int i) const { return blocks[i]; }
std::vector<MulIrrep>::const_iterator begin() const { return blocks.begin(); }
std::vector<MulIrrep>::const_iterator end() const { return blocks.end(); }
bool operator==(const Irreps& other) const;
bool operator!=(const Irreps& other) const { return not (*this == other); }

private:

std::vector<MulIrrep> blocks;
std::vector<int> offsets;
int total_dim;

void compute_offsets();

};

// Rows of irreps-typed data. Row i, block b, component m, copy u lives at
//     array[i*irreps.dim() + irreps.offset(b) + m*mul_b + u]
class IrrepsArray {

public:

IrrepsArray();
IrrepsArray(Irreps irreps, int num_rows);

Irreps irreps;
int num_rows;
std::vector<double> array;

double* row(int i) { return array.data() + i*irreps.dim(); }
const double* row(int i) const { return array.data() + i*irreps.dim(); }
double* block(int i, int b) { return row(i) + irreps.offset(b); }
const double* block(int i, int b) const { return row(i) + irreps.offset(b); }

void zero();

};
