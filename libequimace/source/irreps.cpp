#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include "errors.hpp"
#include "irreps.hpp"

Irrep::Irrep()
    : l(0), p(1)
{
}

Irrep::Irrep(int l, int p)
    : l(l), p(p)
{
    if (l < 0)
        throw ConfigurationError("Irrep degree must be non-negative, got " + std::to_string(l));
    if (p != 1 and p != -1)
        throw ConfigurationError("Irrep parity must be +1 or -1, got " + std::to_string(p));
}

Irrep::Irrep(const std::string& name)
{
    if (name.size() < 2)
        throw ConfigurationError("Invalid irrep '" + name + "'");
    const char parity = name.back();
    if (parity == 'e')
        p = 1;
    else if (parity == 'o')
        p = -1;
    else if (parity == 'y')
        p = 0;
    else
        throw ConfigurationError("Invalid irrep '" + name + "'");
    const auto degree = name.substr(0, name.size()-1);
    if (not std::all_of(degree.begin(), degree.end(), [](char c) { return std::isdigit(c); }))
        throw ConfigurationError("Invalid irrep '" + name + "'");
    l = std::atoi(degree.c_str());
    // "y" is the parity of the spherical harmonic of that degree
    if (p == 0)
        p = (l % 2 == 0) ? 1 : -1;
}

std::string Irrep::to_string() const
{
    return std::to_string(l) + ((p == 1) ? "e" : "o");
}

bool Irrep::operator<(const Irrep& other) const
{
    if (l != other.l)
        return l < other.l;
    // the parity of Y_l comes first
    const int natural = (l % 2 == 0) ? 1 : -1;
    return p == natural and other.p != natural;
}

std::vector<Irrep> Irrep::iterator(int l_max)
{
    auto irreps = std::vector<Irrep>();
    for (int l=0; l<=l_max; ++l) {
        const int natural = (l % 2 == 0) ? 1 : -1;
        irreps.push_back(Irrep(l, natural));
        irreps.push_back(Irrep(l, -natural));
    }
    return irreps;
}

std::vector<Irrep> coupled_irreps(const Irrep& ir1, const Irrep& ir2)
{
    auto irreps = std::vector<Irrep>();
    for (int l=std::abs(ir1.l-ir2.l); l<=ir1.l+ir2.l; ++l)
        irreps.push_back(Irrep(l, ir1.p*ir2.p));
    return irreps;
}

Irreps::Irreps()
{
    compute_offsets();
}

Irreps::Irreps(std::vector<MulIrrep> blocks)
    : blocks(blocks)
{
    for (const auto& block : blocks)
        if (block.mul < 0)
            throw ConfigurationError("Negative multiplicity in irreps");
    compute_offsets();
}

Irreps::Irreps(const std::string& text)
{
    // accepts e.g. "16x0e+16x1o", "0e + 1o", "2x1y"
    auto stripped = std::string();
    for (char c : text)
        if (not std::isspace(static_cast<unsigned char>(c)))
            stripped.push_back(c);
    std::stringstream stream(stripped);
    std::string term;
    while (std::getline(stream, term, '+')) {
        if (term.empty())
            throw ConfigurationError("Invalid irreps '" + text + "'");
        int mul = 1;
        const auto x = term.find('x');
        if (x != std::string::npos) {
            const auto mul_str = term.substr(0, x);
            if (mul_str.empty() or not std::all_of(mul_str.begin(), mul_str.end(), [](char c) { return std::isdigit(c); }))
                throw ConfigurationError("Invalid multiplicity in irreps '" + text + "'");
            mul = std::atoi(mul_str.c_str());
            term = term.substr(x+1);
        }
        blocks.push_back({mul, Irrep(term)});
    }
    compute_offsets();
}

Irreps Irreps::spherical_harmonics(int l_max)
{
    auto blocks = std::vector<MulIrrep>();
    for (int l=0; l<=l_max; ++l)
        blocks.push_back({1, Irrep(l, (l % 2 == 0) ? 1 : -1)});
    return Irreps(blocks);
}

int Irreps::num_irreps() const
{
    int n = 0;
    for (const auto& block : blocks)
        n += block.mul;
    return n;
}

int Irreps::lmax() const
{
    if (blocks.empty())
        throw ConfigurationError("lmax of empty irreps");
    int l_max = 0;
    for (const auto& block : blocks)
        l_max = std::max(l_max, block.ir.l);
    return l_max;
}

int Irreps::count(const Irrep& ir) const
{
    int n = 0;
    for (const auto& block : blocks)
        if (block.ir == ir)
            n += block.mul;
    return n;
}

bool Irreps::has_uniform_multiplicity() const
{
    for (const auto& block : blocks)
        if (block.mul != blocks.front().mul)
            return false;
    return true;
}

Irreps Irreps::with_multiplicity(int mul) const
{
    auto new_blocks = blocks;
    for (auto& block : new_blocks)
        block.mul = mul;
    return Irreps(new_blocks);
}

std::vector<Irrep> Irreps::distinct() const
{
    auto irreps = std::vector<Irrep>();
    for (const auto& block : blocks)
        if (std::find(irreps.begin(), irreps.end(), block.ir) == irreps.end())
            irreps.push_back(block.ir);
    return irreps;
}

std::string Irreps::to_string() const
{
    auto text = std::string();
    for (int i=0; i<blocks.size(); ++i) {
        if (i > 0)
            text += "+";
        text += std::to_string(blocks[i].mul) + "x" + blocks[i].ir.to_string();
    }
    return text;
}

bool Irreps::operator==(const Irreps& other) const
{
    if (blocks.size() != other.blocks.size())
        return false;
    for (int i=0; i<blocks.size(); ++i)
        if (blocks[i].mul != other.blocks[i].mul or blocks[i].ir != other.blocks[i].ir)
            return false;
    return true;
}

void Irreps::compute_offsets()
{
    offsets.clear();
    total_dim = 0;
    for (const auto& block : blocks) {
        offsets.push_back(total_dim);
        total_dim += block.dim();
    }
}

IrrepsArray::IrrepsArray()
    : num_rows(0)
{
}

IrrepsArray::IrrepsArray(Irreps irreps, int num_rows)
    : irreps(irreps),
      num_rows(num_rows),
      array(num_rows*irreps.dim(), 0.0)
{
}

void IrrepsArray::zero()
{
    std::fill(array.begin(), array.end(), 0.0);
}
