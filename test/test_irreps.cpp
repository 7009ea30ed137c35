#include <gtest/gtest.h>

#include "errors.hpp"
#include "irreps.hpp"

TEST(Irreps, ParsesAndPrints)
{
    const auto irreps = Irreps("16x0e + 16x1o+2e");
    ASSERT_EQ(irreps.size(), 3);
    EXPECT_EQ(irreps[0].mul, 16);
    EXPECT_EQ(irreps[1].ir, Irrep(1,-1));
    EXPECT_EQ(irreps[2].mul, 1);
    EXPECT_EQ(irreps.to_string(), "16x0e+16x1o+1x2e");
    EXPECT_EQ(irreps.dim(), 16 + 48 + 5);
    EXPECT_EQ(irreps.offset(2), 64);
    EXPECT_EQ(irreps.lmax(), 2);
    EXPECT_EQ(irreps.count(Irrep("0e")), 16);
    EXPECT_EQ(irreps.num_irreps(), 33);
}

TEST(Irreps, SphericalHarmonicParity)
{
    EXPECT_EQ(Irrep("3y"), Irrep(3,-1));
    EXPECT_EQ(Irreps::spherical_harmonics(2), Irreps("0e+1o+2e"));
}

TEST(Irreps, RejectsMalformedText)
{
    EXPECT_THROW(Irreps("16x"), ConfigurationError);
    EXPECT_THROW(Irreps("ax0e"), ConfigurationError);
    EXPECT_THROW(Irreps("0e++1o"), ConfigurationError);
    EXPECT_THROW(Irrep("1z"), ConfigurationError);
    EXPECT_THROW(Irrep(-1,1), ConfigurationError);
}

TEST(Irreps, Ordering)
{
    const auto irreps = Irrep::iterator(2);
    ASSERT_EQ(irreps.size(), 6);
    EXPECT_EQ(irreps[0], Irrep("0e"));
    EXPECT_EQ(irreps[1], Irrep("0o"));
    EXPECT_EQ(irreps[2], Irrep("1o"));
    EXPECT_EQ(irreps[3], Irrep("1e"));
    EXPECT_EQ(irreps[4], Irrep("2e"));
    EXPECT_EQ(irreps[5], Irrep("2o"));
    for (int i=0; i+1<irreps.size(); ++i)
        EXPECT_TRUE(irreps[i] < irreps[i+1]);
}

TEST(Irreps, SelectionRule)
{
    const auto irreps = coupled_irreps(Irrep("1o"), Irrep("2e"));
    ASSERT_EQ(irreps.size(), 3);
    EXPECT_EQ(irreps[0], Irrep("1o"));
    EXPECT_EQ(irreps[1], Irrep("2o"));
    EXPECT_EQ(irreps[2], Irrep("3o"));
}

TEST(Irreps, UniformMultiplicity)
{
    EXPECT_TRUE(Irreps("8x0e+8x1o").has_uniform_multiplicity());
    EXPECT_FALSE(Irreps("8x0e+4x1o").has_uniform_multiplicity());
    EXPECT_EQ(Irreps("0e+1o").with_multiplicity(3), Irreps("3x0e+3x1o"));
}

TEST(IrrepsArray, BlockLayout)
{
    auto x = IrrepsArray(Irreps("2x0e+2x1o"), 3);
    EXPECT_EQ(x.array.size(), 3*8);
    x.block(1, 1)[1*2+0] = 5.0;  // row 1, 1o block, m=1, copy 0
    EXPECT_EQ(x.array[8 + 2 + 2], 5.0);
    x.zero();
    EXPECT_EQ(x.array[12], 0.0);
}
