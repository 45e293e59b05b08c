#include "etbd/errors.hpp"
#include "etbd/genotype.hpp"
#include "etbd/random.hpp"
#include <gtest/gtest.h>

using namespace etbd;

TEST(GenotypeTest, ParsesAndPrintsBitStrings)
{
    const Genotype g = Genotype::from_string("0110100");

    ASSERT_EQ(g.size(), 7u);
    EXPECT_EQ(g[0], 0);
    EXPECT_EQ(g[1], 1);
    EXPECT_EQ(g[2], 1);
    EXPECT_EQ(g.count_ones(), 3u);
    EXPECT_EQ(g.to_string(), "0110100");
}

TEST(GenotypeTest, RejectsNonBinaryCharacters)
{
    EXPECT_THROW(Genotype::from_string("01201"), ConfigurationError);
    EXPECT_THROW(Genotype::from_string("01 1"), ConfigurationError);
}

TEST(GenotypeTest, ExplicitBitsAreNormalisedToZeroOrOne)
{
    const Genotype g(std::vector<Bit>{0, 7, 1, 255});
    EXPECT_EQ(g.to_string(), "0111");
}

TEST(GenotypeTest, FlipAndSetChangeOneLocus)
{
    Genotype g(5);
    EXPECT_EQ(g.to_string(), "00000");

    g.flip(1);
    g.set(4, 9);
    EXPECT_EQ(g.to_string(), "01001");

    g.flip(1);
    EXPECT_EQ(g.to_string(), "00001");
}

TEST(GenotypeTest, HammingDistanceCountsDifferingLoci)
{
    const Genotype a = Genotype::from_string("110010");
    const Genotype b = Genotype::from_string("011011");

    EXPECT_EQ(hamming_distance(a, b), 3u);
    EXPECT_EQ(hamming_distance(a, a), 0u);
}

TEST(GenotypeTest, HammingDistanceRejectsUnequalLengths)
{
    EXPECT_THROW(
        (void)hamming_distance(Genotype::from_string("01"), Genotype::from_string("011")),
        InvariantViolation);
}

TEST(GenotypeTest, RandomGenotypeIsReproducibleForASeed)
{
    DefaultRandom rngA(7);
    DefaultRandom rngB(7);

    const Genotype a = Genotype::random(40, rngA);
    const Genotype b = Genotype::random(40, rngB);

    EXPECT_EQ(a.size(), 40u);
    EXPECT_EQ(a, b);
}

TEST(GenotypeTest, RandomGenotypesAreRoughlyHalfOnes)
{
    DefaultRandom rng(11);
    std::size_t ones = 0;
    for (int i = 0; i < 200; ++i) ones += Genotype::random(50, rng).count_ones();

    // 10000 fair coins: mean 5000, sd 50.
    EXPECT_NEAR(static_cast<double>(ones), 5000.0, 300.0);
}
