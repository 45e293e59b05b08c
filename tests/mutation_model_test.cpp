#include "etbd/mutation_model.hpp"
#include "etbd/random.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace etbd;
using etbd::test::CountingSource;

TEST(MutationModelTest, ZeroRateLeavesGenotypeUntouchedWithoutDrawing)
{
    CountingSource rng(1);
    Genotype g = Genotype::from_string("1011001110");
    const Genotype before = g;

    EXPECT_EQ(BitFlipMutation{ 0.0 }(g, rng), 0u);
    EXPECT_EQ(g, before);
    EXPECT_EQ(rng.draws(), 0u);
}

TEST(MutationModelTest, FullRateFlipsEveryLocusWithoutDrawing)
{
    CountingSource rng(1);
    Genotype g = Genotype::from_string("1011001110");

    EXPECT_EQ(BitFlipMutation{ 1.0 }(g, rng), 10u);
    EXPECT_EQ(g.to_string(), "0100110001");
    EXPECT_EQ(rng.draws(), 0u);
}

TEST(MutationModelTest, FlipCountMatchesChangedLoci)
{
    DefaultRandom rng(17);
    for (int trial = 0; trial < 100; ++trial) {
        Genotype g = Genotype::random(32, rng);
        const Genotype before = g;
        const std::size_t flips = BitFlipMutation{ 0.2 }(g, rng);
        EXPECT_EQ(flips, hamming_distance(before, g));
    }
}

TEST(MutationModelTest, FlipsOccurAtTheConfiguredRate)
{
    DefaultRandom rng(3);
    std::size_t flips = 0;
    for (int trial = 0; trial < 1000; ++trial) {
        Genotype g(64);
        flips += BitFlipMutation{ 0.05 }(g, rng);
    }
    // 64000 trials at p = 0.05: mean 3200, sd about 55.
    EXPECT_NEAR(static_cast<double>(flips), 3200.0, 300.0);
}

TEST(MutationModelTest, ValueFormReturnsMutatedCopy)
{
    DefaultRandom rng(3);
    const Genotype original = Genotype::from_string("0000");

    const Genotype mutated = mutate(original, 1.0, rng);

    EXPECT_EQ(mutated.to_string(), "1111");
    EXPECT_EQ(original.to_string(), "0000");
}
