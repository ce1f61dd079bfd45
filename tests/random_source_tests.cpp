#include <gtest/gtest.h>
#include "kernel/RandomSource.h"
#include <array>
#include <set>

// Same seed, same stream
TEST(RandomSourceTest, DeterministicForSeed) {
    RandomSource a(7);
    RandomSource b(7);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.uniform(0.0, 1.0), b.uniform(0.0, 1.0));
        EXPECT_EQ(a.uniformInt(-5, 5), b.uniformInt(-5, 5));
    }
}

TEST(RandomSourceTest, ReseedRestartsStream) {
    RandomSource rng(99);
    const double first = rng.uniform(0.0, 1.0);
    rng.uniform(0.0, 1.0);
    rng.seed(99);
    EXPECT_EQ(rng.uniform(0.0, 1.0), first);
    EXPECT_EQ(rng.seedValue(), 99u);
}

TEST(RandomSourceTest, UniformRanges) {
    RandomSource rng(1);
    for (int i = 0; i < 1000; ++i) {
        const double x = rng.uniform(0.3, 0.7);
        EXPECT_GE(x, 0.3);
        EXPECT_LE(x, 0.7);

        // Reversed bounds are swapped
        const double y = rng.uniform(2.0, -2.0);
        EXPECT_GE(y, -2.0);
        EXPECT_LE(y, 2.0);
    }
    EXPECT_EQ(rng.uniform(0.5, 0.5), 0.5);
}

TEST(RandomSourceTest, UniformIntIsInclusive) {
    RandomSource rng(2);
    std::set<int> seen;
    for (int i = 0; i < 1000; ++i) {
        const int v = rng.uniformInt(1, 3);
        EXPECT_GE(v, 1);
        EXPECT_LE(v, 3);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 3u);
}

TEST(RandomSourceTest, BernoulliExtremes) {
    RandomSource rng(3);
    for (int i = 0; i < 100; ++i) {
        EXPECT_FALSE(rng.bernoulli(0.0));
        EXPECT_TRUE(rng.bernoulli(1.0));
    }
}

TEST(RandomSourceTest, WeightedIndexSkipsZeroWeights) {
    RandomSource rng(4);
    const std::array<double, 3> weights = {0.0, 2.0, 0.0};
    for (int i = 0; i < 200; ++i) {
        EXPECT_EQ(rng.weightedIndex(weights), 1u);
    }
}

TEST(RandomSourceTest, WeightedIndexZeroTotalFallsBackToUniform) {
    RandomSource rng(5);
    const std::array<double, 4> weights = {0.0, 0.0, 0.0, 0.0};
    std::set<std::size_t> seen;
    for (int i = 0; i < 500; ++i) {
        const std::size_t idx = rng.weightedIndex(weights);
        EXPECT_LT(idx, 4u);
        seen.insert(idx);
    }
    EXPECT_EQ(seen.size(), 4u);
}

TEST(RandomSourceTest, IndexOfSingleElement) {
    RandomSource rng(6);
    EXPECT_EQ(rng.index(1), 0u);
    EXPECT_EQ(rng.index(0), 0u);
}

TEST(RandomSourceTest, DerivedSeedsAreStableAndDistinct) {
    EXPECT_EQ(RandomSource::deriveSeed(42, 3), RandomSource::deriveSeed(42, 3));
    std::set<std::uint64_t> seeds;
    for (std::uint64_t s = 0; s < 100; ++s) {
        seeds.insert(RandomSource::deriveSeed(42, s));
    }
    EXPECT_EQ(seeds.size(), 100u);
    EXPECT_NE(RandomSource::deriveSeed(42, 0), RandomSource::deriveSeed(43, 0));
}
