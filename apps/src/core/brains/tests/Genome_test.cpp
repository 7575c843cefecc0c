#include "core/brains/Genome.h"

#include <gtest/gtest.h>
#include <random>

using namespace LanderSim;

TEST(GenomeTest, ParameterCountCoversWeightsAndBiases)
{
    EXPECT_EQ(Genome::parameterCountFor({ 4, 1 }), 5u);
    EXPECT_EQ(Genome::parameterCountFor({ 4, 3, 1 }), 4u * 3u + 3u + 3u + 1u);
    EXPECT_EQ(Genome::parameterCountFor({ 4 }), 0u);
}

TEST(GenomeTest, RandomWeightsAreSmallAndDistinct)
{
    std::mt19937 rng(42);
    const Genome g = Genome::random({ 4, 3, 1 }, rng);

    ASSERT_EQ(g.weights.size(), Genome::parameterCountFor({ 4, 3, 1 }));
    for (const auto w : g.weights) {
        EXPECT_GE(w, -0.5);
        EXPECT_LE(w, 0.5);
    }
    EXPECT_NE(g.weights.front(), g.weights.back());
}

TEST(GenomeTest, SameSeedSameGenome)
{
    std::mt19937 a(7);
    std::mt19937 b(7);

    EXPECT_EQ(Genome::random({ 2, 2, 1 }, a), Genome::random({ 2, 2, 1 }, b));
}

TEST(GenomeTest, EqualityComparesShapeAndWeights)
{
    EXPECT_EQ(Genome::constant({ 2, 1 }, 0.5), Genome::constant({ 2, 1 }, 0.5));
    EXPECT_FALSE(Genome::constant({ 2, 1 }, 0.5) == Genome::constant({ 2, 1 }, 0.25));
    EXPECT_FALSE(Genome({ 3, 1 }) == Genome({ 1, 1, 1 }));
}
