#include "core/brains/Genome.h"
#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/Mutation.h"

#include <cmath>
#include <gtest/gtest.h>

using namespace LanderSim;

class MutationTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
};

TEST_F(MutationTest, ZeroProbabilityProducesIdenticalGenome)
{
    const Genome parent = Genome::random({ 4, 3, 1 }, rng);
    const MutationConfig config{ .perturbationProbability = 0.0, .perturbationMagnitude = 0.5 };

    const Genome child = mutate(parent, config, rng);

    EXPECT_EQ(parent, child);
}

TEST_F(MutationTest, FullProbabilityTouchesEveryWeightWithinMagnitude)
{
    const Genome parent = Genome::constant({ 4, 3, 1 }, 1.0);
    const MutationConfig config{ .perturbationProbability = 1.0, .perturbationMagnitude = 0.5 };

    MutationStats stats;
    const Genome child = mutate(parent, config, rng, &stats);

    EXPECT_EQ(stats.perturbations, static_cast<int>(parent.weights.size()));
    for (size_t i = 0; i < parent.weights.size(); i++) {
        EXPECT_LE(std::abs(child.weights[i] - parent.weights[i]), 0.5);
    }
}

TEST_F(MutationTest, DefaultProbabilityPerturbsAboutAQuarter)
{
    const Genome parent = Genome::constant({ 20, 50, 1 }, 0.0);
    const MutationConfig config;

    MutationStats stats;
    mutate(parent, config, rng, &stats);

    const double fraction =
        static_cast<double>(stats.perturbations) / static_cast<double>(parent.weights.size());
    EXPECT_NEAR(fraction, 0.25, 0.05);
}

TEST_F(MutationTest, ParentIsUntouched)
{
    const Genome parent = Genome::constant({ 4, 1 }, 0.3);
    const Genome copy = parent;

    mutate(parent, MutationConfig{ .perturbationProbability = 1.0 }, rng);

    EXPECT_EQ(parent, copy);
}

TEST_F(MutationTest, PreservesShape)
{
    const Genome parent = Genome::random({ 4, 6, 1 }, rng);

    const Genome child = mutate(parent, MutationConfig{}, rng);

    EXPECT_EQ(child.layerWidths, parent.layerWidths);
    EXPECT_EQ(child.weights.size(), parent.weights.size());
}
