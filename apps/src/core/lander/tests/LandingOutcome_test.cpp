#include "core/lander/LandingOutcome.h"

#include <cstdint>
#include <gtest/gtest.h>
#include <limits>

using namespace LanderSim;

TEST(LandingRatingTest, ThresholdsAreInclusiveOnTheSofterCategory)
{
    EXPECT_EQ(rateLanding(0.0), LandingRating::Perfect);
    EXPECT_EQ(rateLanding(1.0), LandingRating::Perfect);
    EXPECT_EQ(rateLanding(1.01), LandingRating::Good);
    EXPECT_EQ(rateLanding(10.0), LandingRating::Good);
    EXPECT_EQ(rateLanding(22.0), LandingRating::Poor);
    EXPECT_EQ(rateLanding(40.0), LandingRating::Damaged);
    EXPECT_EQ(rateLanding(60.0), LandingRating::CrashSurvivable);
    EXPECT_EQ(rateLanding(60.01), LandingRating::Fatal);
}

TEST(LandingRatingTest, FatalDescriptionReportsCraterDepth)
{
    EXPECT_EQ(describeLanding(5.0), "GOOD LANDING-(COULD BE BETTER)");

    const std::string fatal = describeLanding(100.0);
    EXPECT_NE(fatal.find("NO SURVIVORS"), std::string::npos);
    EXPECT_NE(
        fatal.find("IN FACT YOU BLASTED A NEW LUNAR CRATER    27.78 FT. DEEP"), std::string::npos);
}

TEST(FitnessScoreTest, SoftLandingEarnsFuelBonus)
{
    const ScoringConfig config;

    // (40 - 0.41488576) * 100000 + trunc(631.468 / 16000 * 100).
    EXPECT_EQ(computeFitnessScore(0.41488576, 631.46827341, 16000.0, config), 3958514);
}

TEST(FitnessScoreTest, CrashWithFuelLeftIsPenalizedNotRewarded)
{
    const ScoringConfig config;

    const int64_t emptyTank = computeFitnessScore(100.0, 0.0, 16000.0, config);
    const int64_t fullTank = computeFitnessScore(100.0, 16000.0, 16000.0, config);

    EXPECT_EQ(emptyTank, -6000000);
    EXPECT_EQ(fullTank, -6000100);
    EXPECT_LT(fullTank, emptyTank);
}

TEST(FitnessScoreTest, ZeroBaseScoreCountsAsCrash)
{
    const ScoringConfig config;

    EXPECT_EQ(computeFitnessScore(40.0, 8000.0, 16000.0, config), -50);
}

TEST(FitnessScoreTest, SafeLandingAlwaysBeatsCrash)
{
    const ScoringConfig config;

    const int64_t barelySafe = computeFitnessScore(39.99, 0.0, 16000.0, config);
    const int64_t crashFullTank = computeFitnessScore(40.01, 16000.0, 16000.0, config);

    EXPECT_GT(barelySafe, crashFullTank);
}

TEST(FitnessScoreTest, AcceptableImpactFloorsTheSpeed)
{
    ScoringConfig config;
    config.acceptableImpactMph = 1.0;

    EXPECT_EQ(
        computeFitnessScore(0.2, 0.0, 16000.0, config),
        computeFitnessScore(1.0, 0.0, 16000.0, config));
}

TEST(FitnessScoreTest, NonFiniteImpactScoresLowest)
{
    const ScoringConfig config;

    EXPECT_EQ(
        computeFitnessScore(std::numeric_limits<double>::infinity(), 0.0, 16000.0, config),
        std::numeric_limits<int64_t>::min());
}
