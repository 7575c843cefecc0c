#include "core/lander/BurnRate.h"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace LanderSim;

class BurnRateTest : public ::testing::Test {
protected:
    LanderConstants constants;
};

TEST_F(BurnRateTest, ManualValidatorAcceptsZeroAndBounds)
{
    EXPECT_TRUE(isValidManualBurnRate(0.0, constants));
    EXPECT_TRUE(isValidManualBurnRate(8.0, constants));
    EXPECT_TRUE(isValidManualBurnRate(200.0, constants));
    EXPECT_TRUE(isValidManualBurnRate(125.5, constants));
}

TEST_F(BurnRateTest, ManualValidatorRejectsEverythingElse)
{
    EXPECT_FALSE(isValidManualBurnRate(-1.0, constants));
    EXPECT_FALSE(isValidManualBurnRate(0.5, constants));
    EXPECT_FALSE(isValidManualBurnRate(7.999, constants));
    EXPECT_FALSE(isValidManualBurnRate(200.001, constants));
    EXPECT_FALSE(isValidManualBurnRate(std::numeric_limits<double>::quiet_NaN(), constants));
    EXPECT_FALSE(isValidManualBurnRate(std::numeric_limits<double>::infinity(), constants));
}

TEST_F(BurnRateTest, PolicyOutputBelowMinimumShutsEngineOff)
{
    // Raw network output 0.03 scales to 6 lbs/sec.
    EXPECT_DOUBLE_EQ(clampPolicyBurnRate(0.03 * 200.0, constants), 0.0);
    EXPECT_DOUBLE_EQ(clampPolicyBurnRate(-150.0, constants), 0.0);
}

TEST_F(BurnRateTest, PolicyOutputWithinBoundsPassesThrough)
{
    EXPECT_DOUBLE_EQ(clampPolicyBurnRate(0.5 * 200.0, constants), 100.0);
    EXPECT_DOUBLE_EQ(clampPolicyBurnRate(8.0, constants), 8.0);
    EXPECT_DOUBLE_EQ(clampPolicyBurnRate(200.0, constants), 200.0);
}

TEST_F(BurnRateTest, PolicyOutputAboveMaximumClampsToMaximum)
{
    EXPECT_DOUBLE_EQ(clampPolicyBurnRate(1.2 * 200.0, constants), 200.0);
}

TEST_F(BurnRateTest, PolicyNaNShutsEngineOff)
{
    EXPECT_DOUBLE_EQ(
        clampPolicyBurnRate(std::numeric_limits<double>::quiet_NaN(), constants), 0.0);
}
