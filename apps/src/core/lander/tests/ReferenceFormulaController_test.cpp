#include "core/lander/LanderState.h"
#include "core/lander/ReferenceFormulaController.h"

#include <gtest/gtest.h>
#include <utility>

using namespace LanderSim;

TEST(ReferenceFormulaControllerTest, OnlyValidForFortyEightMileBurn)
{
    const LanderConstants constants;

    EXPECT_TRUE(ReferenceFormulaController::create(constants, 48.0).isValue());
    EXPECT_TRUE(ReferenceFormulaController::create(constants, 60.0).isError());
    EXPECT_TRUE(ReferenceFormulaController::create(constants, 40.0).isError());
}

TEST(ReferenceFormulaControllerTest, EngineOffAboveBurnAltitude)
{
    const LanderConstants constants;
    auto controller = std::move(ReferenceFormulaController::create(constants, 48.0)).value();

    LanderState state = LanderState::initial(constants);
    EXPECT_DOUBLE_EQ(controller.decideBurnRate(state), 0.0);

    state.altitudeMiles = 48.5;
    EXPECT_DOUBLE_EQ(controller.decideBurnRate(state), 0.0);
}

TEST(ReferenceFormulaControllerTest, BurnsHardJustBelowBurnAltitude)
{
    const LanderConstants constants;
    auto controller = std::move(ReferenceFormulaController::create(constants, 48.0)).value();

    LanderState state = LanderState::initial(constants);
    state.altitudeMiles = 40.0;
    state.downwardSpeedMilesPerSec = 1.5;
    state.elapsedTimeSec = 70.0;

    const double burn = controller.decideBurnRate(state);
    EXPECT_GT(burn, 190.0);
    EXPECT_LE(burn, 200.0);
}
