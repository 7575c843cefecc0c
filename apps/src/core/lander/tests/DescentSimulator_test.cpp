#include "core/lander/BurnRate.h"
#include "core/lander/DescentSimulator.h"
#include "core/lander/ReferenceFormulaController.h"
#include "core/lander/ScheduledBurnController.h"
#include "core/tests/LogCaptureTestUtils.h"

#include <cmath>
#include <functional>
#include <gtest/gtest.h>
#include <utility>

using namespace LanderSim;

namespace {

class FunctionBurnController : public BurnController {
public:
    explicit FunctionBurnController(std::function<double(const LanderState&)> decide)
        : decide_(std::move(decide))
    {}

    double decideBurnRate(const LanderState& state) override
    {
        decisions++;
        return decide_(state);
    }

    int decisions = 0;

private:
    std::function<double(const LanderState&)> decide_;
};

ReferenceFormulaController makeReferenceController(const LanderConstants& constants)
{
    auto created = ReferenceFormulaController::create(constants, 48.0);
    EXPECT_TRUE(created.isValue());
    return std::move(created).value();
}

} // namespace

class DescentSimulatorTest : public ::testing::Test {
protected:
    LanderConstants constants;
};

TEST_F(DescentSimulatorTest, StartsAtOrbitalInsertion)
{
    DescentSimulator sim(constants);

    EXPECT_DOUBLE_EQ(sim.getState().altitudeMiles, 120.0);
    EXPECT_DOUBLE_EQ(sim.getState().downwardSpeedMilesPerSec, 1.0);
    EXPECT_DOUBLE_EQ(sim.getState().totalMassLbs, 32500.0);
    EXPECT_DOUBLE_EQ(sim.getState().elapsedTimeSec, 0.0);
    EXPECT_EQ(sim.getPhase(), DescentSimulator::Phase::AwaitingBurnDecision);
}

TEST_F(DescentSimulatorTest, ZeroBurnFallsFreelyWithoutCorrections)
{
    DescentSimulator sim(constants);
    FunctionBurnController controller([](const LanderState&) { return 0.0; });

    const DescentOutcome& outcome = sim.run(controller);

    EXPECT_TRUE(sim.isLanded());
    EXPECT_EQ(outcome.terminalBranch, TerminalBranch::FreeFall);
    EXPECT_EQ(outcome.velocityReversalCorrections, 0);
    EXPECT_FALSE(outcome.fuelOutTimeSec.has_value());
    EXPECT_DOUBLE_EQ(sim.getState().altitudeMiles, 0.0);
    EXPECT_GT(outcome.elapsedTimeSec, 0.0);
    EXPECT_GT(outcome.impactSpeedMph, 0.0);
    EXPECT_NEAR(outcome.elapsedTimeSec, 113.5528726, 1e-6);
    EXPECT_NEAR(outcome.impactSpeedMph, 4008.790341, 1e-5);
    EXPECT_DOUBLE_EQ(outcome.fuelRemainingLbs, 16000.0);
    EXPECT_EQ(outcome.burnHistory.size(), 12u);
    EXPECT_EQ(outcome.rating(), LandingRating::Fatal);
}

TEST_F(DescentSimulatorTest, ReferenceFormulaLandsPerfectly)
{
    DescentSimulator sim(constants);
    auto controller = makeReferenceController(constants);

    const DescentOutcome& outcome = sim.run(controller);

    EXPECT_EQ(outcome.terminalBranch, TerminalBranch::FinalApproach);
    EXPECT_NEAR(outcome.impactSpeedMph, 0.41488576, 1e-6);
    EXPECT_NEAR(outcome.fuelRemainingLbs, 631.4682734, 1e-5);
    EXPECT_NEAR(outcome.elapsedTimeSec, 152.6962512, 1e-6);
    EXPECT_EQ(outcome.velocityReversalCorrections, 1);
    EXPECT_EQ(outcome.rating(), LandingRating::Perfect);

    // Engine off above 48 miles for the first seven turns, then a tapering burn.
    ASSERT_EQ(outcome.burnHistory.size(), 16u);
    for (size_t i = 0; i < 7; i++) {
        EXPECT_DOUBLE_EQ(outcome.burnHistory[i], 0.0);
    }
    EXPECT_NEAR(outcome.burnHistory[7], 197.9047003, 1e-6);
    EXPECT_NEAR(outcome.burnHistory[15], 150.0402154, 1e-6);
}

TEST_F(DescentSimulatorTest, BurnHistoryReplaysTheSameLanding)
{
    DescentSimulator recorder(constants);
    auto reference = makeReferenceController(constants);
    const DescentOutcome first = recorder.run(reference);

    DescentSimulator replay(constants);
    ScheduledBurnController scheduled(first.burnHistory);
    const DescentOutcome& second = replay.run(scheduled);

    EXPECT_DOUBLE_EQ(second.impactSpeedMph, first.impactSpeedMph);
    EXPECT_DOUBLE_EQ(second.fuelRemainingLbs, first.fuelRemainingLbs);
    EXPECT_DOUBLE_EQ(second.elapsedTimeSec, first.elapsedTimeSec);
}

TEST_F(DescentSimulatorTest, IdenticalControllersGiveBitIdenticalOutcomes)
{
    DescentSimulator a(constants);
    DescentSimulator b(constants);
    auto controllerA = makeReferenceController(constants);
    auto controllerB = makeReferenceController(constants);

    const DescentOutcome& first = a.run(controllerA);
    const DescentOutcome& second = b.run(controllerB);

    EXPECT_EQ(first.impactSpeedMph, second.impactSpeedMph);
    EXPECT_EQ(first.fuelRemainingLbs, second.fuelRemainingLbs);
    EXPECT_EQ(first.elapsedTimeSec, second.elapsedTimeSec);
    EXPECT_EQ(first.burnHistory, second.burnHistory);
}

TEST_F(DescentSimulatorTest, ResetAllowsAnIdenticalSecondRun)
{
    DescentSimulator sim(constants);
    auto controller = makeReferenceController(constants);

    const DescentOutcome first = sim.run(controller);
    sim.reset();
    EXPECT_EQ(sim.getPhase(), DescentSimulator::Phase::AwaitingBurnDecision);
    EXPECT_TRUE(sim.getOutcome().burnHistory.empty());

    const DescentOutcome& second = sim.run(controller);
    EXPECT_EQ(first.impactSpeedMph, second.impactSpeedMph);
    EXPECT_EQ(first.burnHistory, second.burnHistory);
}

TEST_F(DescentSimulatorTest, ConstantMaximumBurnRunsOutOfFuel)
{
    DescentSimulator sim(constants);
    FunctionBurnController controller([](const LanderState&) { return 200.0; });

    const DescentOutcome& outcome = sim.run(controller);

    EXPECT_EQ(outcome.terminalBranch, TerminalBranch::BallisticFuelOut);
    ASSERT_TRUE(outcome.fuelOutTimeSec.has_value());
    EXPECT_NEAR(*outcome.fuelOutTimeSec, 80.0, 1e-9);
    EXPECT_NEAR(outcome.fuelRemainingLbs, 0.0, constants.epsilon);
    EXPECT_NEAR(outcome.impactSpeedMph, 1527.014967, 1e-4);
    EXPECT_NEAR(outcome.elapsedTimeSec, 644.3535458, 1e-5);
}

TEST_F(DescentSimulatorTest, FullBurnFromMinimumAltitudeStillCrashes)
{
    DescentSimulator sim(constants);
    FunctionBurnController controller(
        [](const LanderState& state) { return state.altitudeMiles > 48.0 ? 0.0 : 200.0; });

    const DescentOutcome& outcome = sim.run(controller);

    EXPECT_EQ(outcome.terminalBranch, TerminalBranch::BallisticFuelOut);
    EXPECT_NEAR(outcome.impactSpeedMph, 343.3296362, 1e-4);
}

TEST_F(DescentSimulatorTest, MassNeverDropsBelowDryMass)
{
    const std::vector<std::function<double(const LanderState&)>> policies = {
        [](const LanderState&) { return 200.0; },
        [](const LanderState& s) { return s.altitudeMiles > 48.0 ? 0.0 : 200.0; },
        [](const LanderState& s) { return s.downwardSpeedMilesPerSec > 0.2 ? 200.0 : 8.0; },
        [](const LanderState& s) { return std::fmod(s.elapsedTimeSec, 30.0) < 10.0 ? 0.0 : 150.0; },
    };

    for (const auto& policy : policies) {
        DescentSimulator sim(constants);
        FunctionBurnController controller(policy);

        while (sim.step(controller)) {
            const double fuel = sim.getState().fuelRemainingLbs(constants);
            ASSERT_GE(fuel, -constants.epsilon);
            ASSERT_GE(sim.getState().altitudeMiles, 0.0);
        }
        EXPECT_TRUE(sim.isLanded());
        EXPECT_GE(sim.getOutcome().fuelRemainingLbs, -constants.epsilon);
    }
}

TEST_F(DescentSimulatorTest, IllegalControllerOutputIsClamped)
{
    DescentSimulator sim(constants);
    FunctionBurnController controller([](const LanderState&) { return 500.0; });

    ASSERT_TRUE(sim.step(controller));
    EXPECT_DOUBLE_EQ(sim.getBurnRate(), 200.0);

    DescentSimulator lowSim(constants);
    FunctionBurnController lowController([](const LanderState&) { return 3.0; });
    ASSERT_TRUE(lowSim.step(lowController));
    EXPECT_DOUBLE_EQ(lowSim.getBurnRate(), 0.0);
}

TEST_F(DescentSimulatorTest, LandedSimulatorStopsAskingForDecisions)
{
    DescentSimulator sim(constants);
    FunctionBurnController controller([](const LanderState&) { return 0.0; });

    sim.run(controller);
    const int decisions = controller.decisions;

    EXPECT_FALSE(sim.step(controller));
    sim.run(controller);
    EXPECT_EQ(controller.decisions, decisions);
}

TEST_F(DescentSimulatorTest, OneDecisionPerTurn)
{
    DescentSimulator sim(constants);
    FunctionBurnController controller([](const LanderState&) { return 0.0; });

    const DescentOutcome& outcome = sim.run(controller);

    EXPECT_EQ(controller.decisions, static_cast<int>(outcome.burnHistory.size()));
    EXPECT_EQ(controller.decisions, static_cast<int>(std::ceil(outcome.elapsedTimeSec / 10.0)));
}

TEST_F(DescentSimulatorTest, FuelOutAndTouchdownAreTracedOnPhysicsChannel)
{
    Test::ChannelLogCapture capture(LogChannel::Physics, spdlog::level::trace);
    FunctionBurnController fullBurn([](const LanderState&) { return 200.0; });
    DescentSimulator sim(constants);

    sim.run(fullBurn);

    const std::string text = capture.text();
    EXPECT_NE(text.find("Fuel out at"), std::string::npos) << text;
    EXPECT_NE(text.find("On the moon at"), std::string::npos) << text;
    EXPECT_NE(text.find("(BallisticFuelOut)"), std::string::npos) << text;
}
