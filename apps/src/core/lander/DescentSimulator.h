#pragma once

#include "BurnController.h"
#include "LanderConstants.h"
#include "LanderState.h"
#include "LandingOutcome.h"

#include <cstdint>

namespace LanderSim {

/**
 * Closed-form powered descent, after Storer's 1969 LUNAR (with the corrected
 * zero-velocity formula).
 *
 * A burn rate is requested once per turn and held constant. Within a turn the state is
 * advanced in variable-length sub-steps using a fifth-order series of the rocket equation,
 * so there is no fixed integration step. Sub-steps end at the turn boundary, when the
 * propellant runs out, when the surface would be crossed, or exactly when the downward
 * speed reaches zero.
 *
 * Phases:
 *   AwaitingBurnDecision -> Burning -> (AwaitingBurnDecision | FinalApproach | FuelOut)
 *   FinalApproach -> Landed (no further burn decisions, last rate held to the surface)
 *   FuelOut -> Landed (ballistic free fall)
 */
class DescentSimulator {
public:
    enum class Phase : uint8_t {
        AwaitingBurnDecision,
        Burning,
        FinalApproach,
        FuelOut,
        Landed,
    };

    explicit DescentSimulator(const LanderConstants& constants);

    // Back to orbital insertion: full tank, fixed altitude and speed, t = 0.
    void reset();

    // Runs until the lander is on the surface. Calling again after landing returns the
    // same outcome without asking the controller for anything.
    const DescentOutcome& run(BurnController& controller);

    // Advances one phase transition. Returns false once landed.
    bool step(BurnController& controller);

    const LanderState& getState() const { return state_; }
    const LanderConstants& getConstants() const { return constants_; }
    Phase getPhase() const { return phase_; }
    bool isLanded() const { return phase_ == Phase::Landed; }
    double getBurnRate() const { return burnRate_; }

    // Valid once isLanded().
    const DescentOutcome& getOutcome() const { return outcome_; }

private:
    struct Candidate {
        double altitudeMiles = 0.0;
        double downwardSpeedMilesPerSec = 0.0;
    };

    void requestBurnDecision(BurnController& controller);
    Phase advanceWithinTurn();
    void runFinalApproach();
    void runFuelOut();
    void fallFreelyToSurface();
    void land(TerminalBranch branch);

    Candidate integrate(double substepSec) const;
    void commit(double substepSec, const Candidate& candidate);

    double limitSubstepToFuel(double substepSec) const;
    double timeToZeroVelocity() const;
    double timeToSurfaceUnderCurrentBurn() const;
    double fuelRemaining() const { return state_.fuelRemainingLbs(constants_); }

    LanderConstants constants_;
    LanderState state_;
    Phase phase_ = Phase::AwaitingBurnDecision;
    double burnRate_ = 0.0;
    DescentOutcome outcome_;
};

const char* toString(DescentSimulator::Phase phase);

} // namespace LanderSim
