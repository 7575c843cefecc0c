#include "DescentSimulator.h"
#include "BurnRate.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>

namespace LanderSim {

namespace {
// Bounds on the inner loops. Both converge in a handful of iterations; the caps only
// matter for pathological constants.
constexpr int kMaxCorrectionsPerTurn = 64;
constexpr int kMaxFinalApproachSubsteps = 1000;
} // namespace

const char* toString(DescentSimulator::Phase phase)
{
    switch (phase) {
        case DescentSimulator::Phase::AwaitingBurnDecision:
            return "AwaitingBurnDecision";
        case DescentSimulator::Phase::Burning:
            return "Burning";
        case DescentSimulator::Phase::FinalApproach:
            return "FinalApproach";
        case DescentSimulator::Phase::FuelOut:
            return "FuelOut";
        case DescentSimulator::Phase::Landed:
            return "Landed";
    }
    return "";
}

DescentSimulator::DescentSimulator(const LanderConstants& constants) : constants_(constants)
{
    auto valid = validateLanderConstants(constants_);
    LANDERSIM_ASSERT(valid.isValue(), "DescentSimulator constructed with invalid constants");
    reset();
}

void DescentSimulator::reset()
{
    state_ = LanderState::initial(constants_);
    phase_ = Phase::AwaitingBurnDecision;
    burnRate_ = 0.0;
    outcome_ = DescentOutcome{};
}

const DescentOutcome& DescentSimulator::run(BurnController& controller)
{
    while (step(controller)) {}
    return outcome_;
}

bool DescentSimulator::step(BurnController& controller)
{
    switch (phase_) {
        case Phase::AwaitingBurnDecision:
            requestBurnDecision(controller);
            phase_ = Phase::Burning;
            break;
        case Phase::Burning:
            phase_ = advanceWithinTurn();
            break;
        case Phase::FinalApproach:
            runFinalApproach();
            break;
        case Phase::FuelOut:
            runFuelOut();
            break;
        case Phase::Landed:
            return false;
    }
    return phase_ != Phase::Landed;
}

void DescentSimulator::requestBurnDecision(BurnController& controller)
{
    double rate = controller.decideBurnRate(state_);
    if (!isValidManualBurnRate(rate, constants_)) {
        LOG_WARN(Controls, "Controller returned illegal burn rate {}, clamping", rate);
        rate = clampPolicyBurnRate(rate, constants_);
    }
    burnRate_ = rate;

    if (fuelRemaining() > constants_.epsilon) {
        outcome_.burnHistory.push_back(burnRate_);
    }

    state_.timeRemainingInTurnSec = constants_.turnLengthSec;
}

DescentSimulator::Phase DescentSimulator::advanceWithinTurn()
{
    int corrections = 0;

    while (true) {
        if (fuelRemaining() < constants_.epsilon) {
            return Phase::FuelOut;
        }
        if (state_.timeRemainingInTurnSec < constants_.epsilon) {
            return Phase::AwaitingBurnDecision;
        }

        double substep = limitSubstepToFuel(state_.timeRemainingInTurnSec);
        Candidate candidate = integrate(substep);

        if (candidate.altitudeMiles <= 0.0) {
            return Phase::FinalApproach;
        }

        const bool reversesDirection =
            state_.downwardSpeedMilesPerSec > 0.0 && candidate.downwardSpeedMilesPerSec < 0.0;

        if (reversesDirection && corrections < kMaxCorrectionsPerTurn) {
            // Thrust would carry the lander past hover into a climb. Stop the sub-step at
            // the instant the downward speed reaches zero instead.
            const double toZero = limitSubstepToFuel(timeToZeroVelocity());
            if (std::isfinite(toZero) && toZero > 0.0) {
                substep = toZero;
                candidate = integrate(substep);
                corrections++;
                outcome_.velocityReversalCorrections++;

                if (candidate.altitudeMiles <= 0.0) {
                    return Phase::FinalApproach;
                }
            }
        }

        commit(substep, candidate);
    }
}

void DescentSimulator::runFinalApproach()
{
    // Below this point no further burn decisions are requested; the last commanded rate
    // is held to the surface.
    int substeps = 0;
    while (state_.altitudeMiles > 0.0) {
        if (burnRate_ > 0.0 && fuelRemaining() < constants_.epsilon) {
            runFuelOut();
            return;
        }

        double substep = timeToSurfaceUnderCurrentBurn();
        if (!std::isfinite(substep) || substep <= 0.0 || substeps >= kMaxFinalApproachSubsteps) {
            fallFreelyToSurface();
            break;
        }
        if (burnRate_ > 0.0) {
            substep = limitSubstepToFuel(substep);
        }

        commit(substep, integrate(substep));
        substeps++;
    }

    land(burnRate_ > 0.0 ? TerminalBranch::FinalApproach : TerminalBranch::FreeFall);
}

void DescentSimulator::runFuelOut()
{
    outcome_.fuelOutTimeSec = state_.elapsedTimeSec;
    LOG_DEBUG(Physics, "Fuel out at {:.2f} secs", state_.elapsedTimeSec);

    burnRate_ = 0.0;
    fallFreelyToSurface();
    land(TerminalBranch::BallisticFuelOut);
}

void DescentSimulator::fallFreelyToSurface()
{
    const double g = constants_.gravity;
    const double v = state_.downwardSpeedMilesPerSec;
    const double a = std::max(0.0, state_.altitudeMiles);

    const double timeToImpact = (std::sqrt(v * v + 2.0 * a * g) - v) / g;
    state_.downwardSpeedMilesPerSec += g * timeToImpact;
    state_.elapsedTimeSec += timeToImpact;
    state_.altitudeMiles = 0.0;
}

void DescentSimulator::land(TerminalBranch branch)
{
    state_.altitudeMiles = 0.0;

    outcome_.impactSpeedMph = state_.downwardSpeedMilesPerSec * constants_.milesPerSecToMph;
    outcome_.fuelRemainingLbs = fuelRemaining();
    outcome_.elapsedTimeSec = state_.elapsedTimeSec;
    outcome_.terminalBranch = branch;

    phase_ = Phase::Landed;

    LOG_TRACE(
        Physics,
        "On the moon at {:.6f} secs, impact {:.6f} mph, fuel {:.6f} lbs ({})",
        outcome_.elapsedTimeSec,
        outcome_.impactSpeedMph,
        outcome_.fuelRemainingLbs,
        toString(branch));
}

DescentSimulator::Candidate DescentSimulator::integrate(double substepSec) const
{
    const double s = substepSec;
    const double g = constants_.gravity;
    const double z = constants_.thrustPerPoundOfFuel;
    const double v = state_.downwardSpeedMilesPerSec;

    // Fraction of the current mass burned during the sub-step.
    const double q = s * burnRate_ / state_.totalMassLbs;
    const double q2 = q * q;
    const double q3 = q2 * q;
    const double q4 = q3 * q;
    const double q5 = q4 * q;

    Candidate candidate;
    candidate.downwardSpeedMilesPerSec =
        v + g * s + z * (-q - q2 / 2.0 - q3 / 3.0 - q4 / 4.0 - q5 / 5.0);
    candidate.altitudeMiles = state_.altitudeMiles - g * s * s / 2.0 - v * s
        + z * s * (q / 2.0 + q2 / 6.0 + q3 / 12.0 + q4 / 20.0 + q5 / 30.0);
    return candidate;
}

void DescentSimulator::commit(double substepSec, const Candidate& candidate)
{
    state_.elapsedTimeSec += substepSec;
    state_.timeRemainingInTurnSec -= substepSec;
    state_.totalMassLbs -= substepSec * burnRate_;
    state_.altitudeMiles = candidate.altitudeMiles;
    state_.downwardSpeedMilesPerSec = candidate.downwardSpeedMilesPerSec;
}

double DescentSimulator::limitSubstepToFuel(double substepSec) const
{
    if (burnRate_ <= 0.0) {
        return substepSec;
    }
    const double fuel = fuelRemaining();
    if (substepSec * burnRate_ > fuel) {
        return fuel / burnRate_;
    }
    return substepSec;
}

double DescentSimulator::timeToZeroVelocity() const
{
    const double m = state_.totalMassLbs;
    const double v = state_.downwardSpeedMilesPerSec;
    const double z = constants_.thrustPerPoundOfFuel;
    const double zk = z * burnRate_;

    // The 1969 listing had V/Z under the root; the first-order expansion gives V/(2Z).
    const double w = (1.0 - m * constants_.gravity / zk) / 2.0;
    return m * v / (zk * (w + std::sqrt(w * w + v / (2.0 * z))));
}

double DescentSimulator::timeToSurfaceUnderCurrentBurn() const
{
    const double a = state_.altitudeMiles;
    const double v = state_.downwardSpeedMilesPerSec;
    const double netAccel =
        constants_.gravity - constants_.thrustPerPoundOfFuel * burnRate_ / state_.totalMassLbs;

    // Negative discriminant means constant deceleration would stop short of the surface;
    // treat it as touching down at zero relative speed.
    const double discriminant = std::max(0.0, v * v + 2.0 * a * netAccel);
    return 2.0 * a / (v + std::sqrt(discriminant));
}

} // namespace LanderSim
