#pragma once

#include "LanderConstants.h"

namespace LanderSim {

/**
 * Kinematic state of one lander. Owned by a single DescentSimulator and only mutated
 * while that simulator processes its own turns.
 */
struct LanderState {
    double altitudeMiles = 0.0;
    double downwardSpeedMilesPerSec = 0.0; // Positive = descending.
    double totalMassLbs = 0.0;             // Propellant + dry mass.
    double elapsedTimeSec = 0.0;
    double timeRemainingInTurnSec = 0.0;

    double fuelRemainingLbs(const LanderConstants& constants) const
    {
        return totalMassLbs - constants.dryMassLbs;
    }

    static LanderState initial(const LanderConstants& constants)
    {
        return LanderState{
            .altitudeMiles = constants.initialAltitudeMiles,
            .downwardSpeedMilesPerSec = constants.initialDownwardSpeedMilesPerSec,
            .totalMassLbs = constants.dryMassLbs + constants.fullTankFuelLbs,
            .elapsedTimeSec = 0.0,
            .timeRemainingInTurnSec = 0.0,
        };
    }
};

} // namespace LanderSim
