#include "ReferenceFormulaController.h"
#include "BurnRate.h"

#include <cmath>

namespace LanderSim {

ReferenceFormulaController::ReferenceFormulaController(const LanderConstants& constants)
    : constants_(constants)
{}

Result<ReferenceFormulaController, std::string> ReferenceFormulaController::create(
    const LanderConstants& constants, double minimumBurnAltitudeMiles)
{
    if (minimumBurnAltitudeMiles != kTrainedBurnAltitudeMiles) {
        return Result<ReferenceFormulaController, std::string>::error(
            "reference formula was trained for a minimum burn altitude of 48 miles");
    }
    return Result<ReferenceFormulaController, std::string>::okay(
        ReferenceFormulaController(constants));
}

double ReferenceFormulaController::decideBurnRate(const LanderState& state)
{
    if (state.altitudeMiles > kTrainedBurnAltitudeMiles) {
        return 0.0;
    }

    const double altitude = state.altitudeMiles / 150.0;
    const double speed = state.downwardSpeedMilesPerSec;
    const double fuel = state.fuelRemainingLbs(constants_) / constants_.fullTankFuelLbs;
    const double time = state.elapsedTimeSec / 200.0;

    const double burn = constants_.maxBurnRateLbsPerSec
        * std::tanh(0.6117000070225913 * altitude + 0.8819500360259553 * speed
                    + 0.8117000050842762 * fuel + 0.5297500137239695 * time
                    + 0.48855000972980633);

    return clampPolicyBurnRate(burn, constants_);
}

} // namespace LanderSim
