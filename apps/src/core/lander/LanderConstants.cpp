#include "LanderConstants.h"

#include <cmath>

namespace LanderSim {

Result<std::monostate, std::string> validateLanderConstants(const LanderConstants& constants)
{
    using R = Result<std::monostate, std::string>;

    if (!(constants.gravity > 0.0)) {
        return R::error("gravity must be positive");
    }
    if (!(constants.dryMassLbs > 0.0)) {
        return R::error("dry mass must be positive");
    }
    if (!(constants.thrustPerPoundOfFuel > 0.0)) {
        return R::error("thrust per pound of fuel must be positive");
    }
    if (!(constants.fullTankFuelLbs >= 0.0)) {
        return R::error("full tank fuel mass must not be negative");
    }
    if (!(constants.turnLengthSec > 0.0)) {
        return R::error("turn length must be positive");
    }
    if (!(constants.minBurnRateLbsPerSec > 0.0)) {
        return R::error("minimum burn rate must be positive");
    }
    if (!(constants.maxBurnRateLbsPerSec >= constants.minBurnRateLbsPerSec)) {
        return R::error("maximum burn rate must be at least the minimum burn rate");
    }
    if (!(constants.initialAltitudeMiles > 0.0)) {
        return R::error("initial altitude must be positive");
    }
    if (!std::isfinite(constants.initialDownwardSpeedMilesPerSec)) {
        return R::error("initial downward speed must be finite");
    }
    if (!(constants.epsilon > 0.0)) {
        return R::error("epsilon must be positive");
    }

    return R::okay(std::monostate{});
}

} // namespace LanderSim
