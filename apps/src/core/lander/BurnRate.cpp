#include "BurnRate.h"

#include <cmath>

namespace LanderSim {

bool isValidManualBurnRate(double burnRate, const LanderConstants& constants)
{
    if (!std::isfinite(burnRate)) {
        return false;
    }
    if (burnRate == 0.0) {
        return true;
    }
    return burnRate >= constants.minBurnRateLbsPerSec
        && burnRate <= constants.maxBurnRateLbsPerSec;
}

double clampPolicyBurnRate(double burnRate, const LanderConstants& constants)
{
    if (std::isnan(burnRate) || burnRate < constants.minBurnRateLbsPerSec) {
        return 0.0;
    }
    if (burnRate > constants.maxBurnRateLbsPerSec) {
        return constants.maxBurnRateLbsPerSec;
    }
    return burnRate;
}

} // namespace LanderSim
