#pragma once

#include "LanderConstants.h"

namespace LanderSim {

// Manual path: 0 or [minBurn, maxBurn]. Anything else (negative, between 0 and minBurn,
// above maxBurn, NaN) is rejected and the caller re-prompts.
bool isValidManualBurnRate(double burnRate, const LanderConstants& constants);

// Policy path: values below minBurn become 0 (the engine cannot fire that low), values
// above maxBurn become maxBurn. Never rejects.
double clampPolicyBurnRate(double burnRate, const LanderConstants& constants);

} // namespace LanderSim
