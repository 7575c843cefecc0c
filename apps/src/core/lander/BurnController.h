#pragma once

#include "LanderState.h"

namespace LanderSim {

/**
 * Abstract interface for the burn-rate decision.
 *
 * The simulator asks once per turn. Implementations return the propellant burn rate in
 * lbs/sec to hold for the whole turn; the value must already be legal (0 or within the
 * engine's [minBurn, maxBurn] range).
 */
class BurnController {
public:
    virtual ~BurnController() = default;

    virtual double decideBurnRate(const LanderState& state) = 0;
};

} // namespace LanderSim
