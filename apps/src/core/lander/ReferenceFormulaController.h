#pragma once

#include "BurnController.h"
#include "core/Result.h"

#include <string>

namespace LanderSim {

/**
 * Burn law extracted from a network trained for a 48 mile suicide burn:
 *
 *   K = 200 * tanh(0.6117 * alt/150 + 0.88195 * v + 0.8117 * fuel/fullTank
 *                  + 0.52975 * t/200 + 0.48855)
 *
 * It lands at about 0.41 mph with roughly 631 lbs of fuel left. The coefficients only hold
 * for that burn altitude, so any other altitude is refused.
 */
class ReferenceFormulaController : public BurnController {
public:
    static constexpr double kTrainedBurnAltitudeMiles = 48.0;

    static Result<ReferenceFormulaController, std::string> create(
        const LanderConstants& constants, double minimumBurnAltitudeMiles);

    double decideBurnRate(const LanderState& state) override;

private:
    explicit ReferenceFormulaController(const LanderConstants& constants);

    LanderConstants constants_;
};

} // namespace LanderSim
