#include "NeuralNetBurnController.h"

#include "core/Assert.h"
#include "core/lander/BurnRate.h"

namespace LanderSim {

NeuralNetBurnController::NeuralNetBurnController(
    const PolicyNetwork& network, const PolicyConfig& policy, const LanderConstants& constants)
    : network_(network),
      layout_(policy, constants),
      constants_(constants),
      minimumBurnAltitudeMiles_(policy.minimumBurnAltitudeMiles)
{
    LANDERSIM_ASSERT(
        layout_.inputCount() == network_.inputCount(),
        "Network input width does not match the enabled observation channels");
}

double NeuralNetBurnController::decideBurnRate(const LanderState& state)
{
    if (state.altitudeMiles > minimumBurnAltitudeMiles_) {
        return 0.0;
    }

    const double intent = network_.evaluate(layout_.buildObservation(state));
    return clampPolicyBurnRate(intent * constants_.maxBurnRateLbsPerSec, constants_);
}

} // namespace LanderSim
