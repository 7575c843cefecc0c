#pragma once

#include "ObservationLayout.h"
#include "PolicyNetwork.h"
#include "core/lander/BurnController.h"
#include "core/lander/LanderConstants.h"

namespace LanderSim {

/**
 * Burn controller driven by a PolicyNetwork.
 *
 * The engine stays off until the lander drops to the configured minimum burn altitude.
 * Below that the network's output is scaled by the maximum burn rate and clamped into the
 * legal range.
 *
 * Holds a reference to the network; the network must outlive the controller.
 */
class NeuralNetBurnController : public BurnController {
public:
    NeuralNetBurnController(
        const PolicyNetwork& network,
        const PolicyConfig& policy,
        const LanderConstants& constants);

    double decideBurnRate(const LanderState& state) override;

private:
    const PolicyNetwork& network_;
    ObservationLayout layout_;
    LanderConstants constants_;
    double minimumBurnAltitudeMiles_;
};

} // namespace LanderSim
