#pragma once

#include "core/ReflectSerializer.h"
#include <nlohmann/json.hpp>

namespace LanderSim {

/**
 * Shape of the policy network and when it is allowed to fire the engine.
 */
struct PolicyConfig {
    // Observation channels fed to the network. At least one must be enabled.
    bool altitudeInput = true;
    bool downwardSpeedInput = true;
    bool fuelRemainingInput = true;
    bool elapsedTimeInput = true;

    int hiddenNeurons = 0; // 0 = inputs feed the output neuron directly.

    // Above this altitude the engine stays off and the network is not consulted.
    // 48 is the "suicide burn": no margin for error at all.
    double minimumBurnAltitudeMiles = 48.0;
};

inline void to_json(nlohmann::json& j, const PolicyConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, PolicyConfig& config)
{
    config = ReflectSerializer::from_json<PolicyConfig>(j);
}

} // namespace LanderSim
