#pragma once

#include "core/brains/PolicyNetwork.h"
#include "core/lander/DescentSimulator.h"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace LanderSim {

/**
 * One arena slot in the training population. The id is the slot index and never changes;
 * breeding overwrites the network's weights in place.
 */
struct PopulationMember {
    PopulationMember(int memberId, PolicyNetwork policy, const LanderConstants& constants)
        : id(memberId), network(std::move(policy)), simulator(constants)
    {}

    int id = 0;
    PolicyNetwork network;
    DescentSimulator simulator;

    // Empty until this generation's descent has been evaluated.
    std::optional<int64_t> score;
    double impactSpeedMph = 0.0;
    double fuelRemainingLbs = 0.0;
    std::vector<double> burnHistory;
};

} // namespace LanderSim
